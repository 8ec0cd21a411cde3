#include <sstream>

#include "datafield/datafield_serialize.hpp"
#include "path_key/path_key.hpp"
#include "utils/error.hpp"

DataField::DataField DataField::Serialize::read_datafield(
    const ItemTree::Object &object, const std::string &path) {
    if (object.name() != "GwyDataField") {
        throw Error::MalformedField(
            path, "expected GwyDataField object, found " + object.name());
    }
    // The getters report the item name only, prefix it with the path of this
    // object.
    Meta meta = {};
    const std::vector<double> *samples = nullptr;
    try {
        meta.xres = ItemTree::get<int32_t>(object, "xres");
        meta.yres = ItemTree::get<int32_t>(object, "yres");
        Metadata::read_all(double_fields, object, &meta);
        Metadata::read_all(unit_fields, object, &meta);
        samples = ItemTree::get_double_array(object, "data");
    } catch (const Error::TypeMismatch &e) {
        throw e.within(path);
    }
    if (!meta.xres) {
        throw Error::MissingRequiredField(PathKey::join(path, "xres"));
    }
    if (!meta.yres) {
        throw Error::MissingRequiredField(PathKey::join(path, "yres"));
    }
    int32_t xres = meta.xres.value();
    int32_t yres = meta.yres.value();
    if (xres <= 0 || yres <= 0) {
        std::ostringstream error_stream;
        error_stream << "invalid resolution (" << xres << ", " << yres << ")";
        throw Error::MalformedField(path, error_stream.str());
    }
    if (samples == nullptr) {
        throw Error::MissingRequiredField(PathKey::join(path, "data"));
    }
    size_t expected_size = static_cast<size_t>(xres) * yres;
    if (samples->size() != expected_size) {
        std::ostringstream error_stream;
        error_stream << "expected " << expected_size << " samples, found "
                     << samples->size();
        throw Error::MalformedField(PathKey::join(path, "data"),
                                    error_stream.str());
    }
    Grid data = Eigen::Map<const Grid>(samples->data(), xres, yres);
    return create(std::move(data), meta);
}

std::unique_ptr<ItemTree::Object> DataField::Serialize::write_datafield(
    const DataField &datafield) {
    auto object = std::make_unique<ItemTree::Object>("GwyDataField");
    ItemTree::insert_item(ItemTree::new_item<int32_t>("xres", xres(datafield)),
                          object.get());
    ItemTree::insert_item(ItemTree::new_item<int32_t>("yres", yres(datafield)),
                          object.get());
    Metadata::write_all(double_fields, datafield, object.get());
    Metadata::write_all(unit_fields, datafield, object.get());
    std::vector<double> samples(datafield.data.data(),
                                datafield.data.data() + datafield.data.size());
    ItemTree::insert_item(
        ItemTree::new_double_array_item("data", std::move(samples)),
        object.get());
    return object;
}
