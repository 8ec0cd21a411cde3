#include <sstream>

#include "graph/graph_curve_serialize.hpp"
#include "path_key/path_key.hpp"
#include "utils/error.hpp"

GraphCurve::GraphCurve GraphCurve::Serialize::read_graph_curve(
    const ItemTree::Object &object, const std::string &path) {
    if (object.name() != "GwyGraphCurveModel") {
        throw Error::MalformedField(
            path, "expected GwyGraphCurveModel object, found " + object.name());
    }
    Meta meta = {};
    const std::vector<double> *xdata = nullptr;
    const std::vector<double> *ydata = nullptr;
    try {
        xdata = ItemTree::get_double_array(object, "xdata");
        ydata = ItemTree::get_double_array(object, "ydata");
        Metadata::read_all(string_fields, object, &meta);
        Metadata::read_all(int_fields, object, &meta);
        Metadata::read_all(double_fields, object, &meta);
    } catch (const Error::TypeMismatch &e) {
        throw e.within(path);
    }
    if (xdata == nullptr) {
        throw Error::MissingRequiredField(PathKey::join(path, "xdata"));
    }
    if (ydata == nullptr) {
        throw Error::MissingRequiredField(PathKey::join(path, "ydata"));
    }
    if (xdata->size() != ydata->size()) {
        std::ostringstream error_stream;
        error_stream << "found " << xdata->size() << " abscissae and "
                     << ydata->size() << " ordinates";
        throw Error::MalformedField(PathKey::join(path, "ydata"),
                                    error_stream.str());
    }
    meta.ndata = static_cast<int32_t>(xdata->size());

    Data data(2, xdata->size());
    for (size_t i = 0; i < xdata->size(); ++i) {
        data(0, i) = (*xdata)[i];
        data(1, i) = (*ydata)[i];
    }
    return create(std::move(data), meta);
}

std::unique_ptr<ItemTree::Object> GraphCurve::Serialize::write_graph_curve(
    const GraphCurve &curve) {
    auto object = std::make_unique<ItemTree::Object>("GwyGraphCurveModel");
    std::vector<double> xdata(curve.data.cols());
    std::vector<double> ydata(curve.data.cols());
    for (Eigen::Index i = 0; i < curve.data.cols(); ++i) {
        xdata[i] = curve.data(0, i);
        ydata[i] = curve.data(1, i);
    }
    ItemTree::insert_item(
        ItemTree::new_double_array_item("xdata", std::move(xdata)),
        object.get());
    ItemTree::insert_item(
        ItemTree::new_double_array_item("ydata", std::move(ydata)),
        object.get());
    Metadata::write_all(string_fields, curve, object.get());
    Metadata::write_all(int_fields, curve, object.get());
    Metadata::write_all(double_fields, curve, object.get());
    return object;
}
