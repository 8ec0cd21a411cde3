#include <sstream>

#include "path_key/path_key.hpp"
#include "selection/selection_serialize.hpp"
#include "utils/error.hpp"

namespace {
template <typename S>
std::optional<S> read_selection(const ItemTree::Object &object,
                                const std::string &path) {
    const Selection::KindInfo &info = Selection::kind_info(S::kind);
    if (object.name() != info.object_name) {
        std::ostringstream error_stream;
        error_stream << "expected " << info.object_name << " object, found "
                     << object.name();
        throw Error::MalformedField(path, error_stream.str());
    }
    const std::vector<double> *coordinates = nullptr;
    try {
        coordinates = ItemTree::get_double_array(object, "data");
    } catch (const Error::TypeMismatch &e) {
        throw e.within(path);
    }
    if (coordinates == nullptr || coordinates->empty()) {
        return std::nullopt;
    }
    size_t values_per_instance = 2 * S::points_per_instance;
    if (coordinates->size() % values_per_instance != 0) {
        std::ostringstream error_stream;
        error_stream << "coordinate count " << coordinates->size()
                     << " is not a multiple of " << values_per_instance;
        throw Error::MalformedField(PathKey::join(path, "data"),
                                    error_stream.str());
    }
    auto points = Selection::to_points(*coordinates);
    if constexpr (S::points_per_instance == 1) {
        return S(std::move(points));
    } else {
        return S(Selection::to_pairs(points));
    }
}

template <typename S>
std::unique_ptr<ItemTree::Object> write_selection_object(const S &selection) {
    const Selection::KindInfo &info = Selection::kind_info(S::kind);
    auto object = std::make_unique<ItemTree::Object>(info.object_name);
    ItemTree::insert_item(ItemTree::new_double_array_item(
                              "data", Selection::flatten(selection.instances())),
                          object.get());
    ItemTree::insert_item(ItemTree::new_item<int32_t>(
                              "max", static_cast<int32_t>(selection.size())),
                          object.get());
    return object;
}
}  // namespace

std::optional<Selection::PointSelection>
Selection::Serialize::read_point_selection(const ItemTree::Object &object,
                                           const std::string &path) {
    return read_selection<PointSelection>(object, path);
}

std::optional<Selection::PointerSelection>
Selection::Serialize::read_pointer_selection(const ItemTree::Object &object,
                                             const std::string &path) {
    return read_selection<PointerSelection>(object, path);
}

std::optional<Selection::LineSelection>
Selection::Serialize::read_line_selection(const ItemTree::Object &object,
                                          const std::string &path) {
    return read_selection<LineSelection>(object, path);
}

std::optional<Selection::RectangleSelection>
Selection::Serialize::read_rectangle_selection(const ItemTree::Object &object,
                                               const std::string &path) {
    return read_selection<RectangleSelection>(object, path);
}

std::optional<Selection::EllipseSelection>
Selection::Serialize::read_ellipse_selection(const ItemTree::Object &object,
                                             const std::string &path) {
    return read_selection<EllipseSelection>(object, path);
}

std::unique_ptr<ItemTree::Object> Selection::Serialize::write_selection(
    const PointSelection &selection) {
    return write_selection_object(selection);
}

std::unique_ptr<ItemTree::Object> Selection::Serialize::write_selection(
    const PointerSelection &selection) {
    return write_selection_object(selection);
}

std::unique_ptr<ItemTree::Object> Selection::Serialize::write_selection(
    const LineSelection &selection) {
    return write_selection_object(selection);
}

std::unique_ptr<ItemTree::Object> Selection::Serialize::write_selection(
    const RectangleSelection &selection) {
    return write_selection_object(selection);
}

std::unique_ptr<ItemTree::Object> Selection::Serialize::write_selection(
    const EllipseSelection &selection) {
    return write_selection_object(selection);
}
