#include "graph/graph_curve_serialize.hpp"
#include "graph/graph_model_serialize.hpp"
#include "path_key/path_key.hpp"
#include "utils/error.hpp"

GraphModel::GraphModel GraphModel::Serialize::read_graph_model(
    const ItemTree::Object &object, const std::string &path) {
    if (object.name() != "GwyGraphModel") {
        throw Error::MalformedField(
            path, "expected GwyGraphModel object, found " + object.name());
    }
    std::string curves_path = PathKey::join(path, "curves");
    const ItemTree::ObjectArray *curve_objects = nullptr;
    try {
        curve_objects = ItemTree::get_object_array(object, "curves");
    } catch (const Error::TypeMismatch &e) {
        throw e.within(path);
    }
    if (curve_objects == nullptr) {
        throw Error::MissingRequiredField(curves_path);
    }
    std::vector<GraphCurve::GraphCurve> curves;
    curves.reserve(curve_objects->size());
    for (size_t i = 0; i < curve_objects->size(); ++i) {
        std::string curve_path = PathKey::join(curves_path, std::to_string(i));
        const auto &curve_object = (*curve_objects)[i];
        if (curve_object == nullptr) {
            throw Error::MalformedField(curve_path, "null curve object");
        }
        curves.push_back(
            GraphCurve::Serialize::read_graph_curve(*curve_object, curve_path));
    }

    Meta meta = {};
    meta.ncurves = static_cast<int32_t>(curves.size());
    // Curves report their own paths, only the items of this object are
    // relocated here.
    try {
        Metadata::read_all(string_fields, object, &meta);
        Metadata::read_all(unit_fields, object, &meta);
        for (const auto &bound : axis_bounds) {
            if (!ItemTree::get<bool>(object, bound.set_name).value_or(false)) {
                continue;
            }
            auto value = ItemTree::get<double>(object, bound.name);
            if (!value) {
                throw Error::MissingRequiredField(
                    PathKey::join(path, bound.name));
            }
            meta.*bound.input = value;
        }
        Metadata::read_all(bool_fields, object, &meta);
        Metadata::read_all(int_fields, object, &meta);
    } catch (const Error::TypeMismatch &e) {
        throw e.within(path);
    }
    return create(std::move(curves), meta);
}

std::unique_ptr<ItemTree::Object> GraphModel::Serialize::write_graph_model(
    const GraphModel &graph) {
    auto object = std::make_unique<ItemTree::Object>("GwyGraphModel");
    ItemTree::ObjectArray curve_objects;
    curve_objects.reserve(graph.curves.size());
    for (const auto &curve : graph.curves) {
        curve_objects.push_back(GraphCurve::Serialize::write_graph_curve(curve));
    }
    ItemTree::insert_item(
        ItemTree::new_object_array_item("curves", std::move(curve_objects)),
        object.get());
    Metadata::write_all(string_fields, graph, object.get());
    Metadata::write_all(unit_fields, graph, object.get());
    for (const auto &bound : axis_bounds) {
        const std::optional<double> &value = graph.*bound.value;
        ItemTree::insert_item(
            ItemTree::new_item<double>(bound.name, value.value_or(0.0)),
            object.get());
        ItemTree::insert_item(
            ItemTree::new_item<bool>(bound.set_name, value.has_value()),
            object.get());
    }
    Metadata::write_all(bool_fields, graph, object.get());
    Metadata::write_all(int_fields, graph, object.get());
    return object;
}
