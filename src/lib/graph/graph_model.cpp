#include <sstream>

#include "graph/graph_model.hpp"
#include "utils/error.hpp"

const std::array<GraphModel::StringField, 5> GraphModel::string_fields = {{
    {"title", &Meta::title, &GraphModel::title, ""},
    {"top_label", &Meta::top_label, &GraphModel::top_label, ""},
    {"left_label", &Meta::left_label, &GraphModel::left_label, ""},
    {"right_label", &Meta::right_label, &GraphModel::right_label, ""},
    {"bottom_label", &Meta::bottom_label, &GraphModel::bottom_label, ""},
}};

const std::array<GraphModel::UnitField, 2> GraphModel::unit_fields = {{
    {"x_unit", &Meta::x_unit, &GraphModel::x_unit},
    {"y_unit", &Meta::y_unit, &GraphModel::y_unit},
}};

const std::array<GraphModel::AxisBound, 4> GraphModel::axis_bounds = {{
    {"x_min", "x_min_set", &Meta::x_min, &GraphModel::x_min},
    {"x_max", "x_max_set", &Meta::x_max, &GraphModel::x_max},
    {"y_min", "y_min_set", &Meta::y_min, &GraphModel::y_min},
    {"y_max", "y_max_set", &Meta::y_max, &GraphModel::y_max},
}};

const std::array<GraphModel::BoolField, 5> GraphModel::bool_fields = {{
    {"x_is_logarithmic", &Meta::x_is_logarithmic,
     &GraphModel::x_is_logarithmic, false},
    {"y_is_logarithmic", &Meta::y_is_logarithmic,
     &GraphModel::y_is_logarithmic, false},
    {"label.visible", &Meta::label_visible, &GraphModel::label_visible, true},
    {"label.has_frame", &Meta::label_has_frame, &GraphModel::label_has_frame,
     true},
    {"label.reverse", &Meta::label_reverse, &GraphModel::label_reverse, false},
}};

const std::array<GraphModel::IntField, 3> GraphModel::int_fields = {{
    {"label.frame_thickness", &Meta::label_frame_thickness,
     &GraphModel::label_frame_thickness, 1},
    {"label.position", &Meta::label_position, &GraphModel::label_position, 0},
    {"grid-type", &Meta::grid_type, &GraphModel::grid_type, 1},
}};

GraphModel::GraphModel GraphModel::create(
    std::vector<GraphCurve::GraphCurve> curves, const Meta &meta) {
    if (meta.ncurves &&
        static_cast<size_t>(meta.ncurves.value()) != curves.size()) {
        std::ostringstream error_stream;
        error_stream << "ncurves " << meta.ncurves.value()
                     << " doesn't match the number of curves " << curves.size();
        throw Error::ShapeMismatch("", error_stream.str());
    }
    GraphModel graph = {};
    graph.curves = std::move(curves);
    Metadata::resolve_all(string_fields, meta, &graph);
    Metadata::resolve_all(unit_fields, meta, &graph);
    for (const auto &bound : axis_bounds) {
        graph.*bound.value = meta.*bound.input;
    }
    Metadata::resolve_all(bool_fields, meta, &graph);
    Metadata::resolve_all(int_fields, meta, &graph);
    graph.visible = meta.visible.value_or(false);
    return graph;
}

int32_t GraphModel::ncurves(const GraphModel &graph) {
    return static_cast<int32_t>(graph.curves.size());
}
