#ifndef GRAPH_GRAPHMODEL_HPP
#define GRAPH_GRAPHMODEL_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "graph/graph_curve.hpp"
#include "utils/metadata.hpp"

// A two dimensional graph: an ordered list of curves sharing axes, labels and
// a legend box.
namespace GraphModel {

struct Meta {
    // Number of curves. If given it must match the curve list.
    std::optional<int32_t> ncurves;

    std::optional<std::string> title;
    std::optional<std::string> top_label;
    std::optional<std::string> left_label;
    std::optional<std::string> right_label;
    std::optional<std::string> bottom_label;
    std::optional<std::string> x_unit;
    std::optional<std::string> y_unit;

    // User requested axis ranges. Absent bounds are chosen automatically.
    std::optional<double> x_min;
    std::optional<double> x_max;
    std::optional<double> y_min;
    std::optional<double> y_max;

    std::optional<bool> x_is_logarithmic;
    std::optional<bool> y_is_logarithmic;

    // Legend box.
    std::optional<bool> label_visible;
    std::optional<bool> label_has_frame;
    std::optional<bool> label_reverse;
    std::optional<int32_t> label_frame_thickness;
    std::optional<int32_t> label_position;

    std::optional<int32_t> grid_type;

    // Visibility of the graph window. It is stored next to the graph in the
    // container instead of inside the graph object.
    std::optional<bool> visible;
};

struct GraphModel {
    std::vector<GraphCurve::GraphCurve> curves;

    std::string title;
    std::string top_label;
    std::string left_label;
    std::string right_label;
    std::string bottom_label;
    std::string x_unit;
    std::string y_unit;

    std::optional<double> x_min;
    std::optional<double> x_max;
    std::optional<double> y_min;
    std::optional<double> y_max;

    bool x_is_logarithmic;
    bool y_is_logarithmic;

    bool label_visible;
    bool label_has_frame;
    bool label_reverse;
    int32_t label_frame_thickness;
    int32_t label_position;

    int32_t grid_type;

    bool visible;
};

// Throws Error::ShapeMismatch if meta.ncurves disagrees with the curve list.
GraphModel create(std::vector<GraphCurve::GraphCurve> curves,
                  const Meta &meta = {});

int32_t ncurves(const GraphModel &graph);

// An axis bound is stored as a value plus a flag telling if the value is in
// use.
struct AxisBound {
    const char *name;
    const char *set_name;
    std::optional<double> Meta::*input;
    std::optional<double> GraphModel::*value;
};

using StringField = Metadata::Field<Meta, GraphModel, std::string>;
using UnitField = Metadata::UnitField<Meta, GraphModel>;
using BoolField = Metadata::Field<Meta, GraphModel, bool>;
using IntField = Metadata::Field<Meta, GraphModel, int32_t>;
extern const std::array<StringField, 5> string_fields;
extern const std::array<UnitField, 2> unit_fields;
extern const std::array<AxisBound, 4> axis_bounds;
extern const std::array<BoolField, 5> bool_fields;
extern const std::array<IntField, 3> int_fields;

}  // namespace GraphModel

#endif /* GRAPH_GRAPHMODEL_HPP */
