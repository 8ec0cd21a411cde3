#ifndef GRAPH_GRAPHCURVE_HPP
#define GRAPH_GRAPHCURVE_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "Eigen/Core"
#include "utils/metadata.hpp"

// How the curve is drawn.
namespace CurveType {
enum Type : int32_t { HIDDEN = 0, POINTS = 1, LINE = 2, LINE_POINTS = 3 };
}  // namespace CurveType

// Symbol used for the data points.
namespace PointType {
enum Type : int32_t {
    SQUARE = 0,
    CROSS = 1,
    CIRCLE = 2,
    STAR = 3,
    TIMES = 4,
    TRIANGLE_UP = 5,
    TRIANGLE_DOWN = 6,
    DIAMOND = 7,
    FILLED_SQUARE = 8,
    DISC = 9,
    FILLED_TRIANGLE_UP = 10,
    FILLED_TRIANGLE_DOWN = 11,
    FILLED_DIAMOND = 12,
};
}  // namespace PointType

namespace LineStyle {
enum Type : int32_t { SOLID = 0, ON_OFF_DASH = 1, DOUBLE_DASH = 2 };
}  // namespace LineStyle

// A single curve of a graph, with its samples and the styling used to draw it.
namespace GraphCurve {

// Row 0 holds the abscissae and row 1 the ordinates.
using Data = Eigen::Matrix<double, 2, Eigen::Dynamic, Eigen::RowMajor>;

struct Meta {
    // Number of points. If given it must match the number of columns.
    std::optional<int32_t> ndata;
    std::optional<std::string> description;
    std::optional<int32_t> type;
    std::optional<int32_t> point_type;
    std::optional<int32_t> line_style;
    std::optional<int32_t> point_size;
    std::optional<int32_t> line_size;
    // Colour components in the [0, 1] range.
    std::optional<double> color_red;
    std::optional<double> color_green;
    std::optional<double> color_blue;
};

struct GraphCurve {
    Data data;
    std::string description;

    // The styling values are kept as stored integers, see CurveType,
    // PointType and LineStyle for the known values.
    int32_t type;
    int32_t point_type;
    int32_t line_style;
    int32_t point_size;
    int32_t line_size;

    double color_red;
    double color_green;
    double color_blue;
};

// Throws Error::ShapeMismatch if meta.ndata disagrees with the data.
GraphCurve create(Data data, const Meta &meta = {});

int32_t ndata(const GraphCurve &curve);

using StringField = Metadata::Field<Meta, GraphCurve, std::string>;
using IntField = Metadata::Field<Meta, GraphCurve, int32_t>;
using DoubleField = Metadata::Field<Meta, GraphCurve, double>;
extern const std::array<StringField, 1> string_fields;
extern const std::array<IntField, 5> int_fields;
extern const std::array<DoubleField, 3> double_fields;

}  // namespace GraphCurve

#endif /* GRAPH_GRAPHCURVE_HPP */
