#include <sstream>

#include "graph/graph_curve.hpp"
#include "utils/error.hpp"

const std::array<GraphCurve::StringField, 1> GraphCurve::string_fields = {{
    {"description", &Meta::description, &GraphCurve::description, ""},
}};

const std::array<GraphCurve::IntField, 5> GraphCurve::int_fields = {{
    {"type", &Meta::type, &GraphCurve::type, CurveType::POINTS},
    {"point_type", &Meta::point_type, &GraphCurve::point_type,
     PointType::CIRCLE},
    {"line_style", &Meta::line_style, &GraphCurve::line_style,
     LineStyle::SOLID},
    {"point_size", &Meta::point_size, &GraphCurve::point_size, 1},
    {"line_size", &Meta::line_size, &GraphCurve::line_size, 1},
}};

const std::array<GraphCurve::DoubleField, 3> GraphCurve::double_fields = {{
    {"color.red", &Meta::color_red, &GraphCurve::color_red, 0.0},
    {"color.green", &Meta::color_green, &GraphCurve::color_green, 0.0},
    {"color.blue", &Meta::color_blue, &GraphCurve::color_blue, 0.0},
}};

GraphCurve::GraphCurve GraphCurve::create(Data data, const Meta &meta) {
    if (meta.ndata && meta.ndata.value() != data.cols()) {
        std::ostringstream error_stream;
        error_stream << "ndata " << meta.ndata.value()
                     << " doesn't match the data shape (2, " << data.cols()
                     << ")";
        throw Error::ShapeMismatch("", error_stream.str());
    }
    GraphCurve curve = {};
    curve.data = std::move(data);
    Metadata::resolve_all(string_fields, meta, &curve);
    Metadata::resolve_all(int_fields, meta, &curve);
    Metadata::resolve_all(double_fields, meta, &curve);
    return curve;
}

int32_t GraphCurve::ndata(const GraphCurve &curve) {
    return static_cast<int32_t>(curve.data.cols());
}
