#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "pybind11/eigen.h"
#include "pybind11/pybind11.h"
#include "pybind11/stl.h"

#include "channel/channel.hpp"
#include "container/container.hpp"
#include "container/container_serialize.hpp"
#include "container/retention.hpp"
#include "datafield/datafield.hpp"
#include "graph/graph_curve.hpp"
#include "graph/graph_model.hpp"
#include "selection/selection.hpp"
#include "utils/error.hpp"

namespace py = pybind11;

namespace PythonAPI {
DataField::DataField datafield(const DataField::Grid &data,
                               std::optional<int32_t> xres,
                               std::optional<int32_t> yres,
                               std::optional<double> xreal,
                               std::optional<double> yreal,
                               std::optional<double> xoff,
                               std::optional<double> yoff,
                               std::optional<std::string> si_unit_xy,
                               std::optional<std::string> si_unit_z) {
    DataField::Meta meta = {xres, yres, xreal, yreal,
                            xoff, yoff, si_unit_xy, si_unit_z};
    return DataField::create(data, meta);
}

GraphCurve::GraphCurve graph_curve(
    const GraphCurve::Data &data, std::optional<int32_t> ndata,
    std::optional<std::string> description, std::optional<int32_t> type,
    std::optional<int32_t> point_type, std::optional<int32_t> line_style,
    std::optional<int32_t> point_size, std::optional<int32_t> line_size,
    std::optional<double> color_red, std::optional<double> color_green,
    std::optional<double> color_blue) {
    GraphCurve::Meta meta = {ndata,      description, type,
                             point_type, line_style,  point_size,
                             line_size,  color_red,   color_green,
                             color_blue};
    return GraphCurve::create(data, meta);
}

// The less common graph settings are left to their defaults, they can be
// changed on the returned object.
GraphModel::GraphModel graph_model(
    const std::vector<GraphCurve::GraphCurve> &curves,
    std::optional<int32_t> ncurves, std::optional<std::string> title,
    std::optional<std::string> bottom_label,
    std::optional<std::string> left_label, std::optional<std::string> x_unit,
    std::optional<std::string> y_unit, std::optional<bool> visible) {
    GraphModel::Meta meta = {};
    meta.ncurves = ncurves;
    meta.title = title;
    meta.bottom_label = bottom_label;
    meta.left_label = left_label;
    meta.x_unit = x_unit;
    meta.y_unit = y_unit;
    meta.visible = visible;
    return GraphModel::create(curves, meta);
}

// Returns the container together with the report of the skipped entities.
std::tuple<Container::Container, Container::ReadReport> read_container(
    const Container::Tree &tree, bool strict, bool verbose) {
    Container::ReadParams params;
    params.strict = strict;
    params.verbose = verbose;
    Container::ReadReport report;
    auto container =
        Container::Serialize::read_container(tree.root(), params, &report);
    return {std::move(container), std::move(report)};
}

Container::Tree write_container(const Container::Container &container) {
    return Container::Serialize::write_container(container);
}

template <typename S>
void bind_selection(py::module &m, const char *name) {
    py::class_<S>(m, name)
        .def(py::init<std::vector<typename S::instance_type>>(),
             py::arg("instances"))
        .def_property_readonly("instances", &S::instances)
        .def("__len__", &S::size)
        .def("__repr__", [name](const S &s) {
            return std::string(name) + " <size: " + std::to_string(s.size()) +
                   ">";
        });
}
}  // namespace PythonAPI

PYBIND11_MODULE(gwymodel, m) {
    // Documentation.
    m.doc() = "gwymodel documentation";

    // Errors.
    auto base_error =
        py::register_exception<Error::Exception>(m, "GwyError");
    py::register_exception<Error::DecodeError>(m, "DecodeError",
                                               base_error.ptr());
    py::register_exception<Error::ValidationError>(m, "ValidationError",
                                                   base_error.ptr());
    py::register_exception<Error::StoreError>(m, "StoreError",
                                              base_error.ptr());

    // Structs.
    py::class_<DataField::DataField>(m, "DataField")
        .def_readwrite("data", &DataField::DataField::data)
        .def_readwrite("xreal", &DataField::DataField::xreal)
        .def_readwrite("yreal", &DataField::DataField::yreal)
        .def_readwrite("xoff", &DataField::DataField::xoff)
        .def_readwrite("yoff", &DataField::DataField::yoff)
        .def_readwrite("si_unit_xy", &DataField::DataField::si_unit_xy)
        .def_readwrite("si_unit_z", &DataField::DataField::si_unit_z)
        .def_property_readonly("xres", &DataField::xres)
        .def_property_readonly("yres", &DataField::yres)
        .def("__repr__", [](const DataField::DataField &d) {
            return "DataField <xres: " + std::to_string(DataField::xres(d)) +
                   ", yres: " + std::to_string(DataField::yres(d)) +
                   ", xreal: " + std::to_string(d.xreal) +
                   ", yreal: " + std::to_string(d.yreal) + ">";
        });

    py::class_<Selection::Point>(m, "Point")
        .def(py::init<double, double>(), py::arg("x"), py::arg("y"))
        .def_readwrite("x", &Selection::Point::x)
        .def_readwrite("y", &Selection::Point::y);
    PythonAPI::bind_selection<Selection::PointSelection>(m, "PointSelection");
    PythonAPI::bind_selection<Selection::PointerSelection>(m,
                                                           "PointerSelection");
    PythonAPI::bind_selection<Selection::LineSelection>(m, "LineSelection");
    PythonAPI::bind_selection<Selection::RectangleSelection>(
        m, "RectangleSelection");
    PythonAPI::bind_selection<Selection::EllipseSelection>(m,
                                                           "EllipseSelection");

    py::class_<Channel::Channel>(m, "Channel")
        .def(py::init([](const std::string &title,
                         const DataField::DataField &data) {
                 Channel::Channel channel = {};
                 channel.title = title;
                 channel.data = data;
                 return channel;
             }),
             py::arg("title"), py::arg("data"))
        .def_readwrite("title", &Channel::Channel::title)
        .def_readwrite("data", &Channel::Channel::data)
        .def_readwrite("visible", &Channel::Channel::visible)
        .def_readwrite("palette", &Channel::Channel::palette)
        .def_readwrite("range_type", &Channel::Channel::range_type)
        .def_readwrite("range_min", &Channel::Channel::range_min)
        .def_readwrite("range_max", &Channel::Channel::range_max)
        .def_readwrite("mask", &Channel::Channel::mask)
        .def_readwrite("mask_red", &Channel::Channel::mask_red)
        .def_readwrite("mask_green", &Channel::Channel::mask_green)
        .def_readwrite("mask_blue", &Channel::Channel::mask_blue)
        .def_readwrite("mask_alpha", &Channel::Channel::mask_alpha)
        .def_readwrite("show", &Channel::Channel::show)
        .def_readwrite("point_selections", &Channel::Channel::point_selections)
        .def_readwrite("pointer_selections",
                       &Channel::Channel::pointer_selections)
        .def_readwrite("line_selections", &Channel::Channel::line_selections)
        .def_readwrite("rectangle_selections",
                       &Channel::Channel::rectangle_selections)
        .def_readwrite("ellipse_selections",
                       &Channel::Channel::ellipse_selections)
        .def("__repr__", [](const Channel::Channel &c) {
            return "Channel <title: " + c.title +
                   ", xres: " + std::to_string(DataField::xres(c.data)) +
                   ", yres: " + std::to_string(DataField::yres(c.data)) + ">";
        });

    py::class_<GraphCurve::GraphCurve>(m, "GraphCurve")
        .def_readwrite("data", &GraphCurve::GraphCurve::data)
        .def_readwrite("description", &GraphCurve::GraphCurve::description)
        .def_readwrite("type", &GraphCurve::GraphCurve::type)
        .def_readwrite("point_type", &GraphCurve::GraphCurve::point_type)
        .def_readwrite("line_style", &GraphCurve::GraphCurve::line_style)
        .def_readwrite("point_size", &GraphCurve::GraphCurve::point_size)
        .def_readwrite("line_size", &GraphCurve::GraphCurve::line_size)
        .def_readwrite("color_red", &GraphCurve::GraphCurve::color_red)
        .def_readwrite("color_green", &GraphCurve::GraphCurve::color_green)
        .def_readwrite("color_blue", &GraphCurve::GraphCurve::color_blue)
        .def_property_readonly("ndata", &GraphCurve::ndata)
        .def("__repr__", [](const GraphCurve::GraphCurve &c) {
            return "GraphCurve <description: " + c.description +
                   ", ndata: " + std::to_string(GraphCurve::ndata(c)) + ">";
        });

    py::class_<GraphModel::GraphModel>(m, "GraphModel")
        .def_readwrite("curves", &GraphModel::GraphModel::curves)
        .def_readwrite("title", &GraphModel::GraphModel::title)
        .def_readwrite("top_label", &GraphModel::GraphModel::top_label)
        .def_readwrite("left_label", &GraphModel::GraphModel::left_label)
        .def_readwrite("right_label", &GraphModel::GraphModel::right_label)
        .def_readwrite("bottom_label", &GraphModel::GraphModel::bottom_label)
        .def_readwrite("x_unit", &GraphModel::GraphModel::x_unit)
        .def_readwrite("y_unit", &GraphModel::GraphModel::y_unit)
        .def_readwrite("x_min", &GraphModel::GraphModel::x_min)
        .def_readwrite("x_max", &GraphModel::GraphModel::x_max)
        .def_readwrite("y_min", &GraphModel::GraphModel::y_min)
        .def_readwrite("y_max", &GraphModel::GraphModel::y_max)
        .def_readwrite("x_is_logarithmic",
                       &GraphModel::GraphModel::x_is_logarithmic)
        .def_readwrite("y_is_logarithmic",
                       &GraphModel::GraphModel::y_is_logarithmic)
        .def_readwrite("label_visible", &GraphModel::GraphModel::label_visible)
        .def_readwrite("label_has_frame",
                       &GraphModel::GraphModel::label_has_frame)
        .def_readwrite("label_reverse", &GraphModel::GraphModel::label_reverse)
        .def_readwrite("label_frame_thickness",
                       &GraphModel::GraphModel::label_frame_thickness)
        .def_readwrite("label_position",
                       &GraphModel::GraphModel::label_position)
        .def_readwrite("grid_type", &GraphModel::GraphModel::grid_type)
        .def_readwrite("visible", &GraphModel::GraphModel::visible)
        .def_property_readonly("ncurves", &GraphModel::ncurves)
        .def("__repr__", [](const GraphModel::GraphModel &g) {
            return "GraphModel <title: " + g.title +
                   ", ncurves: " + std::to_string(GraphModel::ncurves(g)) +
                   ">";
        });

    py::class_<Container::Container>(m, "Container")
        .def(py::init<>())
        .def_readwrite("channels", &Container::Container::channels)
        .def_readwrite("graphs", &Container::Container::graphs)
        .def_readwrite("filename", &Container::Container::filename)
        .def("__repr__", [](const Container::Container &c) {
            return "Container <channels: " + std::to_string(c.channels.size()) +
                   ", graphs: " + std::to_string(c.graphs.size()) + ">";
        });

    py::class_<Container::ReadReport>(m, "ReadReport")
        .def(py::init<>())
        .def_readonly("skipped_channels",
                      &Container::ReadReport::skipped_channels)
        .def_readonly("skipped_graphs", &Container::ReadReport::skipped_graphs)
        .def_readonly("errors", &Container::ReadReport::errors)
        .def("__repr__", [](const Container::ReadReport &r) {
            return "ReadReport <skipped_channels: " +
                   std::to_string(r.skipped_channels.size()) +
                   ", skipped_graphs: " +
                   std::to_string(r.skipped_graphs.size()) + ">";
        });

    py::class_<Container::Tree>(m, "Tree")
        .def("close", &Container::Tree::close)
        .def_property_readonly("is_open", &Container::Tree::is_open);

    // Functions.
    m.def("datafield", &PythonAPI::datafield,
          "Build a data field, checking the resolution against the data",
          py::arg("data"), py::arg("xres") = std::nullopt,
          py::arg("yres") = std::nullopt, py::arg("xreal") = std::nullopt,
          py::arg("yreal") = std::nullopt, py::arg("xoff") = std::nullopt,
          py::arg("yoff") = std::nullopt, py::arg("si_unit_xy") = std::nullopt,
          py::arg("si_unit_z") = std::nullopt)
        .def("graph_curve", &PythonAPI::graph_curve,
             "Build a graph curve from a 2xN array", py::arg("data"),
             py::arg("ndata") = std::nullopt,
             py::arg("description") = std::nullopt,
             py::arg("type") = std::nullopt,
             py::arg("point_type") = std::nullopt,
             py::arg("line_style") = std::nullopt,
             py::arg("point_size") = std::nullopt,
             py::arg("line_size") = std::nullopt,
             py::arg("color_red") = std::nullopt,
             py::arg("color_green") = std::nullopt,
             py::arg("color_blue") = std::nullopt)
        .def("graph_model", &PythonAPI::graph_model,
             "Build a graph model from a list of curves", py::arg("curves"),
             py::arg("ncurves") = std::nullopt, py::arg("title") = std::nullopt,
             py::arg("bottom_label") = std::nullopt,
             py::arg("left_label") = std::nullopt,
             py::arg("x_unit") = std::nullopt, py::arg("y_unit") = std::nullopt,
             py::arg("visible") = std::nullopt)
        .def("read_container", &PythonAPI::read_container,
             "Decode the container stored in the given item tree, returning "
             "the container and the report of the skipped entities",
             py::arg("tree"), py::arg("strict") = false,
             py::arg("verbose") = true)
        .def("write_container", &PythonAPI::write_container,
             "Encode the container in a new item tree", py::arg("container"));
}
