#include "doctest.h"
#include "graph/graph_curve.hpp"
#include "graph/graph_curve_serialize.hpp"
#include "graph/graph_model.hpp"
#include "graph/graph_model_serialize.hpp"
#include "test_utils.hpp"
#include "utils/error.hpp"

namespace {
std::unique_ptr<ItemTree::Object> mock_curve_object(std::vector<double> xdata,
                                                    std::vector<double> ydata) {
    auto object = std::make_unique<ItemTree::Object>("GwyGraphCurveModel");
    object->add(ItemTree::new_double_array_item("xdata", std::move(xdata)));
    object->add(ItemTree::new_double_array_item("ydata", std::move(ydata)));
    return object;
}
}  // namespace

TEST_CASE("Graph curves") {
    SUBCASE("Defaults") {
        auto curve = TestUtils::mock_curve(5);
        CHECK(GraphCurve::ndata(curve) == 5);
        CHECK(curve.description == "");
        CHECK(curve.type == CurveType::POINTS);
        CHECK(curve.point_type == PointType::CIRCLE);
        CHECK(curve.line_style == LineStyle::SOLID);
        CHECK(curve.point_size == 1);
        CHECK(curve.line_size == 1);
        CHECK(curve.color_red == 0.0);
        CHECK(curve.color_green == 0.0);
        CHECK(curve.color_blue == 0.0);
    }
    SUBCASE("Explicit number of points") {
        GraphCurve::Meta meta = {};
        meta.ndata = 4;
        CHECK_NOTHROW(TestUtils::mock_curve(4, 1.0, meta));
        meta.ndata = 3;
        CHECK_THROWS_AS(TestUtils::mock_curve(4, 1.0, meta),
                        Error::ShapeMismatch);
    }
    SUBCASE("Reading") {
        auto object = mock_curve_object({0.0, 1.0, 2.0}, {5.0, 6.0, 7.0});
        object->add(ItemTree::new_item<std::string>("description", "IV"));
        object->add(ItemTree::new_item<int32_t>("type", CurveType::LINE));
        object->add(ItemTree::new_item<double>("color.red", 0.5));
        auto curve = GraphCurve::Serialize::read_graph_curve(*object);
        REQUIRE(GraphCurve::ndata(curve) == 3);
        CHECK(curve.data(0, 2) == 2.0);
        CHECK(curve.data(1, 0) == 5.0);
        CHECK(curve.description == "IV");
        CHECK(curve.type == CurveType::LINE);
        CHECK(curve.point_type == PointType::CIRCLE);
        CHECK(curve.color_red == 0.5);
        CHECK(curve.color_blue == 0.0);
    }
    SUBCASE("Missing ordinates") {
        ItemTree::Object object("GwyGraphCurveModel");
        object.add(ItemTree::new_double_array_item("xdata", {1.0}));
        CHECK_THROWS_AS(GraphCurve::Serialize::read_graph_curve(object),
                        Error::MissingRequiredField);
    }
    SUBCASE("Abscissae and ordinates of different lengths") {
        auto object = mock_curve_object({0.0, 1.0}, {5.0});
        CHECK_THROWS_AS(GraphCurve::Serialize::read_graph_curve(*object),
                        Error::MalformedField);
    }
    SUBCASE("Writing") {
        GraphCurve::Meta meta = {};
        meta.description = "fit";
        meta.color_green = 1.0;
        auto curve = TestUtils::mock_curve(3, 2.0, meta);
        auto object = GraphCurve::Serialize::write_graph_curve(curve);
        CHECK(object->name() == "GwyGraphCurveModel");
        std::vector<double> xdata = {0.0, 1.0, 2.0};
        std::vector<double> ydata = {0.0, 2.0, 4.0};
        CHECK(*ItemTree::get_double_array(*object, "xdata") == xdata);
        CHECK(*ItemTree::get_double_array(*object, "ydata") == ydata);
        CHECK(ItemTree::get<std::string>(*object, "description") == "fit");
        CHECK(ItemTree::get<int32_t>(*object, "type") == CurveType::POINTS);
        CHECK(ItemTree::get<int32_t>(*object, "point_type") ==
              PointType::CIRCLE);
        CHECK(ItemTree::get<int32_t>(*object, "line_style") ==
              LineStyle::SOLID);
        CHECK(ItemTree::get<int32_t>(*object, "point_size") == 1);
        CHECK(ItemTree::get<int32_t>(*object, "line_size") == 1);
        CHECK(ItemTree::get<double>(*object, "color.red") == 0.0);
        CHECK(ItemTree::get<double>(*object, "color.green") == 1.0);
        CHECK(ItemTree::get<double>(*object, "color.blue") == 0.0);
    }
}

TEST_CASE("Graph models") {
    std::vector<GraphCurve::GraphCurve> curves = {TestUtils::mock_curve(3),
                                                  TestUtils::mock_curve(4)};

    SUBCASE("Defaults") {
        auto graph = GraphModel::create(curves);
        CHECK(GraphModel::ncurves(graph) == 2);
        CHECK(graph.title == "");
        CHECK(graph.bottom_label == "");
        CHECK(graph.x_unit == "");
        CHECK_FALSE(graph.x_min.has_value());
        CHECK_FALSE(graph.y_max.has_value());
        CHECK_FALSE(graph.x_is_logarithmic);
        CHECK_FALSE(graph.y_is_logarithmic);
        CHECK(graph.label_visible);
        CHECK(graph.label_has_frame);
        CHECK_FALSE(graph.label_reverse);
        CHECK(graph.label_frame_thickness == 1);
        CHECK(graph.label_position == 0);
        CHECK(graph.grid_type == 1);
        CHECK_FALSE(graph.visible);
    }
    SUBCASE("Number of curves is validated") {
        GraphModel::Meta meta = {};
        meta.ncurves = 3;
        CHECK_THROWS_AS(GraphModel::create(curves, meta), Error::ShapeMismatch);
        meta.ncurves = 2;
        CHECK_NOTHROW(GraphModel::create(curves, meta));
    }
    SUBCASE("Writing") {
        GraphModel::Meta meta = {};
        meta.title = "Spectra";
        meta.x_unit = "eV";
        meta.y_min = -1.5;
        meta.label_reverse = true;
        auto graph = GraphModel::create(curves, meta);
        auto object = GraphModel::Serialize::write_graph_model(graph);
        CHECK(object->name() == "GwyGraphModel");
        REQUIRE(ItemTree::get_object_array(*object, "curves") != nullptr);
        CHECK(ItemTree::get_object_array(*object, "curves")->size() == 2);
        CHECK(ItemTree::get<std::string>(*object, "title") == "Spectra");
        CHECK(ItemTree::get_si_unit(*object, "x_unit") == "eV");
        CHECK(ItemTree::get<double>(*object, "y_min") == -1.5);
        CHECK(ItemTree::get<bool>(*object, "y_min_set") == true);
        CHECK(ItemTree::get<double>(*object, "x_min") == 0.0);
        CHECK(ItemTree::get<bool>(*object, "x_min_set") == false);
        CHECK(ItemTree::get<bool>(*object, "label.reverse") == true);
        CHECK(ItemTree::get<bool>(*object, "label.visible") == true);
        CHECK(ItemTree::get<int32_t>(*object, "grid-type") == 1);
        // The visibility is stored by the container.
        CHECK(object->get("visible") == nullptr);
    }
    SUBCASE("Reading back") {
        GraphModel::Meta meta = {};
        meta.left_label = "I";
        meta.x_max = 10.0;
        auto object =
            GraphModel::Serialize::write_graph_model(GraphModel::create(curves, meta));
        auto graph = GraphModel::Serialize::read_graph_model(*object);
        CHECK(GraphModel::ncurves(graph) == 2);
        CHECK(GraphCurve::ndata(graph.curves[1]) == 4);
        CHECK(graph.left_label == "I");
        CHECK(graph.x_max == 10.0);
        CHECK_FALSE(graph.x_min.has_value());
    }
    SUBCASE("Bounds are ignored unless flagged") {
        ItemTree::Object object("GwyGraphModel");
        object.add(ItemTree::new_object_array_item("curves", {}));
        object.add(ItemTree::new_item<double>("x_min", 3.0));
        object.add(ItemTree::new_item<bool>("y_max_set", true));
        object.add(ItemTree::new_item<double>("y_max", 7.0));
        auto graph = GraphModel::Serialize::read_graph_model(object);
        CHECK(GraphModel::ncurves(graph) == 0);
        CHECK_FALSE(graph.x_min.has_value());
        CHECK(graph.y_max == 7.0);
    }
    SUBCASE("Flagged bound without value") {
        ItemTree::Object object("GwyGraphModel");
        object.add(ItemTree::new_object_array_item("curves", {}));
        object.add(ItemTree::new_item<bool>("x_min_set", true));
        CHECK_THROWS_AS(GraphModel::Serialize::read_graph_model(object),
                        Error::MissingRequiredField);
    }
    SUBCASE("Missing curves") {
        ItemTree::Object object("GwyGraphModel");
        CHECK_THROWS_AS(GraphModel::Serialize::read_graph_model(object),
                        Error::MissingRequiredField);
    }
    SUBCASE("A broken curve fails the graph") {
        ItemTree::ObjectArray curve_objects;
        curve_objects.push_back(mock_curve_object({0.0}, {1.0}));
        curve_objects.push_back(mock_curve_object({0.0, 1.0}, {1.0}));
        ItemTree::Object object("GwyGraphModel");
        object.add(ItemTree::new_object_array_item("curves",
                                                   std::move(curve_objects)));
        try {
            GraphModel::Serialize::read_graph_model(object, "/0/graph/graph/1");
            FAIL("expected a malformed curve");
        } catch (const Error::MalformedField &e) {
            CHECK(e.path() == "/0/graph/graph/1/curves/1/ydata");
        }
    }
    SUBCASE("Type errors are located in the curve") {
        ItemTree::ObjectArray curve_objects;
        curve_objects.push_back(mock_curve_object({0.0}, {1.0}));
        curve_objects.back()->add(ItemTree::new_item<double>("type", 1.0));
        ItemTree::Object object("GwyGraphModel");
        object.add(ItemTree::new_object_array_item("curves",
                                                   std::move(curve_objects)));
        try {
            GraphModel::Serialize::read_graph_model(object, "/0/graph/graph/1");
            FAIL("expected a type mismatch");
        } catch (const Error::TypeMismatch &e) {
            CHECK(e.path() == "/0/graph/graph/1/curves/0/type");
        }
    }
    SUBCASE("Type errors are located in the graph") {
        ItemTree::Object object("GwyGraphModel");
        object.add(ItemTree::new_object_array_item("curves", {}));
        object.add(ItemTree::new_item<int32_t>("title", 4));
        try {
            GraphModel::Serialize::read_graph_model(object, "/0/graph/graph/2");
            FAIL("expected a type mismatch");
        } catch (const Error::TypeMismatch &e) {
            CHECK(e.path() == "/0/graph/graph/2/title");
        }
    }
}
