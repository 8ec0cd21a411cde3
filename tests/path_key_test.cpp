#include "doctest.h"
#include "path_key/path_key.hpp"

TEST_CASE("Channel keys") {
    CHECK(PathKey::data(0) == "/0/data");
    CHECK(PathKey::title(3) == "/3/data/title");
    CHECK(PathKey::visible(1) == "/1/data/visible");
    CHECK(PathKey::palette(0) == "/0/base/palette");
    CHECK(PathKey::range_type(0) == "/0/base/range-type");
    CHECK(PathKey::range_min(2) == "/2/base/min");
    CHECK(PathKey::range_max(2) == "/2/base/max");
    CHECK(PathKey::mask(4) == "/4/mask");
    CHECK(PathKey::mask_color(4, "alpha") == "/4/mask/alpha");
    CHECK(PathKey::show(0) == "/0/show");
    CHECK(PathKey::selection(1, "rectangle") == "/1/select/rectangle");
}

TEST_CASE("Graph and container keys") {
    CHECK(PathKey::graph(1) == "/0/graph/graph/1");
    CHECK(PathKey::graph_visible(2) == "/0/graph/graph/2/visible");
    CHECK(PathKey::filename() == "/filename");
}

TEST_CASE("Parsing ids") {
    SUBCASE("Channels") {
        CHECK(PathKey::parse_channel_id("/0/data") == 0);
        CHECK(PathKey::parse_channel_id("/12/data") == 12);
        CHECK_FALSE(PathKey::parse_channel_id("/0/data/title").has_value());
        CHECK_FALSE(PathKey::parse_channel_id("/a/data").has_value());
        CHECK_FALSE(PathKey::parse_channel_id("0/data").has_value());
        CHECK_FALSE(PathKey::parse_channel_id("/0/mask").has_value());
    }
    SUBCASE("Graphs") {
        CHECK(PathKey::parse_graph_id("/0/graph/graph/1") == 1);
        CHECK(PathKey::parse_graph_id("/0/graph/graph/15") == 15);
        CHECK_FALSE(
            PathKey::parse_graph_id("/0/graph/graph/1/visible").has_value());
        CHECK_FALSE(PathKey::parse_graph_id("/1/graph/graph/1").has_value());
        CHECK_FALSE(PathKey::parse_graph_id("/0/data").has_value());
    }
    SUBCASE("Ids out of range") {
        CHECK_FALSE(
            PathKey::parse_channel_id("/99999999999999/data").has_value());
    }
}

TEST_CASE("Joining paths") {
    CHECK(PathKey::join("", "xres") == "xres");
    CHECK(PathKey::join("/0/data", "xres") == "/0/data/xres");
}
