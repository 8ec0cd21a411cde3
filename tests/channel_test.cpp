#include <set>

#include "channel/channel.hpp"
#include "channel/channel_serialize.hpp"
#include "datafield/datafield_serialize.hpp"
#include "doctest.h"
#include "test_utils.hpp"
#include "utils/error.hpp"

namespace {
std::set<std::string> item_names(const ItemTree::Object &object) {
    std::set<std::string> names;
    for (const auto &item : object.items()) {
        names.insert(item.name());
    }
    return names;
}
}  // namespace

TEST_CASE("Writing channels") {
    ItemTree::Object tree("GwyContainer");

    SUBCASE("Only the required items are written") {
        Channel::Channel channel = {};
        channel.title = "Height";
        channel.data = DataField::create(DataField::Grid::Zero(256, 256));
        Channel::Serialize::write_channel(channel, 0, &tree);
        std::set<std::string> expected = {"/0/data", "/0/data/title",
                                          "/0/data/visible"};
        CHECK(item_names(tree) == expected);
        CHECK(ItemTree::get<std::string>(tree, "/0/data/title") == "Height");
        CHECK(ItemTree::get<bool>(tree, "/0/data/visible") == false);
        const ItemTree::Object *data = ItemTree::get_object(tree, "/0/data");
        REQUIRE(data != nullptr);
        CHECK(ItemTree::get<int32_t>(*data, "xres") == 256);
    }
    SUBCASE("Optional items are written when present") {
        Channel::Channel channel = {};
        channel.title = "Phase";
        channel.data = DataField::create(TestUtils::sequential_grid(2, 2));
        channel.visible = true;
        channel.palette = "Gray";
        channel.range_type = RangeType::FIXED;
        channel.range_min = -1.0;
        channel.mask = DataField::create(DataField::Grid::Ones(2, 2));
        channel.mask_red = 1.0;
        channel.mask_alpha = 0.5;
        channel.line_selections = Selection::LineSelection(
            {{{0.0, 0.0}, {1.0, 1.0}}});
        Channel::Serialize::write_channel(channel, 3, &tree);
        std::set<std::string> expected = {
            "/3/data",          "/3/data/title",   "/3/data/visible",
            "/3/base/palette",  "/3/base/range-type", "/3/base/min",
            "/3/mask",          "/3/mask/red",     "/3/mask/alpha",
            "/3/select/line",
        };
        CHECK(item_names(tree) == expected);
        CHECK(ItemTree::get<bool>(tree, "/3/data/visible") == true);
        CHECK(ItemTree::get<int32_t>(tree, "/3/base/range-type") ==
              RangeType::FIXED);
        CHECK(ItemTree::get<double>(tree, "/3/mask/alpha") == 0.5);
        const ItemTree::Object *selection =
            ItemTree::get_object(tree, "/3/select/line");
        REQUIRE(selection != nullptr);
        CHECK(selection->name() == "GwySelectionLine");
    }
    SUBCASE("Ids can't be reused") {
        Channel::Channel channel = {};
        channel.title = "Height";
        channel.data = DataField::create(TestUtils::sequential_grid(2, 2));
        Channel::Serialize::write_channel(channel, 0, &tree);
        CHECK_THROWS_AS(Channel::Serialize::write_channel(channel, 0, &tree),
                        Error::StoreError);
    }
}

TEST_CASE("Reading channels") {
    ItemTree::Object tree("GwyContainer");

    SUBCASE("Minimal channel") {
        ItemTree::insert_item(
            ItemTree::new_object_item(
                "/1/data", DataField::Serialize::write_datafield(
                               DataField::create(TestUtils::sequential_grid(2, 3)))),
            &tree);
        ItemTree::insert_item(
            ItemTree::new_item<std::string>("/1/data/title", "Height"), &tree);
        auto channel = Channel::Serialize::read_channel(tree, 1);
        CHECK(channel.title == "Height");
        CHECK(DataField::xres(channel.data) == 2);
        CHECK(DataField::yres(channel.data) == 3);
        CHECK_FALSE(channel.visible);
        CHECK_FALSE(channel.palette.has_value());
        CHECK_FALSE(channel.range_type.has_value());
        CHECK_FALSE(channel.mask.has_value());
        CHECK_FALSE(channel.mask_red.has_value());
        CHECK_FALSE(channel.show.has_value());
        CHECK_FALSE(channel.point_selections.has_value());
        CHECK_FALSE(channel.ellipse_selections.has_value());
    }
    SUBCASE("Written channels read back") {
        Channel::Channel source = {};
        source.title = "Current";
        source.data = DataField::create(TestUtils::sequential_grid(3, 3));
        source.visible = true;
        source.range_max = 4.0;
        source.show = DataField::create(DataField::Grid::Ones(3, 3));
        source.mask_green = 0.25;
        source.point_selections = Selection::PointSelection({{1.0, 1.0}});
        source.rectangle_selections = Selection::RectangleSelection(
            {{{0.0, 0.0}, {2.0, 2.0}}, {{1.0, 1.0}, {3.0, 3.0}}});
        Channel::Serialize::write_channel(source, 0, &tree);

        auto channel = Channel::Serialize::read_channel(tree, 0);
        CHECK(channel.title == "Current");
        CHECK(channel.data.data == source.data.data);
        CHECK(channel.visible);
        CHECK(channel.range_max == 4.0);
        CHECK_FALSE(channel.range_min.has_value());
        REQUIRE(channel.show.has_value());
        CHECK(channel.show->data(2, 2) == 1.0);
        CHECK(channel.mask_green == 0.25);
        CHECK_FALSE(channel.mask_blue.has_value());
        REQUIRE(channel.point_selections.has_value());
        CHECK(channel.point_selections->size() == 1);
        REQUIRE(channel.rectangle_selections.has_value());
        CHECK(channel.rectangle_selections->size() == 2);
        CHECK_FALSE(channel.line_selections.has_value());
    }
    SUBCASE("Empty selections are ignored") {
        Channel::Channel source = {};
        source.title = "Height";
        source.data = DataField::create(TestUtils::sequential_grid(2, 2));
        Channel::Serialize::write_channel(source, 0, &tree);
        auto selection = std::make_unique<ItemTree::Object>("GwySelectionPoint");
        selection->add(ItemTree::new_double_array_item("data", {}));
        ItemTree::insert_item(
            ItemTree::new_object_item("/0/select/point", std::move(selection)),
            &tree);
        auto channel = Channel::Serialize::read_channel(tree, 0);
        CHECK_FALSE(channel.point_selections.has_value());
    }
    SUBCASE("Missing data field") {
        ItemTree::insert_item(
            ItemTree::new_item<std::string>("/0/data/title", "Height"), &tree);
        CHECK_THROWS_AS(Channel::Serialize::read_channel(tree, 0),
                        Error::MissingRequiredField);
    }
    SUBCASE("Missing title") {
        ItemTree::insert_item(
            ItemTree::new_object_item(
                "/0/data", DataField::Serialize::write_datafield(
                               DataField::create(TestUtils::sequential_grid(2, 2)))),
            &tree);
        try {
            Channel::Serialize::read_channel(tree, 0);
            FAIL("expected a missing title");
        } catch (const Error::MissingRequiredField &e) {
            CHECK(e.path() == "/0/data/title");
        }
    }
}
