#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include <array>

#include "doctest.h"
#include "utils/error.hpp"
#include "utils/metadata.hpp"

namespace {
struct MockMeta {
    std::optional<double> scale;
    std::optional<std::string> label;
    std::optional<std::string> unit;
};

struct MockEntity {
    double scale;
    std::string label;
    std::string unit;
};

const std::array<Metadata::Field<MockMeta, MockEntity, double>, 1>
    double_fields = {{{"scale", &MockMeta::scale, &MockEntity::scale, 2.5}}};
const std::array<Metadata::Field<MockMeta, MockEntity, std::string>, 1>
    string_fields = {{{"label", &MockMeta::label, &MockEntity::label, "none"}}};
const std::array<Metadata::UnitField<MockMeta, MockEntity>, 1> unit_fields = {
    {{"unit", &MockMeta::unit, &MockEntity::unit}}};
}  // namespace

TEST_CASE("Error hierarchy") {
    SUBCASE("Path is part of the message") {
        Error::MissingRequiredField error("/0/data/title");
        CHECK(error.path() == "/0/data/title");
        CHECK(std::string(error.what()) ==
              "/0/data/title: missing required field");
    }
    SUBCASE("Empty path") {
        Error::ShapeMismatch error("", "bad shape");
        CHECK(std::string(error.what()) == "bad shape");
    }
    SUBCASE("Missing fields are decode errors") {
        CHECK_THROWS_AS(throw Error::MissingRequiredField("xres"),
                        Error::DecodeError);
        CHECK_THROWS_AS(throw Error::TypeMismatch("xres", "wrong type"),
                        Error::DecodeError);
        CHECK_THROWS_AS(throw Error::EmptySelection("line"),
                        Error::ValidationError);
    }
}

TEST_CASE("Metadata field tables") {
    SUBCASE("Defaults are used for absent values") {
        MockEntity entity = {};
        Metadata::resolve_all(double_fields, MockMeta{}, &entity);
        Metadata::resolve_all(string_fields, MockMeta{}, &entity);
        Metadata::resolve_all(unit_fields, MockMeta{}, &entity);
        CHECK(entity.scale == 2.5);
        CHECK(entity.label == "none");
        CHECK(entity.unit == "");
    }
    SUBCASE("Given values override the defaults") {
        MockMeta meta = {};
        meta.scale = 4.0;
        meta.unit = "m";
        MockEntity entity = {};
        Metadata::resolve_all(double_fields, meta, &entity);
        Metadata::resolve_all(unit_fields, meta, &entity);
        CHECK(entity.scale == 4.0);
        CHECK(entity.unit == "m");
    }
    SUBCASE("Write and read back") {
        MockEntity entity = {3.0, "height", "V"};
        ItemTree::Object object("MockObject");
        Metadata::write_all(double_fields, entity, &object);
        Metadata::write_all(string_fields, entity, &object);
        Metadata::write_all(unit_fields, entity, &object);
        CHECK(object.size() == 3);
        CHECK(object.get("unit")->type() == ItemTree::ItemType::OBJECT);

        MockMeta meta = {};
        Metadata::read_all(double_fields, object, &meta);
        Metadata::read_all(string_fields, object, &meta);
        Metadata::read_all(unit_fields, object, &meta);
        CHECK(meta.scale == 3.0);
        CHECK(meta.label == "height");
        CHECK(meta.unit == "V");
    }
    SUBCASE("Absent items stay unset") {
        ItemTree::Object object("MockObject");
        MockMeta meta = {};
        Metadata::read_all(double_fields, object, &meta);
        Metadata::read_all(unit_fields, object, &meta);
        CHECK_FALSE(meta.scale.has_value());
        CHECK_FALSE(meta.unit.has_value());
    }
}
