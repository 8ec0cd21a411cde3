#ifndef UTILS_METADATA_HPP
#define UTILS_METADATA_HPP

#include <optional>
#include <string>

#include "item_tree/item_tree.hpp"

// Entities with optional metadata (data fields, graph curves and graph models)
// describe every metadata item once in a table of fields. The same table
// resolves the defaults when the entity is built, reads the optional values
// from an item tree object and writes the resolved values back.
namespace Metadata {

// A scalar item. `input` is the optional value on the user facing metadata
// struct and `value` the resolved value on the entity.
template <typename Meta, typename Entity, typename T>
struct Field {
    const char *name;
    std::optional<T> Meta::*input;
    T Entity::*value;
    T default_value;
};

// A physical unit, stored as a nested GwySIUnit object. Units default to the
// empty (dimensionless) unit.
template <typename Meta, typename Entity>
struct UnitField {
    const char *name;
    std::optional<std::string> Meta::*input;
    std::string Entity::*value;
};

template <typename Meta, typename Entity, typename T>
void resolve(const Field<Meta, Entity, T> &field, const Meta &meta,
             Entity *entity) {
    entity->*field.value = (meta.*field.input).value_or(field.default_value);
}

template <typename Meta, typename Entity>
void resolve(const UnitField<Meta, Entity> &field, const Meta &meta,
             Entity *entity) {
    entity->*field.value = (meta.*field.input).value_or("");
}

template <typename Meta, typename Entity, typename T>
void read(const Field<Meta, Entity, T> &field, const ItemTree::Object &object,
          Meta *meta) {
    meta->*field.input = ItemTree::get<T>(object, field.name);
}

template <typename Meta, typename Entity>
void read(const UnitField<Meta, Entity> &field, const ItemTree::Object &object,
          Meta *meta) {
    // Only units that are actually stored are forwarded, the rest is left to
    // the defaults.
    if (ItemTree::get_object(object, field.name) != nullptr) {
        meta->*field.input = ItemTree::get_si_unit(object, field.name);
    }
}

template <typename Meta, typename Entity, typename T>
void write(const Field<Meta, Entity, T> &field, const Entity &entity,
           ItemTree::Object *object) {
    ItemTree::insert_item(ItemTree::new_item<T>(field.name, entity.*field.value),
                          object);
}

template <typename Meta, typename Entity>
void write(const UnitField<Meta, Entity> &field, const Entity &entity,
           ItemTree::Object *object) {
    ItemTree::insert_item(
        ItemTree::new_si_unit_item(field.name, entity.*field.value), object);
}

// Apply the operations above over a whole table.
template <typename Table, typename Meta, typename Entity>
void resolve_all(const Table &table, const Meta &meta, Entity *entity) {
    for (const auto &field : table) {
        resolve(field, meta, entity);
    }
}

template <typename Table, typename Meta>
void read_all(const Table &table, const ItemTree::Object &object, Meta *meta) {
    for (const auto &field : table) {
        read(field, object, meta);
    }
}

template <typename Table, typename Entity>
void write_all(const Table &table, const Entity &entity,
               ItemTree::Object *object) {
    for (const auto &field : table) {
        write(field, entity, object);
    }
}

}  // namespace Metadata

#endif /* UTILS_METADATA_HPP */
