#include <sstream>

#include "item_tree/item_tree.hpp"
#include "path_key/path_key.hpp"
#include "utils/error.hpp"

std::string ItemTree::ItemType::to_string(Type type) {
    switch (type) {
        case BOOL:
            return "boolean";
        case INT32:
            return "int32";
        case DOUBLE:
            return "double";
        case STRING:
            return "string";
        case OBJECT:
            return "object";
        case DOUBLE_ARRAY:
            return "double array";
        case OBJECT_ARRAY:
            return "object array";
    }
    return "unknown";
}

ItemTree::Item::Item(std::string name, Value value)
    : m_name(std::move(name)), m_value(std::move(value)) {}

ItemTree::Item::~Item() = default;
ItemTree::Item::Item(Item &&other) noexcept = default;
ItemTree::Item &ItemTree::Item::operator=(Item &&other) noexcept = default;

ItemTree::ItemType::Type ItemTree::Item::type() const {
    // The order matches the alternatives of ItemTree::Value.
    static const ItemType::Type types[] = {
        ItemType::BOOL,   ItemType::INT32,        ItemType::DOUBLE,
        ItemType::STRING, ItemType::OBJECT,       ItemType::DOUBLE_ARRAY,
        ItemType::OBJECT_ARRAY,
    };
    return types[m_value.index()];
}

ItemTree::Object::Object(std::string name) : m_name(std::move(name)) {}

bool ItemTree::Object::add(Item item) {
    if (m_index.count(item.name()) != 0) {
        return false;
    }
    m_index[item.name()] = m_items.size();
    m_items.push_back(std::move(item));
    return true;
}

const ItemTree::Item *ItemTree::Object::get(const std::string &name) const {
    auto it = m_index.find(name);
    if (it == m_index.end()) {
        return nullptr;
    }
    return &m_items[it->second];
}

namespace {
// Find the item with the given name and ensure it has the expected type. Items
// that don't exist return nullptr.
const ItemTree::Item *find_typed(const ItemTree::Object &object,
                                 const std::string &name,
                                 ItemTree::ItemType::Type expected) {
    const ItemTree::Item *item = object.get(name);
    if (item == nullptr) {
        return nullptr;
    }
    if (item->type() != expected) {
        std::ostringstream error_stream;
        error_stream << "expected " << ItemTree::ItemType::to_string(expected)
                     << " item, found "
                     << ItemTree::ItemType::to_string(item->type());
        throw Error::TypeMismatch(name, error_stream.str());
    }
    return item;
}

template <typename T>
std::optional<T> get_scalar(const ItemTree::Object &object,
                            const std::string &name,
                            ItemTree::ItemType::Type expected) {
    const ItemTree::Item *item = find_typed(object, name, expected);
    if (item == nullptr) {
        return std::nullopt;
    }
    return std::get<T>(item->value());
}
}  // namespace

template <>
std::optional<bool> ItemTree::get<bool>(const Object &object,
                                        const std::string &name) {
    return get_scalar<bool>(object, name, ItemType::BOOL);
}

template <>
std::optional<int32_t> ItemTree::get<int32_t>(const Object &object,
                                              const std::string &name) {
    return get_scalar<int32_t>(object, name, ItemType::INT32);
}

template <>
std::optional<double> ItemTree::get<double>(const Object &object,
                                            const std::string &name) {
    return get_scalar<double>(object, name, ItemType::DOUBLE);
}

template <>
std::optional<std::string> ItemTree::get<std::string>(
    const Object &object, const std::string &name) {
    return get_scalar<std::string>(object, name, ItemType::STRING);
}

const ItemTree::Object *ItemTree::get_object(const Object &object,
                                             const std::string &name) {
    const Item *item = find_typed(object, name, ItemType::OBJECT);
    if (item == nullptr) {
        return nullptr;
    }
    const Object *nested = std::get<ObjectRef>(item->value()).object;
    if (nested == nullptr) {
        throw Error::TypeMismatch(name,
                                  "expected object item, found null object");
    }
    return nested;
}

const std::vector<double> *ItemTree::get_double_array(
    const Object &object, const std::string &name) {
    const Item *item = find_typed(object, name, ItemType::DOUBLE_ARRAY);
    if (item == nullptr) {
        return nullptr;
    }
    return &std::get<std::vector<double>>(item->value());
}

const ItemTree::ObjectArray *ItemTree::get_object_array(
    const Object &object, const std::string &name) {
    const Item *item = find_typed(object, name, ItemType::OBJECT_ARRAY);
    if (item == nullptr) {
        return nullptr;
    }
    return &std::get<ObjectArray>(item->value());
}

std::string ItemTree::get_si_unit(const Object &object,
                                  const std::string &name) {
    const Object *unit = get_object(object, name);
    if (unit == nullptr) {
        return "";
    }
    try {
        return get<std::string>(*unit, "unitstr").value_or("");
    } catch (const Error::TypeMismatch &e) {
        throw e.within(name);
    }
}

template <>
ItemTree::Item ItemTree::new_item<bool>(const std::string &name, bool value) {
    return Item(name, Value(std::in_place_type<bool>, value));
}

template <>
ItemTree::Item ItemTree::new_item<int32_t>(const std::string &name,
                                           int32_t value) {
    return Item(name, Value(std::in_place_type<int32_t>, value));
}

template <>
ItemTree::Item ItemTree::new_item<double>(const std::string &name,
                                          double value) {
    return Item(name, Value(std::in_place_type<double>, value));
}

template <>
ItemTree::Item ItemTree::new_item<std::string>(const std::string &name,
                                               std::string value) {
    return Item(name, Value(std::in_place_type<std::string>, std::move(value)));
}

ItemTree::Item ItemTree::new_object_item(const std::string &name,
                                         std::unique_ptr<Object> object) {
    ObjectRef ref;
    ref.object = object.get();
    ref.owned = std::move(object);
    return Item(name, Value(std::in_place_type<ObjectRef>, std::move(ref)));
}

ItemTree::Item ItemTree::new_borrowed_object_item(const std::string &name,
                                                  Object *object) {
    ObjectRef ref;
    ref.object = object;
    return Item(name, Value(std::in_place_type<ObjectRef>, std::move(ref)));
}

ItemTree::Item ItemTree::new_double_array_item(const std::string &name,
                                               std::vector<double> data) {
    return Item(name,
                Value(std::in_place_type<std::vector<double>>, std::move(data)));
}

ItemTree::Item ItemTree::new_object_array_item(const std::string &name,
                                               ObjectArray objects) {
    return Item(name, Value(std::in_place_type<ObjectArray>, std::move(objects)));
}

ItemTree::Item ItemTree::new_si_unit_item(const std::string &name,
                                          const std::string &unitstr) {
    auto unit = std::make_unique<Object>("GwySIUnit");
    unit->add(new_item<std::string>("unitstr", unitstr));
    return new_object_item(name, std::move(unit));
}

bool ItemTree::add_item(Item item, Object *object) {
    return object->add(std::move(item));
}

void ItemTree::insert_item(Item item, Object *object) {
    std::string name = item.name();
    if (!add_item(std::move(item), object)) {
        std::ostringstream error_stream;
        error_stream << "can't add item to " << object->name()
                     << ", the name is already in use";
        throw Error::StoreError(name, error_stream.str());
    }
}

std::vector<int32_t> ItemTree::enumerate_channel_ids(const Object &tree) {
    std::vector<int32_t> ids;
    for (const auto &item : tree.items()) {
        if (auto id = PathKey::parse_channel_id(item.name())) {
            ids.push_back(id.value());
        }
    }
    return ids;
}

std::vector<int32_t> ItemTree::enumerate_graph_ids(const Object &tree) {
    std::vector<int32_t> ids;
    for (const auto &item : tree.items()) {
        if (auto id = PathKey::parse_graph_id(item.name())) {
            ids.push_back(id.value());
        }
    }
    return ids;
}
