#ifndef ITEMTREE_ITEMTREE_HPP
#define ITEMTREE_ITEMTREE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// In memory representation of the Gwyddion item tree. Every object has a type
// name ("GwyContainer", "GwyDataField", ...) and an ordered list of uniquely
// named items. Items of the top level container are named by their full path
// ("/0/data"), items of nested objects by their field name ("xres").
namespace ItemTree {

// The type of a stored item. The values match the type characters used by the
// Gwyddion file format.
namespace ItemType {
enum Type : char {
    BOOL = 'b',
    INT32 = 'i',
    DOUBLE = 'd',
    STRING = 's',
    OBJECT = 'o',
    DOUBLE_ARRAY = 'D',
    OBJECT_ARRAY = 'O',
};
std::string to_string(Type type);
}  // namespace ItemType

class Object;

// A nested object is either owned by the item or borrowed from somebody who
// guarantees it outlives the tree. `object` always points to the referenced
// object, `owned` is only set for the former.
struct ObjectRef {
    std::unique_ptr<Object> owned;
    Object *object = nullptr;
};

using ObjectArray = std::vector<std::unique_ptr<Object>>;

using Value = std::variant<bool, int32_t, double, std::string, ObjectRef,
                           std::vector<double>, ObjectArray>;

class Item {
   public:
    Item(std::string name, Value value);
    ~Item();
    Item(Item &&other) noexcept;
    Item &operator=(Item &&other) noexcept;
    Item(const Item &) = delete;
    Item &operator=(const Item &) = delete;

    const std::string &name() const { return m_name; }
    ItemType::Type type() const;
    const Value &value() const { return m_value; }

   private:
    std::string m_name;
    Value m_value;
};

class Object {
   public:
    explicit Object(std::string name);

    const std::string &name() const { return m_name; }

    // Append the item at the end of the object. Returns false and leaves the
    // object untouched if an item with the same name already exists.
    bool add(Item item);

    // Returns nullptr if no item with this name exists.
    const Item *get(const std::string &name) const;

    size_t size() const { return m_items.size(); }
    const std::vector<Item> &items() const { return m_items; }

   private:
    std::string m_name;
    std::vector<Item> m_items;
    std::map<std::string, size_t> m_index;
};

// Typed getters. An absent item yields nullopt (or nullptr for objects and
// arrays), while an item stored with a different type throws
// Error::TypeMismatch, as does an object item that doesn't reference any
// object. Errors carry the item name as their path.
template <typename T>
std::optional<T> get(const Object &object, const std::string &name);
template <>
std::optional<bool> get<bool>(const Object &object, const std::string &name);
template <>
std::optional<int32_t> get<int32_t>(const Object &object,
                                    const std::string &name);
template <>
std::optional<double> get<double>(const Object &object,
                                  const std::string &name);
template <>
std::optional<std::string> get<std::string>(const Object &object,
                                            const std::string &name);
const Object *get_object(const Object &object, const std::string &name);
const std::vector<double> *get_double_array(const Object &object,
                                            const std::string &name);
const ObjectArray *get_object_array(const Object &object,
                                    const std::string &name);

// Units are stored as nested "GwySIUnit" objects holding a "unitstr" string.
// A missing unit object or unit string reads as the empty string.
std::string get_si_unit(const Object &object, const std::string &name);

// Item constructors.
template <typename T>
Item new_item(const std::string &name, T value);
template <>
Item new_item<bool>(const std::string &name, bool value);
template <>
Item new_item<int32_t>(const std::string &name, int32_t value);
template <>
Item new_item<double>(const std::string &name, double value);
template <>
Item new_item<std::string>(const std::string &name, std::string value);
Item new_object_item(const std::string &name, std::unique_ptr<Object> object);
Item new_borrowed_object_item(const std::string &name, Object *object);
Item new_double_array_item(const std::string &name, std::vector<double> data);
Item new_object_array_item(const std::string &name, ObjectArray objects);
Item new_si_unit_item(const std::string &name, const std::string &unitstr);

// Returns false if the object already holds an item with the same name.
bool add_item(Item item, Object *object);

// Same as add_item, but a refused item throws Error::StoreError.
void insert_item(Item item, Object *object);

// Ids of the channels ("/N/data") and graphs ("/0/graph/graph/N") stored in
// the container, in item order.
std::vector<int32_t> enumerate_channel_ids(const Object &tree);
std::vector<int32_t> enumerate_graph_ids(const Object &tree);

// Access to item trees persisted on disk. The byte level format is handled by
// the implementations of this interface.
class FileStore {
   public:
    virtual ~FileStore() = default;

    // Load the top level object stored in the file. Failures are reported as
    // Error::StoreError.
    virtual std::unique_ptr<Object> read_file(const std::string &path) = 0;

    virtual void write_file(const Object &tree, const std::string &path) = 0;
};

}  // namespace ItemTree

#endif /* ITEMTREE_ITEMTREE_HPP */
