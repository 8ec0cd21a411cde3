#ifndef CONTAINER_RETENTION_HPP
#define CONTAINER_RETENTION_HPP

#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "item_tree/item_tree.hpp"

namespace Container {

// Keeps nested objects alive for as long as the tree borrowing them exists.
// Entries are keyed by the address of the root object of the tree, so a tree
// must release its entry before the root object is destroyed.
class RetentionTable {
   public:
    // Take ownership of the object on behalf of the tree and return a pointer
    // suitable for a borrowed object item.
    ItemTree::Object *retain(const ItemTree::Object *tree,
                             std::unique_ptr<ItemTree::Object> object);

    // Destroy every object retained for the tree.
    void release(const ItemTree::Object *tree);

    // Number of objects retained for the tree.
    size_t retained(const ItemTree::Object *tree) const;

    // Number of trees with retained objects.
    size_t size() const;

   private:
    mutable std::mutex m_mutex;
    std::map<const ItemTree::Object *,
             std::vector<std::unique_ptr<ItemTree::Object>>>
        m_entries;
};

// Process wide table used by default when serializing containers.
RetentionTable &retention_table();

// Owning handle of a serialized container. Closing or destroying the handle
// destroys the tree and releases the objects retained for it.
class Tree {
   public:
    Tree(std::unique_ptr<ItemTree::Object> root, RetentionTable *table);
    ~Tree();
    Tree(Tree &&other) noexcept;
    Tree &operator=(Tree &&other) noexcept;
    Tree(const Tree &) = delete;
    Tree &operator=(const Tree &) = delete;

    // Throws std::logic_error if the tree was closed.
    ItemTree::Object &root();
    const ItemTree::Object &root() const;

    bool is_open() const { return m_root != nullptr; }
    void close();

   private:
    std::unique_ptr<ItemTree::Object> m_root;
    RetentionTable *m_table;
};

}  // namespace Container

#endif /* CONTAINER_RETENTION_HPP */
