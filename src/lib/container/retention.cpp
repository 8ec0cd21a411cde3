#include <stdexcept>

#include "container/retention.hpp"

ItemTree::Object *Container::RetentionTable::retain(
    const ItemTree::Object *tree, std::unique_ptr<ItemTree::Object> object) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ItemTree::Object *retained = object.get();
    m_entries[tree].push_back(std::move(object));
    return retained;
}

void Container::RetentionTable::release(const ItemTree::Object *tree) {
    std::vector<std::unique_ptr<ItemTree::Object>> objects;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(tree);
        if (it == m_entries.end()) {
            return;
        }
        objects = std::move(it->second);
        m_entries.erase(it);
    }
    // The objects are destroyed here, outside of the lock.
}

size_t Container::RetentionTable::retained(const ItemTree::Object *tree) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(tree);
    if (it == m_entries.end()) {
        return 0;
    }
    return it->second.size();
}

size_t Container::RetentionTable::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

Container::RetentionTable &Container::retention_table() {
    static RetentionTable table;
    return table;
}

Container::Tree::Tree(std::unique_ptr<ItemTree::Object> root,
                      RetentionTable *table)
    : m_root(std::move(root)), m_table(table) {}

Container::Tree::~Tree() { close(); }

Container::Tree::Tree(Tree &&other) noexcept
    : m_root(std::move(other.m_root)), m_table(other.m_table) {}

Container::Tree &Container::Tree::operator=(Tree &&other) noexcept {
    if (this != &other) {
        close();
        m_root = std::move(other.m_root);
        m_table = other.m_table;
    }
    return *this;
}

ItemTree::Object &Container::Tree::root() {
    if (m_root == nullptr) {
        throw std::logic_error("the item tree was closed");
    }
    return *m_root;
}

const ItemTree::Object &Container::Tree::root() const {
    if (m_root == nullptr) {
        throw std::logic_error("the item tree was closed");
    }
    return *m_root;
}

void Container::Tree::close() {
    if (m_root == nullptr) {
        return;
    }
    // Release before destroying the root, the address is the table key.
    m_table->release(m_root.get());
    m_root.reset();
}
