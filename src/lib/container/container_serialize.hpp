#ifndef CONTAINER_CONTAINERSERIALIZE_HPP
#define CONTAINER_CONTAINERSERIALIZE_HPP

#include <string>

#include "container/container.hpp"
#include "container/retention.hpp"
#include "item_tree/item_tree.hpp"

namespace Container::Serialize {

// Decode a "GwyContainer" tree. Channels and graphs are read with the ids
// enumerated from the tree, in item order. Throws Error::MalformedField if the
// root object is not a container.
Container read_container(const ItemTree::Object &tree,
                         const ReadParams &params = {},
                         ReadReport *report = nullptr);

// Encode the container in a new tree. Channels are numbered from 0 and graphs
// from 1, regardless of the ids they were read with. The graph objects are
// retained in the given table until the returned tree is closed.
Tree write_container(const Container &container,
                     RetentionTable *table = &retention_table());

Container read_file(const std::string &path, ItemTree::FileStore *store,
                    const ReadParams &params = {},
                    ReadReport *report = nullptr);

// Write the container to the given path, or to the container filename if the
// path is empty. The absolute path of the file is stored in the tree.
void write_file(const Container &container, const std::string &path,
                ItemTree::FileStore *store);

}  // namespace Container::Serialize

#endif /* CONTAINER_CONTAINERSERIALIZE_HPP */
