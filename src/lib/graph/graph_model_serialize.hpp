#ifndef GRAPH_GRAPHMODELSERIALIZE_HPP
#define GRAPH_GRAPHMODELSERIALIZE_HPP

#include <memory>
#include <string>

#include "graph/graph_model.hpp"
#include "item_tree/item_tree.hpp"

// Conversion of a GraphModel to and from its "GwyGraphModel" object. The
// visibility flag lives outside of the graph object and is handled by the
// container serialization.
namespace GraphModel::Serialize {

// A curve that can't be decoded fails the whole graph.
GraphModel read_graph_model(const ItemTree::Object &object,
                            const std::string &path = "");
std::unique_ptr<ItemTree::Object> write_graph_model(const GraphModel &graph);

}  // namespace GraphModel::Serialize

#endif /* GRAPH_GRAPHMODELSERIALIZE_HPP */
