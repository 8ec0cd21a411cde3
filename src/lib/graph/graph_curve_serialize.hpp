#ifndef GRAPH_GRAPHCURVESERIALIZE_HPP
#define GRAPH_GRAPHCURVESERIALIZE_HPP

#include <memory>
#include <string>

#include "graph/graph_curve.hpp"
#include "item_tree/item_tree.hpp"

// Conversion of a GraphCurve to and from its "GwyGraphCurveModel" object.
namespace GraphCurve::Serialize {

GraphCurve read_graph_curve(const ItemTree::Object &object,
                            const std::string &path = "");
std::unique_ptr<ItemTree::Object> write_graph_curve(const GraphCurve &curve);

}  // namespace GraphCurve::Serialize

#endif /* GRAPH_GRAPHCURVESERIALIZE_HPP */
