#ifndef SELECTION_SELECTIONSERIALIZE_HPP
#define SELECTION_SELECTIONSERIALIZE_HPP

#include <memory>
#include <optional>
#include <string>

#include "item_tree/item_tree.hpp"
#include "selection/selection.hpp"

// Conversion of selections to and from their "GwySelection*" objects. The
// number of selected shapes is inferred from the length of the "data"
// coordinate buffer. An object without coordinates is not a selection and
// reads as nullopt.
namespace Selection::Serialize {

std::optional<PointSelection> read_point_selection(
    const ItemTree::Object &object, const std::string &path = "");
std::optional<PointerSelection> read_pointer_selection(
    const ItemTree::Object &object, const std::string &path = "");
std::optional<LineSelection> read_line_selection(
    const ItemTree::Object &object, const std::string &path = "");
std::optional<RectangleSelection> read_rectangle_selection(
    const ItemTree::Object &object, const std::string &path = "");
std::optional<EllipseSelection> read_ellipse_selection(
    const ItemTree::Object &object, const std::string &path = "");

std::unique_ptr<ItemTree::Object> write_selection(
    const PointSelection &selection);
std::unique_ptr<ItemTree::Object> write_selection(
    const PointerSelection &selection);
std::unique_ptr<ItemTree::Object> write_selection(
    const LineSelection &selection);
std::unique_ptr<ItemTree::Object> write_selection(
    const RectangleSelection &selection);
std::unique_ptr<ItemTree::Object> write_selection(
    const EllipseSelection &selection);

}  // namespace Selection::Serialize

#endif /* SELECTION_SELECTIONSERIALIZE_HPP */
