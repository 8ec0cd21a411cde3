#ifndef DATAFIELD_DATAFIELDSERIALIZE_HPP
#define DATAFIELD_DATAFIELDSERIALIZE_HPP

#include <memory>
#include <string>

#include "datafield/datafield.hpp"
#include "item_tree/item_tree.hpp"

// This namespace contains the functions to convert a DataField to and from
// its "GwyDataField" item tree representation.
namespace DataField::Serialize {

// The path is the location of the object in the tree and is only used for
// error reporting.
DataField read_datafield(const ItemTree::Object &object,
                         const std::string &path = "");
std::unique_ptr<ItemTree::Object> write_datafield(const DataField &datafield);

}  // namespace DataField::Serialize

#endif /* DATAFIELD_DATAFIELDSERIALIZE_HPP */
