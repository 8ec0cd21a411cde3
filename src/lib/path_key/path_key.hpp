#ifndef PATHKEY_PATHKEY_HPP
#define PATHKEY_PATHKEY_HPP

#include <cstdint>
#include <optional>
#include <string>

// The item names used by the Gwyddion container to locate every entity. The
// channel ids are 0-based while graph ids are 1-based, and all graphs are
// stored under the first channel prefix.
namespace PathKey {

std::string data(int32_t channel_id);
std::string title(int32_t channel_id);
std::string visible(int32_t channel_id);

// Presentation of the channel data.
std::string palette(int32_t channel_id);
std::string range_type(int32_t channel_id);
std::string range_min(int32_t channel_id);
std::string range_max(int32_t channel_id);

// Mask data field and its colour components. The component is one of "red",
// "green", "blue" or "alpha".
std::string mask(int32_t channel_id);
std::string mask_color(int32_t channel_id, const std::string &component);

std::string show(int32_t channel_id);

// The kind is one of "point", "pointer", "line", "rectangle" or "ellipse".
std::string selection(int32_t channel_id, const std::string &kind);

std::string graph(int32_t graph_id);
std::string graph_visible(int32_t graph_id);

std::string filename();

// Name of a field nested inside the item at the given path, used to locate
// errors. An empty parent yields the field name itself.
std::string join(const std::string &parent, const std::string &field);

// Extract the id from a "/N/data" or "/0/graph/graph/N" key respectively.
// Any other key, including the subkeys of those entities, returns nullopt.
std::optional<int32_t> parse_channel_id(const std::string &key);
std::optional<int32_t> parse_graph_id(const std::string &key);

}  // namespace PathKey

#endif /* PATHKEY_PATHKEY_HPP */
