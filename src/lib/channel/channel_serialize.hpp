#ifndef CHANNEL_CHANNELSERIALIZE_HPP
#define CHANNEL_CHANNELSERIALIZE_HPP

#include <cstdint>

#include "channel/channel.hpp"
#include "item_tree/item_tree.hpp"

// A channel is not stored as a single object but as a group of container
// items sharing the "/<id>/" prefix.
namespace Channel::Serialize {

// Read the channel with the given id from the container. Throws
// Error::MissingRequiredField if the data field or the title are missing.
Channel read_channel(const ItemTree::Object &tree, int32_t id);

// Add the items of the channel to the container. Optional members are only
// written when present.
void write_channel(const Channel &channel, int32_t id, ItemTree::Object *tree);

}  // namespace Channel::Serialize

#endif /* CHANNEL_CHANNELSERIALIZE_HPP */
