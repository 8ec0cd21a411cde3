#ifndef CONTAINER_CONTAINER_HPP
#define CONTAINER_CONTAINER_HPP

#include <optional>
#include <string>
#include <vector>

#include "channel/channel.hpp"
#include "graph/graph_model.hpp"

namespace Container {

// The content of a Gwyddion file. Channel ids are the positions in the channel
// list, graph ids the positions in the graph list plus one.
struct Container {
    std::vector<Channel::Channel> channels;
    std::vector<GraphModel::GraphModel> graphs;

    // Base name of the file the container was read from.
    std::optional<std::string> filename;
};

// Options for reading containers. By default channels and graphs that can't
// be decoded are skipped with a warning on std::cerr. In strict mode the first
// error is rethrown instead.
struct ReadParams {
    bool strict = false;
    bool verbose = true;
};

// The entities skipped while reading a container.
struct ReadReport {
    std::vector<int32_t> skipped_channels;
    std::vector<int32_t> skipped_graphs;
    std::vector<std::string> errors;
};

}  // namespace Container

#endif /* CONTAINER_CONTAINER_HPP */
