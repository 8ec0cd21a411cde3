#include <regex>

#include "path_key/path_key.hpp"

namespace {
std::string channel_prefix(int32_t channel_id) {
    return "/" + std::to_string(channel_id);
}

std::optional<int32_t> parse_id(const std::string &key, const std::regex &re) {
    std::smatch match;
    if (!std::regex_match(key, match, re)) {
        return std::nullopt;
    }
    try {
        return std::stoi(match[1].str());
    } catch (const std::out_of_range &) {
        return std::nullopt;
    }
}
}  // namespace

std::string PathKey::data(int32_t channel_id) {
    return channel_prefix(channel_id) + "/data";
}

std::string PathKey::title(int32_t channel_id) {
    return channel_prefix(channel_id) + "/data/title";
}

std::string PathKey::visible(int32_t channel_id) {
    return channel_prefix(channel_id) + "/data/visible";
}

std::string PathKey::palette(int32_t channel_id) {
    return channel_prefix(channel_id) + "/base/palette";
}

std::string PathKey::range_type(int32_t channel_id) {
    return channel_prefix(channel_id) + "/base/range-type";
}

std::string PathKey::range_min(int32_t channel_id) {
    return channel_prefix(channel_id) + "/base/min";
}

std::string PathKey::range_max(int32_t channel_id) {
    return channel_prefix(channel_id) + "/base/max";
}

std::string PathKey::mask(int32_t channel_id) {
    return channel_prefix(channel_id) + "/mask";
}

std::string PathKey::mask_color(int32_t channel_id,
                                const std::string &component) {
    return channel_prefix(channel_id) + "/mask/" + component;
}

std::string PathKey::show(int32_t channel_id) {
    return channel_prefix(channel_id) + "/show";
}

std::string PathKey::selection(int32_t channel_id, const std::string &kind) {
    return channel_prefix(channel_id) + "/select/" + kind;
}

std::string PathKey::graph(int32_t graph_id) {
    return "/0/graph/graph/" + std::to_string(graph_id);
}

std::string PathKey::graph_visible(int32_t graph_id) {
    return graph(graph_id) + "/visible";
}

std::string PathKey::filename() { return "/filename"; }

std::string PathKey::join(const std::string &parent, const std::string &field) {
    if (parent.empty()) {
        return field;
    }
    return parent + "/" + field;
}

std::optional<int32_t> PathKey::parse_channel_id(const std::string &key) {
    static const std::regex re("^/([0-9]+)/data$");
    return parse_id(key, re);
}

std::optional<int32_t> PathKey::parse_graph_id(const std::string &key) {
    static const std::regex re("^/0/graph/graph/([0-9]+)$");
    return parse_id(key, re);
}
