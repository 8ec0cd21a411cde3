#include <filesystem>
#include <iostream>
#include <sstream>

#include "channel/channel_serialize.hpp"
#include "container/container_serialize.hpp"
#include "graph/graph_model_serialize.hpp"
#include "path_key/path_key.hpp"
#include "utils/error.hpp"

namespace {
void skip_entity(const char *entity, int32_t id, const Error::DecodeError &e,
                 const Container::ReadParams &params,
                 std::vector<int32_t> *skipped,
                 Container::ReadReport *report) {
    if (params.strict) {
        throw;
    }
    std::ostringstream message_stream;
    message_stream << "skipping " << entity << " " << id << ": " << e.what();
    if (params.verbose) {
        std::cerr << "warning: " << message_stream.str() << std::endl;
    }
    if (report != nullptr) {
        skipped->push_back(id);
        report->errors.push_back(message_stream.str());
    }
}
}  // namespace

Container::Container Container::Serialize::read_container(
    const ItemTree::Object &tree, const ReadParams &params,
    ReadReport *report) {
    if (tree.name() != "GwyContainer") {
        throw Error::MalformedField(
            "", "expected GwyContainer object, found " + tree.name());
    }
    Container container;
    for (int32_t id : ItemTree::enumerate_channel_ids(tree)) {
        try {
            container.channels.push_back(Channel::Serialize::read_channel(tree, id));
        } catch (const Error::DecodeError &e) {
            skip_entity("channel", id, e, params,
                        report ? &report->skipped_channels : nullptr, report);
        }
    }
    for (int32_t id : ItemTree::enumerate_graph_ids(tree)) {
        std::string path = PathKey::graph(id);
        try {
            const ItemTree::Object *object = ItemTree::get_object(tree, path);
            GraphModel::GraphModel graph =
                GraphModel::Serialize::read_graph_model(*object, path);
            graph.visible = ItemTree::get<bool>(tree, PathKey::graph_visible(id))
                                .value_or(false);
            container.graphs.push_back(std::move(graph));
        } catch (const Error::DecodeError &e) {
            skip_entity("graph", id, e, params,
                        report ? &report->skipped_graphs : nullptr, report);
        }
    }
    if (auto filename = ItemTree::get<std::string>(tree, PathKey::filename())) {
        container.filename =
            std::filesystem::path(filename.value()).filename().string();
    }
    return container;
}

Container::Tree Container::Serialize::write_container(
    const Container &container, RetentionTable *table) {
    Tree tree(std::make_unique<ItemTree::Object>("GwyContainer"), table);
    ItemTree::Object *root = &tree.root();
    for (size_t i = 0; i < container.channels.size(); ++i) {
        Channel::Serialize::write_channel(container.channels[i],
                                          static_cast<int32_t>(i), root);
    }
    for (size_t i = 0; i < container.graphs.size(); ++i) {
        const auto &graph = container.graphs[i];
        int32_t id = static_cast<int32_t>(i) + 1;
        ItemTree::Object *object = table->retain(
            root, GraphModel::Serialize::write_graph_model(graph));
        ItemTree::insert_item(
            ItemTree::new_borrowed_object_item(PathKey::graph(id), object),
            root);
        ItemTree::insert_item(
            ItemTree::new_item<bool>(PathKey::graph_visible(id), graph.visible),
            root);
    }
    return tree;
}

Container::Container Container::Serialize::read_file(
    const std::string &path, ItemTree::FileStore *store,
    const ReadParams &params, ReadReport *report) {
    std::unique_ptr<ItemTree::Object> tree = store->read_file(path);
    if (tree == nullptr) {
        throw Error::StoreError(path, "the file store returned no tree");
    }
    return read_container(*tree, params, report);
}

void Container::Serialize::write_file(const Container &container,
                                      const std::string &path,
                                      ItemTree::FileStore *store) {
    std::string target = path;
    if (target.empty()) {
        if (!container.filename) {
            throw Error::StoreError("", "no file name to write the container to");
        }
        target = container.filename.value();
    }
    std::string absolute_path = std::filesystem::absolute(target).string();
    Tree tree = write_container(container);
    ItemTree::insert_item(
        ItemTree::new_item<std::string>(PathKey::filename(), absolute_path),
        &tree.root());
    store->write_file(tree.root(), absolute_path);
}
