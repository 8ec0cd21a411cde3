#include <sstream>

#include "channel/channel_serialize.hpp"
#include "datafield/datafield_serialize.hpp"
#include "path_key/path_key.hpp"
#include "selection/selection_serialize.hpp"
#include "utils/error.hpp"

namespace {
struct MaskColor {
    const char *component;
    std::optional<double> Channel::Channel::*value;
};

const MaskColor mask_colors[] = {
    {"red", &Channel::Channel::mask_red},
    {"green", &Channel::Channel::mask_green},
    {"blue", &Channel::Channel::mask_blue},
    {"alpha", &Channel::Channel::mask_alpha},
};

std::optional<DataField::DataField> read_optional_datafield(
    const ItemTree::Object &tree, const std::string &path) {
    const ItemTree::Object *object = ItemTree::get_object(tree, path);
    if (object == nullptr) {
        return std::nullopt;
    }
    return DataField::Serialize::read_datafield(*object, path);
}

template <typename S, typename Reader>
void read_selection_slot(const ItemTree::Object &tree, int32_t id,
                         Reader reader, std::optional<S> *slot) {
    std::string path =
        PathKey::selection(id, Selection::kind_info(S::kind).key);
    const ItemTree::Object *object = ItemTree::get_object(tree, path);
    if (object != nullptr) {
        *slot = reader(*object, path);
    }
}

template <typename S>
void write_selection_slot(const std::optional<S> &slot, int32_t id,
                          ItemTree::Object *tree) {
    if (!slot) {
        return;
    }
    ItemTree::insert_item(
        ItemTree::new_object_item(
            PathKey::selection(id, Selection::kind_info(S::kind).key),
            Selection::Serialize::write_selection(slot.value())),
        tree);
}
}  // namespace

Channel::Channel Channel::Serialize::read_channel(const ItemTree::Object &tree,
                                                  int32_t id) {
    std::string data_path = PathKey::data(id);
    const ItemTree::Object *data_object = ItemTree::get_object(tree, data_path);
    if (data_object == nullptr) {
        std::ostringstream error_stream;
        error_stream << "channel with id " << id << " is not found";
        throw Error::MissingRequiredField(data_path, error_stream.str());
    }
    auto title = ItemTree::get<std::string>(tree, PathKey::title(id));
    if (!title) {
        throw Error::MissingRequiredField(PathKey::title(id));
    }

    Channel channel = {};
    channel.title = title.value();
    channel.data = DataField::Serialize::read_datafield(*data_object, data_path);
    channel.visible =
        ItemTree::get<bool>(tree, PathKey::visible(id)).value_or(false);

    channel.palette = ItemTree::get<std::string>(tree, PathKey::palette(id));
    channel.range_type = ItemTree::get<int32_t>(tree, PathKey::range_type(id));
    channel.range_min = ItemTree::get<double>(tree, PathKey::range_min(id));
    channel.range_max = ItemTree::get<double>(tree, PathKey::range_max(id));

    channel.mask = read_optional_datafield(tree, PathKey::mask(id));
    for (const auto &color : mask_colors) {
        channel.*color.value = ItemTree::get<double>(
            tree, PathKey::mask_color(id, color.component));
    }
    channel.show = read_optional_datafield(tree, PathKey::show(id));

    read_selection_slot(tree, id, Selection::Serialize::read_point_selection,
                        &channel.point_selections);
    read_selection_slot(tree, id, Selection::Serialize::read_pointer_selection,
                        &channel.pointer_selections);
    read_selection_slot(tree, id, Selection::Serialize::read_line_selection,
                        &channel.line_selections);
    read_selection_slot(tree, id,
                        Selection::Serialize::read_rectangle_selection,
                        &channel.rectangle_selections);
    read_selection_slot(tree, id, Selection::Serialize::read_ellipse_selection,
                        &channel.ellipse_selections);
    return channel;
}

void Channel::Serialize::write_channel(const Channel &channel, int32_t id,
                                       ItemTree::Object *tree) {
    ItemTree::insert_item(
        ItemTree::new_object_item(
            PathKey::data(id),
            DataField::Serialize::write_datafield(channel.data)),
        tree);
    ItemTree::insert_item(
        ItemTree::new_item<std::string>(PathKey::title(id), channel.title),
        tree);
    ItemTree::insert_item(
        ItemTree::new_item<bool>(PathKey::visible(id), channel.visible), tree);

    if (channel.palette) {
        ItemTree::insert_item(ItemTree::new_item<std::string>(
                                  PathKey::palette(id), channel.palette.value()),
                              tree);
    }
    if (channel.range_type) {
        ItemTree::insert_item(
            ItemTree::new_item<int32_t>(PathKey::range_type(id),
                                        channel.range_type.value()),
            tree);
    }
    if (channel.range_min) {
        ItemTree::insert_item(
            ItemTree::new_item<double>(PathKey::range_min(id),
                                       channel.range_min.value()),
            tree);
    }
    if (channel.range_max) {
        ItemTree::insert_item(
            ItemTree::new_item<double>(PathKey::range_max(id),
                                       channel.range_max.value()),
            tree);
    }

    if (channel.mask) {
        ItemTree::insert_item(
            ItemTree::new_object_item(
                PathKey::mask(id),
                DataField::Serialize::write_datafield(channel.mask.value())),
            tree);
    }
    for (const auto &color : mask_colors) {
        const std::optional<double> &value = channel.*color.value;
        if (value) {
            ItemTree::insert_item(
                ItemTree::new_item<double>(
                    PathKey::mask_color(id, color.component), value.value()),
                tree);
        }
    }
    if (channel.show) {
        ItemTree::insert_item(
            ItemTree::new_object_item(
                PathKey::show(id),
                DataField::Serialize::write_datafield(channel.show.value())),
            tree);
    }

    write_selection_slot(channel.point_selections, id, tree);
    write_selection_slot(channel.pointer_selections, id, tree);
    write_selection_slot(channel.line_selections, id, tree);
    write_selection_slot(channel.rectangle_selections, id, tree);
    write_selection_slot(channel.ellipse_selections, id, tree);
}
