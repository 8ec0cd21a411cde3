#ifndef CHANNEL_CHANNEL_HPP
#define CHANNEL_CHANNEL_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "datafield/datafield.hpp"
#include "selection/selection.hpp"

// Mapping of the data values to the colour palette.
namespace RangeType {
enum Type : int32_t { FULL = 0, FIXED = 1, AUTO = 2, ADAPT = 3 };
}  // namespace RangeType

// A channel is a single image of the container: the measured data together
// with everything needed to display it.
namespace Channel {

struct Channel {
    std::string title;
    DataField::DataField data;
    bool visible = false;

    // Presentation of the data. The range type is one of RangeType, and the
    // range bounds are used with RangeType::FIXED.
    std::optional<std::string> palette;
    std::optional<int32_t> range_type;
    std::optional<double> range_min;
    std::optional<double> range_max;

    // Mask over the data and the colour used to draw it. Every colour
    // component is optional on its own.
    std::optional<DataField::DataField> mask;
    std::optional<double> mask_red;
    std::optional<double> mask_green;
    std::optional<double> mask_blue;
    std::optional<double> mask_alpha;

    // Processed data shown in place of the raw data.
    std::optional<DataField::DataField> show;

    std::optional<Selection::PointSelection> point_selections;
    std::optional<Selection::PointerSelection> pointer_selections;
    std::optional<Selection::LineSelection> line_selections;
    std::optional<Selection::RectangleSelection> rectangle_selections;
    std::optional<Selection::EllipseSelection> ellipse_selections;
};

}  // namespace Channel

#endif /* CHANNEL_CHANNEL_HPP */
