#ifndef SELECTION_SELECTION_HPP
#define SELECTION_SELECTION_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "utils/error.hpp"

// User selections drawn over a channel. Point and pointer selections are lists
// of single points, while line, rectangle and ellipse selections are lists of
// point pairs (the end points, or the opposite corners of the bounding box).
namespace Selection {

namespace Kind {
enum Type : uint8_t {
    POINT = 0,
    POINTER = 1,
    LINE = 2,
    RECTANGLE = 3,
    ELLIPSE = 4,
};
}  // namespace Kind

struct KindInfo {
    // Name used in the "/N/select/<key>" item path.
    const char *key;
    // Type name of the stored selection object.
    const char *object_name;
    // Number of points that form a single selected shape.
    size_t points_per_instance;
};
const KindInfo &kind_info(Kind::Type kind);

struct Point {
    double x;
    double y;
};

using PointPair = std::pair<Point, Point>;

template <typename Instance>
struct InstanceSize;
template <>
struct InstanceSize<Point> {
    static constexpr size_t value = 1;
};
template <>
struct InstanceSize<PointPair> {
    static constexpr size_t value = 2;
};

// A non-empty list of selected shapes. An absent selection is represented by
// an empty slot on the channel, never by an empty list.
template <Kind::Type K, typename Instance>
class Selection {
   public:
    static constexpr Kind::Type kind = K;
    static constexpr size_t points_per_instance = InstanceSize<Instance>::value;
    using instance_type = Instance;

    // Throws Error::EmptySelection if no instances are given.
    explicit Selection(std::vector<Instance> instances)
        : m_instances(std::move(instances)) {
        if (m_instances.empty()) {
            throw Error::EmptySelection(kind_info(K).key);
        }
    }

    const std::vector<Instance> &instances() const { return m_instances; }
    size_t size() const { return m_instances.size(); }

   private:
    std::vector<Instance> m_instances;
};

using PointSelection = Selection<Kind::POINT, Point>;
using PointerSelection = Selection<Kind::POINTER, Point>;
using LineSelection = Selection<Kind::LINE, PointPair>;
using RectangleSelection = Selection<Kind::RECTANGLE, PointPair>;
using EllipseSelection = Selection<Kind::ELLIPSE, PointPair>;

// Conversion between the shapes and the flat coordinate buffer
// [x0, y0, x1, y1, ...] used by the selection objects.
std::vector<double> flatten(const std::vector<Point> &points);
std::vector<double> flatten(const std::vector<PointPair> &pairs);

// The buffer length must be even.
std::vector<Point> to_points(const std::vector<double> &coordinates);

// Consecutive points form a pair: (p0, p1), (p2, p3), ... The number of points
// must be even.
std::vector<PointPair> to_pairs(const std::vector<Point> &points);

}  // namespace Selection

#endif /* SELECTION_SELECTION_HPP */
