#include <stdexcept>

#include "selection/selection.hpp"

const Selection::KindInfo &Selection::kind_info(Kind::Type kind) {
    static const KindInfo kinds[] = {
        {"point", "GwySelectionPoint", 1},
        {"pointer", "GwySelectionPoint", 1},
        {"line", "GwySelectionLine", 2},
        {"rectangle", "GwySelectionRectangle", 2},
        {"ellipse", "GwySelectionEllipse", 2},
    };
    return kinds[kind];
}

std::vector<double> Selection::flatten(const std::vector<Point> &points) {
    std::vector<double> coordinates;
    coordinates.reserve(points.size() * 2);
    for (const auto &point : points) {
        coordinates.push_back(point.x);
        coordinates.push_back(point.y);
    }
    return coordinates;
}

std::vector<double> Selection::flatten(const std::vector<PointPair> &pairs) {
    std::vector<double> coordinates;
    coordinates.reserve(pairs.size() * 4);
    for (const auto &[first, second] : pairs) {
        coordinates.push_back(first.x);
        coordinates.push_back(first.y);
        coordinates.push_back(second.x);
        coordinates.push_back(second.y);
    }
    return coordinates;
}

std::vector<Selection::Point> Selection::to_points(
    const std::vector<double> &coordinates) {
    if (coordinates.size() % 2 != 0) {
        throw std::invalid_argument(
            "coordinate buffer must have an even number of values");
    }
    std::vector<Point> points;
    points.reserve(coordinates.size() / 2);
    for (size_t i = 0; i < coordinates.size(); i += 2) {
        points.push_back({coordinates[i], coordinates[i + 1]});
    }
    return points;
}

std::vector<Selection::PointPair> Selection::to_pairs(
    const std::vector<Point> &points) {
    if (points.size() % 2 != 0) {
        throw std::invalid_argument("can't pair an odd number of points");
    }
    std::vector<PointPair> pairs;
    pairs.reserve(points.size() / 2);
    for (size_t i = 0; i < points.size(); i += 2) {
        pairs.emplace_back(points[i], points[i + 1]);
    }
    return pairs;
}
