#include "stroke_synthesizer.hpp"
#include "distance.hpp"

namespace snowflake {

namespace {

void simplify_range(const std::vector<Vec2>& points, size_t first, size_t last,
                    double epsilon, std::vector<size_t>& kept) {
    double max_distance = 0.0;
    size_t max_index = first;

    for (size_t i = first + 1; i < last; ++i) {
        double d = perpendicular_distance(points[i], points[first], points[last]);
        if (d > max_distance) {
            max_distance = d;
            max_index = i;
        }
    }

    if (max_distance > epsilon) {
        simplify_range(points, first, max_index, epsilon, kept);
        kept.push_back(max_index);
        simplify_range(points, max_index, last, epsilon, kept);
    }
}

}  // namespace

std::vector<size_t> simplify_indices(const std::vector<Vec2>& points, double epsilon) {
    std::vector<size_t> kept;
    if (points.empty()) {
        return kept;
    }
    if (points.size() <= 2) {
        for (size_t i = 0; i < points.size(); ++i) {
            kept.push_back(i);
        }
        return kept;
    }

    kept.push_back(0);
    simplify_range(points, 0, points.size() - 1, epsilon, kept);
    kept.push_back(points.size() - 1);
    return kept;
}

std::vector<Vec2> simplify_path(const std::vector<Vec2>& points, double epsilon) {
    std::vector<Vec2> result;
    for (size_t index : simplify_indices(points, epsilon)) {
        result.push_back(points[index]);
    }
    return result;
}

std::vector<CubicBezier> catmull_rom_segments(const std::vector<Vec2>& points) {
    std::vector<CubicBezier> segments;
    if (points.size() < 2) {
        return segments;
    }

    segments.reserve(points.size() - 1);
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        const Vec2& p0 = i > 0 ? points[i - 1] : points[i];
        const Vec2& p1 = points[i];
        const Vec2& p2 = points[i + 1];
        const Vec2& p3 = i + 2 < points.size() ? points[i + 2] : points[i + 1];
        segments.push_back(CubicBezier::from_catmull_rom(p0, p1, p2, p3));
    }
    return segments;
}

PathData points_to_path(const std::vector<Vec2>& points) {
    PathData path;
    if (points.empty()) {
        return path;
    }

    path.move_to(points.front());

    if (points.size() == 1) {
        path.line_to(points.front());
        return path;
    }

    if (points.size() == 2) {
        path.line_to(points.back());
        return path;
    }

    for (const auto& segment : catmull_rom_segments(points)) {
        path.cubic_to(segment.control1(), segment.control2(), segment.end());
    }
    return path;
}

PathData straight_path(const Vec2& start, const Vec2& end) {
    PathData path;
    path.move_to(start);
    path.line_to(end);
    return path;
}

}  // namespace snowflake
