#ifndef SNOWFLAKE_GEOMETRY_STROKE_SYNTHESIZER_HPP
#define SNOWFLAKE_GEOMETRY_STROKE_SYNTHESIZER_HPP

#include "path_data.hpp"
#include "cubic_bezier.hpp"
#include <math/vec2.hpp>
#include <vector>

namespace snowflake {

enum class StrokeMode {
    Freehand,   // smoothed curve through every sample
    Line        // straight segment from press to release
};

struct StrokeConfig {
    double simplify_epsilon = 2.0;   // max deviation kept by simplification
    double stroke_width = 2.0;       // on-screen width of new strokes
    StrokeMode mode = StrokeMode::Freehand;
};

// Ramer-Douglas-Peucker: indices of the points kept, always including the
// first and the last. Inputs of one or two points are returned whole.
std::vector<size_t> simplify_indices(const std::vector<Vec2>& points, double epsilon);

// Ramer-Douglas-Peucker simplification of a sampled polyline
std::vector<Vec2> simplify_path(const std::vector<Vec2>& points, double epsilon);

// Cubic spans of a uniform Catmull-Rom spline through all points. The end
// points are duplicated as their own neighbours.
std::vector<CubicBezier> catmull_rom_segments(const std::vector<Vec2>& points);

// Smooth path through all points:
//   0 points -> empty
//   1 point  -> zero-length mark (M p L p)
//   2 points -> straight segment
//   more     -> one cubic per span, C1 at interior points
PathData points_to_path(const std::vector<Vec2>& points);

// Straight two-point path used by line mode
PathData straight_path(const Vec2& start, const Vec2& end);

}  // namespace snowflake

#endif // SNOWFLAKE_GEOMETRY_STROKE_SYNTHESIZER_HPP
