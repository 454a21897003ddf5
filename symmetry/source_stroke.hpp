#ifndef SNOWFLAKE_SYMMETRY_SOURCE_STROKE_HPP
#define SNOWFLAKE_SYMMETRY_SOURCE_STROKE_HPP

#include <geometry/path_data.hpp>
#include <geometry/stroke_synthesizer.hpp>
#include <math/vec2.hpp>
#include <cstdint>
#include <vector>

namespace snowflake {

using StrokeId = uint32_t;

// A stroke drawn inside the wedge. Replicas are derived from it.
struct SourceStroke {
    StrokeId id = 0;
    std::vector<Vec2> points;     // samples (simplified once finished)
    PathData path;                // curve through points
    double stroke_width = 2.0;
    StrokeMode mode = StrokeMode::Freehand;
};

}  // namespace snowflake

#endif // SNOWFLAKE_SYMMETRY_SOURCE_STROKE_HPP
