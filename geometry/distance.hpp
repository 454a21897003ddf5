#ifndef SNOWFLAKE_GEOMETRY_DISTANCE_HPP
#define SNOWFLAKE_GEOMETRY_DISTANCE_HPP

#include <math/vec2.hpp>
#include <cmath>

namespace snowflake {

// Distance from p to the infinite line through a and b.
// Degenerates to point-to-point distance when a == b.
inline double perpendicular_distance(const Vec2& p, const Vec2& a, const Vec2& b) {
    Vec2 d = b - a;
    if (d.x == 0.0 && d.y == 0.0) {
        return p.distance_to(a);
    }
    return std::abs(d.cross(p - a)) / d.length();
}

}  // namespace snowflake

#endif // SNOWFLAKE_GEOMETRY_DISTANCE_HPP
