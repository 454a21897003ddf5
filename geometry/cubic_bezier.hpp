#ifndef SNOWFLAKE_GEOMETRY_CUBIC_BEZIER_HPP
#define SNOWFLAKE_GEOMETRY_CUBIC_BEZIER_HPP

#include <math/vec2.hpp>
#include <array>
#include <vector>

namespace snowflake {

// A single cubic Bezier curve segment in the drawing plane
struct CubicBezier {
    std::array<Vec2, 4> control_points;

    CubicBezier() = default;
    CubicBezier(const Vec2& p0, const Vec2& p1, const Vec2& p2, const Vec2& p3);

    // Evaluate position at parameter t in [0, 1]
    Vec2 evaluate(double t) const;

    // Sample samples+1 points including both ends
    std::vector<Vec2> to_polyline(int samples) const;

    // Create from Hermite interpolation (positions and tangents at endpoints)
    static CubicBezier from_hermite(const Vec2& p0, const Vec2& tangent0,
                                    const Vec2& p1, const Vec2& tangent1);

    // Degree elevation of a quadratic segment (exact)
    static CubicBezier from_quadratic(const Vec2& p0, const Vec2& control, const Vec2& p1);

    // Uniform Catmull-Rom span p1->p2 with neighbours p0 and p3
    static CubicBezier from_catmull_rom(const Vec2& p0, const Vec2& p1,
                                        const Vec2& p2, const Vec2& p3);

    const Vec2& start() const { return control_points[0]; }
    const Vec2& control1() const { return control_points[1]; }
    const Vec2& control2() const { return control_points[2]; }
    const Vec2& end() const { return control_points[3]; }
};

}  // namespace snowflake

#endif // SNOWFLAKE_GEOMETRY_CUBIC_BEZIER_HPP
