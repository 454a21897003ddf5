#include "cubic_bezier.hpp"

namespace snowflake {

CubicBezier::CubicBezier(const Vec2& p0, const Vec2& p1, const Vec2& p2, const Vec2& p3)
    : control_points{p0, p1, p2, p3} {}

Vec2 CubicBezier::evaluate(double t) const {
    double u = 1.0 - t;
    double tt = t * t;
    double uu = u * u;

    return control_points[0] * (uu * u) +
           control_points[1] * (3.0 * uu * t) +
           control_points[2] * (3.0 * u * tt) +
           control_points[3] * (tt * t);
}

std::vector<Vec2> CubicBezier::to_polyline(int samples) const {
    std::vector<Vec2> points;
    if (samples < 1) {
        samples = 1;
    }
    points.reserve(static_cast<size_t>(samples) + 1);
    points.push_back(control_points[0]);
    for (int i = 1; i < samples; ++i) {
        points.push_back(evaluate(static_cast<double>(i) / static_cast<double>(samples)));
    }
    points.push_back(control_points[3]);
    return points;
}

CubicBezier CubicBezier::from_hermite(const Vec2& p0, const Vec2& tangent0,
                                      const Vec2& p1, const Vec2& tangent1) {
    // P1 = P0 + T0/3, P2 = P3 - T1/3
    return CubicBezier(p0, p0 + tangent0 / 3.0, p1 - tangent1 / 3.0, p1);
}

CubicBezier CubicBezier::from_quadratic(const Vec2& p0, const Vec2& control, const Vec2& p1) {
    return CubicBezier(p0,
                       p0 + (control - p0) * (2.0 / 3.0),
                       p1 + (control - p1) * (2.0 / 3.0),
                       p1);
}

CubicBezier CubicBezier::from_catmull_rom(const Vec2& p0, const Vec2& p1,
                                          const Vec2& p2, const Vec2& p3) {
    // Catmull-Rom tangents are (p2 - p0) / 2 and (p3 - p1) / 2
    return from_hermite(p1, (p2 - p0) * 0.5, p2, (p3 - p1) * 0.5);
}

}  // namespace snowflake
