#include "wedge.hpp"
#include <common/logging.hpp>
#include <cmath>
#include <limits>
#include <numbers>

namespace snowflake {

namespace {

// Rounding slack for points computed onto an edge, such as clip results
constexpr double kAngleTolerance = 1e-10;    // degrees
constexpr double kRadiusTolerance = 1e-11;
constexpr double kParallelTolerance = 1e-4;

double to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

// Intersection parameter of segment start + t*d with the ray
// origin + s*dir (s >= 0). Returns a negative value when there is none.
double intersect_ray(const Vec2& start, const Vec2& d,
                     const Vec2& origin, const Vec2& dir) {
    double det = d.x * dir.y - d.y * dir.x;
    if (std::abs(det) <= kParallelTolerance) {
        return -1.0;
    }

    Vec2 w = origin - start;
    double t = (w.x * dir.y - w.y * dir.x) / det;
    double s = (w.x * d.y - w.y * d.x) / det;
    if (s < 0.0) {
        return -1.0;
    }
    return t;
}

}  // namespace

Vec2 Wedge::ray_direction(double angle_degrees) {
    double a = to_radians(angle_degrees);
    return {std::sin(a), -std::cos(a)};
}

double Wedge::angle_of(const Vec2& p) const {
    double dx = p.x - config_.center.x;
    double dy = p.y - config_.center.y;
    double angle = std::atan2(dx, -dy) * 180.0 / std::numbers::pi;
    if (angle < 0.0) {
        angle += 360.0;
    }
    return angle;
}

bool Wedge::contains(const Vec2& p) const {
    double dist = p.distance_to(config_.center);
    if (dist > config_.radius + kRadiusTolerance) {
        return false;
    }
    if (dist == 0.0) {
        return true;
    }

    double angle = angle_of(p);
    // Points just left of the 0 degree edge come back as ~360
    if (angle > 360.0 - kAngleTolerance) {
        angle -= 360.0;
    }
    return angle >= -kAngleTolerance && angle <= config_.span_degrees + kAngleTolerance;
}

ClipResult Wedge::clip_segment(const Vec2& start, const Vec2& end) const {
    if (contains(end)) {
        return ClipResult{end, WedgeBoundary::None, false};
    }

    const Vec2& c = config_.center;
    Vec2 d = end - start;

    double min_t = std::numeric_limits<double>::infinity();
    WedgeBoundary boundary = WedgeBoundary::None;

    auto consider = [&](double t, WedgeBoundary which) {
        if (t > 0.0 && t < 1.0 && t < min_t) {
            min_t = t;
            boundary = which;
        }
    };

    // Outer circle: |start + t*d - c|^2 = r^2, exit root
    double a = d.length_squared();
    if (a > 0.0) {
        Vec2 f = start - c;
        double b = 2.0 * f.dot(d);
        double cc = f.length_squared() - config_.radius * config_.radius;
        double discriminant = b * b - 4.0 * a * cc;
        if (discriminant >= 0.0) {
            consider((-b + std::sqrt(discriminant)) / (2.0 * a), WedgeBoundary::Arc);
        }
    }

    consider(intersect_ray(start, d, c, ray_direction(0.0)), WedgeBoundary::StartRay);
    consider(intersect_ray(start, d, c, ray_direction(config_.span_degrees)),
             WedgeBoundary::EndRay);

    if (boundary == WedgeBoundary::None) {
        logging::get_logger()->debug(
            "Clip fallback: no wedge crossing for ({:.2f}, {:.2f}) -> ({:.2f}, {:.2f})",
            start.x, start.y, end.x, end.y);
        return ClipResult{end, WedgeBoundary::None, true};
    }

    return ClipResult{start + d * min_t, boundary, false};
}

}  // namespace snowflake
