#ifndef SNOWFLAKE_GEOMETRY_WEDGE_HPP
#define SNOWFLAKE_GEOMETRY_WEDGE_HPP

#include <math/vec2.hpp>

namespace snowflake {

// Shape of the drawing sector. Angles are measured clockwise from straight up.
struct WedgeConfig {
    Vec2 center{500.0, 500.0};
    double radius = 400.0;
    double span_degrees = 30.0;
};

// Which boundary a clipped segment was cut against
enum class WedgeBoundary {
    None,       // end point was already inside
    Arc,        // the outer circle
    StartRay,   // the 0 degree edge
    EndRay      // the span_degrees edge
};

struct ClipResult {
    Vec2 point;
    WedgeBoundary boundary = WedgeBoundary::None;
    bool fallback = false;  // no valid crossing, point is the unclipped end
};

// The fundamental domain of the twelve-fold symmetry: a circular sector.
// Stateless apart from its configuration.
class Wedge {
public:
    Wedge() = default;
    explicit Wedge(const WedgeConfig& config) : config_(config) {}

    const WedgeConfig& config() const { return config_; }
    const Vec2& center() const { return config_.center; }
    double radius() const { return config_.radius; }
    double span_degrees() const { return config_.span_degrees; }

    // Angle of p around the center in degrees, 0 = up, clockwise, in [0, 360)
    double angle_of(const Vec2& p) const;

    // Boundary-inclusive containment. The apex itself is inside.
    bool contains(const Vec2& p) const;

    // Clip the segment start->end (start inside) to the wedge boundary.
    // Returns the crossing closest to start, or end itself when end is inside
    // or no valid crossing exists (reported through ClipResult::fallback).
    ClipResult clip_segment(const Vec2& start, const Vec2& end) const;

    // Unit direction of the boundary ray at the given angle
    static Vec2 ray_direction(double angle_degrees);

private:
    WedgeConfig config_;
};

}  // namespace snowflake

#endif // SNOWFLAKE_GEOMETRY_WEDGE_HPP
