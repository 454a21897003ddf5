#ifndef SNOWFLAKE_SNAPPING_ENDPOINT_SNAPPER_HPP
#define SNOWFLAKE_SNAPPING_ENDPOINT_SNAPPER_HPP

#include <math/vec2.hpp>
#include <chrono>
#include <optional>
#include <vector>

namespace snowflake {

struct SnapConfig {
    double threshold = 20.0;   // snap when strictly closer than this
    std::chrono::milliseconds start_indicator_duration{200};
    std::chrono::milliseconds finish_indicator_duration{300};
};

struct NearestEndpoint {
    Vec2 point;
    double distance = 0.0;
};

struct SnapResult {
    Vec2 point;              // endpoint when snapped, candidate otherwise
    bool snapped = false;
    double distance = 0.0;   // distance to the nearest endpoint, if any
};

// Closest endpoint to candidate. Ties keep the first one in iteration order.
std::optional<NearestEndpoint> find_nearest_endpoint(const Vec2& candidate,
                                                     const std::vector<Vec2>& endpoints);

// Pulls candidate onto the nearest endpoint when it lies within threshold
SnapResult snap_to_nearest(const Vec2& candidate,
                           const std::vector<Vec2>& endpoints,
                           double threshold);

}  // namespace snowflake

#endif // SNOWFLAKE_SNAPPING_ENDPOINT_SNAPPER_HPP
