#include "endpoint_snapper.hpp"
#include <common/logging.hpp>

namespace snowflake {

std::optional<NearestEndpoint> find_nearest_endpoint(const Vec2& candidate,
                                                     const std::vector<Vec2>& endpoints) {
    std::optional<NearestEndpoint> nearest;

    for (const auto& endpoint : endpoints) {
        double dist = candidate.distance_to(endpoint);
        if (!nearest || dist < nearest->distance) {
            nearest = NearestEndpoint{endpoint, dist};
        }
    }

    return nearest;
}

SnapResult snap_to_nearest(const Vec2& candidate,
                           const std::vector<Vec2>& endpoints,
                           double threshold) {
    auto nearest = find_nearest_endpoint(candidate, endpoints);
    if (!nearest) {
        return SnapResult{candidate, false, 0.0};
    }

    if (nearest->distance < threshold) {
        logging::get_logger()->debug("Snapped ({:.2f}, {:.2f}) to ({:.2f}, {:.2f}), distance {:.2f}",
                                     candidate.x, candidate.y,
                                     nearest->point.x, nearest->point.y, nearest->distance);
        return SnapResult{nearest->point, true, nearest->distance};
    }

    return SnapResult{candidate, false, nearest->distance};
}

}  // namespace snowflake
