#include "transform_baker.hpp"
#include <common/logging.hpp>
#include <sstream>

namespace snowflake {

void TransformBaker::warning(const std::string& message) {
    logging::get_logger()->warn("Baker: {}", message);
    warnings_.push_back(message);
}

PathData TransformBaker::bake(const PathData& path, const Transform& transform) {
    PathData baked;

    for (size_t i = 0; i < path.commands().size(); ++i) {
        const auto& cmd = path.commands()[i];

        if (!cmd.well_formed()) {
            std::ostringstream oss;
            oss << "skipping malformed '" << command_letter(cmd.type) << "' command at index "
                << i << " (" << cmd.points.size() << " coordinate pairs, expected "
                << expected_point_count(cmd.type) << ")";
            warning(oss.str());
            continue;
        }

        PathCommand out{cmd.type, {}};
        out.points.reserve(cmd.points.size());
        for (const auto& p : cmd.points) {
            out.points.push_back(transform.apply(p));
        }
        baked.add_command(std::move(out));
    }

    return baked;
}

BakedPath TransformBaker::bake(const Replica& replica) {
    return BakedPath{
        .stroke_id = replica.stroke_id,
        .path = bake(replica.geometry, replica.transform),
        .stroke_width = replica.stroke_width
    };
}

std::vector<BakedPath> TransformBaker::bake_all(const SymmetryReplicator& replicator) {
    std::vector<BakedPath> baked;
    baked.reserve(replicator.replica_count());

    for (const auto& [id, replicas] : replicator.replicas_by_stroke()) {
        for (const auto& replica : replicas) {
            baked.push_back(bake(replica));
        }
    }

    return baked;
}

std::vector<Vec2> TransformBaker::baked_endpoints(const SymmetryReplicator& replicator) {
    std::vector<Vec2> endpoints;
    endpoints.reserve(replicator.replica_count() * 2);

    for (const auto& baked : bake_all(replicator)) {
        auto first = baked.path.first_point();
        auto last = baked.path.last_point();
        if (first) {
            endpoints.push_back(*first);
        }
        if (last) {
            endpoints.push_back(*last);
        }
    }

    return endpoints;
}

}  // namespace snowflake
