#ifndef SNOWFLAKE_SYMMETRY_TRANSFORM_BAKER_HPP
#define SNOWFLAKE_SYMMETRY_TRANSFORM_BAKER_HPP

#include "symmetry_replicator.hpp"
#include "transform.hpp"
#include <geometry/path_data.hpp>
#include <string>
#include <vector>

namespace snowflake {

// Replica geometry with its transform folded into the coordinates
struct BakedPath {
    StrokeId stroke_id = 0;
    PathData path;
    double stroke_width = 2.0;

    std::string to_svg(int precision = 2) const { return path.to_svg(precision); }
};

// Flattens declarative transforms into literal coordinates. Results are
// recomputed from replicator state on every call, nothing is cached.
class TransformBaker {
public:
    // Transform every coordinate of every command, keeping command order.
    // Commands with the wrong number of coordinates are skipped with a
    // warning; commands before them are kept.
    PathData bake(const PathData& path, const Transform& transform);

    BakedPath bake(const Replica& replica);

    // Every replica of every stroke, stroke creation order
    std::vector<BakedPath> bake_all(const SymmetryReplicator& replicator);

    // First and last coordinate of every baked replica
    std::vector<Vec2> baked_endpoints(const SymmetryReplicator& replicator);

    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    std::vector<std::string> warnings_;

    void warning(const std::string& message);
};

}  // namespace snowflake

#endif // SNOWFLAKE_SYMMETRY_TRANSFORM_BAKER_HPP
