#ifndef SNOWFLAKE_SYMMETRY_SYMMETRY_REPLICATOR_HPP
#define SNOWFLAKE_SYMMETRY_SYMMETRY_REPLICATOR_HPP

#include "source_stroke.hpp"
#include "transform.hpp"
#include <array>
#include <map>
#include <vector>

namespace snowflake {

// One of the twelve symmetric copies of a source stroke. The geometry is the
// source path untouched; the transform places it.
struct Replica {
    StrokeId stroke_id = 0;
    int rotation_degrees = 0;
    bool mirrored = false;
    Transform transform;
    PathData geometry;
    double stroke_width = 2.0;
};

// Owns the stroke id -> replicas mapping. Replicas of a stroke are always
// replaced as a whole, never patched one by one.
class SymmetryReplicator {
public:
    static constexpr std::array<int, 6> kRotationAngles = {0, 60, 120, 180, 240, 300};
    static constexpr size_t kReplicasPerStroke = kRotationAngles.size() * 2;

    explicit SymmetryReplicator(const Vec2& center = Vec2{500.0, 500.0});

    // Build the twelve replicas of stroke. An id that already has replicas
    // is replaced atomically.
    void add_stroke(const SourceStroke& stroke);

    // Drop the existing replicas of stroke.id and rebuild them from the
    // stroke's current geometry
    void update_stroke(const SourceStroke& stroke);

    // Returns false when the id had no replicas
    bool remove_stroke(StrokeId id);

    void clear_all();

    bool contains(StrokeId id) const { return replicas_.count(id) > 0; }
    const std::vector<Replica>* replicas_for(StrokeId id) const;

    // Strokes in id order, which is creation order
    const std::map<StrokeId, std::vector<Replica>>& replicas_by_stroke() const { return replicas_; }

    size_t stroke_count() const { return replicas_.size(); }
    size_t replica_count() const;

    const Vec2& center() const { return center_; }

    // The twelve placement transforms: for each angle, rotate(angle) and
    // rotate(angle) * mirror(center.x)
    std::vector<Replica> build_replicas(const SourceStroke& stroke) const;

private:
    Vec2 center_;
    std::map<StrokeId, std::vector<Replica>> replicas_;
};

}  // namespace snowflake

#endif // SNOWFLAKE_SYMMETRY_SYMMETRY_REPLICATOR_HPP
