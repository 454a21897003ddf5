#include "symmetry_replicator.hpp"
#include <common/logging.hpp>

namespace snowflake {

SymmetryReplicator::SymmetryReplicator(const Vec2& center) : center_(center) {}

std::vector<Replica> SymmetryReplicator::build_replicas(const SourceStroke& stroke) const {
    std::vector<Replica> replicas;
    replicas.reserve(kReplicasPerStroke);

    Transform mirror = Transform::mirror(center_.x);

    for (int angle : kRotationAngles) {
        Transform rotation = Transform::rotate(static_cast<double>(angle), center_);

        replicas.push_back(Replica{
            .stroke_id = stroke.id,
            .rotation_degrees = angle,
            .mirrored = false,
            .transform = rotation,
            .geometry = stroke.path,
            .stroke_width = stroke.stroke_width
        });

        replicas.push_back(Replica{
            .stroke_id = stroke.id,
            .rotation_degrees = angle,
            .mirrored = true,
            .transform = rotation * mirror,
            .geometry = stroke.path,
            .stroke_width = stroke.stroke_width
        });
    }

    return replicas;
}

void SymmetryReplicator::add_stroke(const SourceStroke& stroke) {
    // Build first so the map entry is swapped in one step
    replicas_[stroke.id] = build_replicas(stroke);
    logging::get_logger()->trace("Replicated stroke {} ({} commands)",
                                 stroke.id, stroke.path.size());
}

void SymmetryReplicator::update_stroke(const SourceStroke& stroke) {
    replicas_.erase(stroke.id);
    add_stroke(stroke);
}

bool SymmetryReplicator::remove_stroke(StrokeId id) {
    bool removed = replicas_.erase(id) > 0;
    if (removed) {
        logging::get_logger()->debug("Removed replicas of stroke {}", id);
    }
    return removed;
}

void SymmetryReplicator::clear_all() {
    replicas_.clear();
}

const std::vector<Replica>* SymmetryReplicator::replicas_for(StrokeId id) const {
    auto it = replicas_.find(id);
    if (it != replicas_.end()) {
        return &it->second;
    }
    return nullptr;
}

size_t SymmetryReplicator::replica_count() const {
    size_t count = 0;
    for (const auto& [id, replicas] : replicas_) {
        count += replicas.size();
    }
    return count;
}

}  // namespace snowflake
