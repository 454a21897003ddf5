#include "drawing_session.hpp"
#include <common/logging.hpp>
#include <stdexcept>

namespace snowflake {

DrawingSession::DrawingSession(const SessionConfig& config)
    : config_(config),
      wedge_(config.wedge),
      replicator_(config.wedge.center) {
    if (config.stroke.stroke_width <= 0.0) {
        throw std::invalid_argument("stroke width must be positive");
    }
}

bool DrawingSession::is_live(StrokeHandle handle) const {
    return live_ && live_->stroke.id == handle.id;
}

const SourceStroke* DrawingSession::live_stroke() const {
    return live_ ? &live_->stroke : nullptr;
}

std::optional<std::pair<Vec2, Vec2>> DrawingSession::preview_segment() const {
    if (!live_ || live_->stroke.mode != StrokeMode::Line) {
        return std::nullopt;
    }
    const Vec2& start = live_->stroke.points.front();
    return std::make_pair(start, wedge_.clip_segment(start, live_->last_sample).point);
}

void DrawingSession::set_mode(StrokeMode mode) {
    config_.stroke.mode = mode;
}

void DrawingSession::set_stroke_width(double width) {
    if (width <= 0.0) {
        throw std::invalid_argument("stroke width must be positive");
    }
    config_.stroke.stroke_width = width;
}

std::vector<Vec2> DrawingSession::baked_endpoints_excluding(std::optional<StrokeId> exclude) const {
    TransformBaker baker;
    std::vector<Vec2> endpoints;

    for (const auto& [id, replicas] : replicator_.replicas_by_stroke()) {
        if (exclude && id == *exclude) {
            continue;
        }
        for (const auto& replica : replicas) {
            BakedPath baked = baker.bake(replica);
            if (auto first = baked.path.first_point()) {
                endpoints.push_back(*first);
            }
            if (auto last = baked.path.last_point()) {
                endpoints.push_back(*last);
            }
        }
    }

    return endpoints;
}

std::vector<BakedPath> DrawingSession::get_all_baked_paths() const {
    TransformBaker baker;
    return baker.bake_all(replicator_);
}

std::vector<Vec2> DrawingSession::get_all_baked_endpoints() const {
    TransformBaker baker;
    return baker.baked_endpoints(replicator_);
}

SnapResult DrawingSession::snap(const Vec2& candidate, std::optional<StrokeId> exclude,
                                Clock::time_point now, Clock::duration indicator_duration) {
    SnapResult result = snap_to_nearest(candidate, baked_endpoints_excluding(exclude),
                                        config_.snap.threshold);
    if (result.snapped) {
        indicator_.show(result.point, now, indicator_duration);
    }
    return result;
}

std::optional<StrokeHandle> DrawingSession::begin_stroke(const Vec2& point, Clock::time_point now) {
    auto log = logging::get_logger();

    if (live_) {
        log->debug("Stroke {} is still live, ignoring new stroke", live_->stroke.id);
        return std::nullopt;
    }

    if (!wedge_.contains(point)) {
        log->trace("Rejected stroke start outside wedge at ({:.2f}, {:.2f})", point.x, point.y);
        return std::nullopt;
    }

    // The snapped start may land slightly outside the wedge; that is accepted
    SnapResult start = snap(point, std::nullopt, now, config_.snap.start_indicator_duration);

    SourceStroke stroke;
    stroke.id = next_id_++;
    stroke.points = {start.point};
    stroke.path = points_to_path(stroke.points);
    stroke.stroke_width = config_.stroke.stroke_width;
    stroke.mode = config_.stroke.mode;

    replicator_.add_stroke(stroke);
    live_ = LiveStroke{std::move(stroke), start.point};

    log->debug("Began stroke {} at ({:.2f}, {:.2f}){}", live_->stroke.id,
               start.point.x, start.point.y, start.snapped ? " (snapped)" : "");
    return StrokeHandle{live_->stroke.id};
}

std::optional<PathData> DrawingSession::extend_stroke(StrokeHandle handle, const Vec2& point) {
    if (!is_live(handle)) {
        return std::nullopt;
    }

    SourceStroke& stroke = live_->stroke;

    if (stroke.mode == StrokeMode::Line) {
        ClipResult clipped = wedge_.clip_segment(stroke.points.front(), point);
        live_->last_sample = point;
        stroke.path = straight_path(stroke.points.front(), clipped.point);
    } else {
        if (!wedge_.contains(point)) {
            return std::nullopt;
        }
        live_->last_sample = point;
        stroke.points.push_back(point);
        stroke.path = points_to_path(stroke.points);
    }

    replicator_.update_stroke(stroke);
    return stroke.path;
}

std::optional<SourceStroke> DrawingSession::finish_stroke(StrokeHandle handle, Clock::time_point now) {
    if (!is_live(handle)) {
        return std::nullopt;
    }

    SourceStroke stroke = std::move(live_->stroke);
    Vec2 last_sample = live_->last_sample;
    live_.reset();

    if (stroke.mode == StrokeMode::Line) {
        const Vec2 start = stroke.points.front();
        ClipResult clipped = wedge_.clip_segment(start, last_sample);
        SnapResult end = snap(clipped.point, stroke.id, now,
                              config_.snap.finish_indicator_duration);
        stroke.points = {start, end.point};
        stroke.path = straight_path(start, end.point);
    } else {
        stroke.points = simplify_path(stroke.points, config_.stroke.simplify_epsilon);
        SnapResult end = snap(stroke.points.back(), stroke.id, now,
                              config_.snap.finish_indicator_duration);
        stroke.points.back() = end.point;
        stroke.path = points_to_path(stroke.points);
    }

    replicator_.update_stroke(stroke);
    history_.push_back(stroke);

    logging::get_logger()->debug("Finished stroke {} with {} points", stroke.id, stroke.points.size());
    return stroke;
}

bool DrawingSession::undo_last() {
    if (history_.empty()) {
        return false;
    }

    StrokeId id = history_.back().id;
    history_.pop_back();
    replicator_.remove_stroke(id);
    logging::get_logger()->debug("Undid stroke {}", id);
    return true;
}

void DrawingSession::clear_all() {
    live_.reset();
    history_.clear();
    replicator_.clear_all();
    indicator_.hide();
}

}  // namespace snowflake
