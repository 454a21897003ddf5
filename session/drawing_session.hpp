#ifndef SNOWFLAKE_SESSION_DRAWING_SESSION_HPP
#define SNOWFLAKE_SESSION_DRAWING_SESSION_HPP

#include <geometry/wedge.hpp>
#include <geometry/stroke_synthesizer.hpp>
#include <snapping/endpoint_snapper.hpp>
#include <snapping/snap_indicator.hpp>
#include <symmetry/symmetry_replicator.hpp>
#include <symmetry/transform_baker.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace snowflake {

struct SessionConfig {
    WedgeConfig wedge;
    StrokeConfig stroke;
    SnapConfig snap;
};

// Names the live stroke in lifecycle calls
struct StrokeHandle {
    StrokeId id = 0;

    bool operator==(const StrokeHandle& other) const = default;
};

// The authoring session: one live stroke at most, an append-only history of
// finished strokes, and the replicas derived from both.
//
// Lifecycle:
//   begin_stroke  -> live stroke with replicas (rejected outside the wedge)
//   extend_stroke -> live replicas rebuilt from the points so far
//   finish_stroke -> simplified, end snapped, moved to history
class DrawingSession {
public:
    using Clock = SnapIndicator::Clock;

    explicit DrawingSession(const SessionConfig& config = SessionConfig{});

    // Start a stroke at point. Returns nullopt when point lies outside the
    // wedge or another stroke is still live. The start is snapped to nearby
    // endpoints.
    std::optional<StrokeHandle> begin_stroke(const Vec2& point,
                                             Clock::time_point now = Clock::now());

    // Add a pointer sample to the live stroke and return its updated path.
    // Freehand: samples outside the wedge are rejected (nullopt).
    // Line: the sample is clipped to the wedge and becomes the provisional end.
    std::optional<PathData> extend_stroke(StrokeHandle handle, const Vec2& point);

    // Finalize the live stroke: freehand points are simplified, the end is
    // snapped (line ends are clipped first). Returns the finished stroke.
    std::optional<SourceStroke> finish_stroke(StrokeHandle handle,
                                              Clock::time_point now = Clock::now());

    // Remove the most recent finished stroke and its replicas
    bool undo_last();

    // Drop every stroke, live or finished
    void clear_all();

    // Query API, recomputed from replica state on every call
    std::vector<BakedPath> get_all_baked_paths() const;
    std::vector<Vec2> get_all_baked_endpoints() const;

    // Endpoints of every stroke except the given one
    std::vector<Vec2> baked_endpoints_excluding(std::optional<StrokeId> exclude) const;

    void set_mode(StrokeMode mode);
    StrokeMode mode() const { return config_.stroke.mode; }

    // Applies to strokes begun afterwards
    void set_stroke_width(double width);
    double stroke_width() const { return config_.stroke.stroke_width; }

    const SourceStroke* live_stroke() const;

    // Clipped start -> end segment while a line stroke is live
    std::optional<std::pair<Vec2, Vec2>> preview_segment() const;

    const std::vector<SourceStroke>& history() const { return history_; }
    size_t stroke_count() const { return history_.size(); }

    const SymmetryReplicator& replicator() const { return replicator_; }
    const Wedge& wedge() const { return wedge_; }
    const SessionConfig& config() const { return config_; }

    const SnapIndicator& snap_indicator() const { return indicator_; }
    void tick(Clock::time_point now) { indicator_.tick(now); }

private:
    struct LiveStroke {
        SourceStroke stroke;
        Vec2 last_sample;   // most recent pointer sample (line mode end)
    };

    SessionConfig config_;
    Wedge wedge_;
    SymmetryReplicator replicator_;
    SnapIndicator indicator_;

    std::optional<LiveStroke> live_;
    std::vector<SourceStroke> history_;
    StrokeId next_id_ = 1;

    bool is_live(StrokeHandle handle) const;
    SnapResult snap(const Vec2& candidate, std::optional<StrokeId> exclude,
                    Clock::time_point now, Clock::duration indicator_duration);
};

}  // namespace snowflake

#endif // SNOWFLAKE_SESSION_DRAWING_SESSION_HPP
