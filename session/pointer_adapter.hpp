#ifndef SNOWFLAKE_SESSION_POINTER_ADAPTER_HPP
#define SNOWFLAKE_SESSION_POINTER_ADAPTER_HPP

#include "drawing_session.hpp"
#include <optional>

namespace snowflake {

enum class PointerButton {
    Primary,
    Middle,     // reserved for panning, never draws
    Secondary
};

// Maps raw pointer events (already in drawing-surface coordinates) onto the
// stroke lifecycle. A press outside the wedge arms drawing; the stroke
// begins at the first sample that enters the wedge.
class PointerAdapter {
public:
    using Clock = DrawingSession::Clock;

    explicit PointerAdapter(DrawingSession& session) : session_(session) {}

    void pointer_down(const Vec2& p, PointerButton button = PointerButton::Primary,
                      Clock::time_point now = Clock::now());
    void pointer_move(const Vec2& p, Clock::time_point now = Clock::now());

    // Also used for pointer-leave. Returns the finished stroke, if any.
    std::optional<SourceStroke> pointer_up(const Vec2& p, Clock::time_point now = Clock::now());

    bool armed() const { return armed_; }
    bool drawing() const { return handle_.has_value(); }

private:
    DrawingSession& session_;
    bool armed_ = false;
    std::optional<StrokeHandle> handle_;
};

}  // namespace snowflake

#endif // SNOWFLAKE_SESSION_POINTER_ADAPTER_HPP
