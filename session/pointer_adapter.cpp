#include "pointer_adapter.hpp"

namespace snowflake {

void PointerAdapter::pointer_down(const Vec2& p, PointerButton button, Clock::time_point now) {
    if (button == PointerButton::Middle || armed_) {
        return;
    }

    armed_ = true;
    handle_ = session_.begin_stroke(p, now);
}

void PointerAdapter::pointer_move(const Vec2& p, Clock::time_point now) {
    if (!armed_) {
        return;
    }

    if (!handle_) {
        // Dragged in from outside the wedge
        if (session_.wedge().contains(p)) {
            handle_ = session_.begin_stroke(p, now);
        }
        return;
    }

    // Rejected freehand samples outside the wedge are simply dropped
    (void)session_.extend_stroke(*handle_, p);
}

std::optional<SourceStroke> PointerAdapter::pointer_up(const Vec2& p, Clock::time_point now) {
    if (!armed_) {
        return std::nullopt;
    }
    armed_ = false;

    if (!handle_) {
        return std::nullopt;
    }

    StrokeHandle handle = *handle_;
    handle_.reset();

    // Line strokes end where the pointer is released
    const SourceStroke* live = session_.live_stroke();
    if (live && live->mode == StrokeMode::Line) {
        (void)session_.extend_stroke(handle, p);
    }
    return session_.finish_stroke(handle, now);
}

}  // namespace snowflake
