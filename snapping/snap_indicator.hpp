#ifndef SNOWFLAKE_SNAPPING_SNAP_INDICATOR_HPP
#define SNOWFLAKE_SNAPPING_SNAP_INDICATOR_HPP

#include <math/vec2.hpp>
#include <chrono>
#include <optional>

namespace snowflake {

// Transient marker shown where a snap happened. Each show() cancels the
// pending hide of the previous one, so an older deadline can never hide a
// newer indicator. Driven by the event loop through tick().
class SnapIndicator {
public:
    using Clock = std::chrono::steady_clock;

    void show(const Vec2& at, Clock::time_point now, Clock::duration duration);

    // Hide when the current deadline has passed
    void tick(Clock::time_point now);

    void hide();

    bool visible() const { return deadline_.has_value(); }
    const Vec2& position() const { return position_; }

private:
    Vec2 position_;
    std::optional<Clock::time_point> deadline_;
};

}  // namespace snowflake

#endif // SNOWFLAKE_SNAPPING_SNAP_INDICATOR_HPP
