#include "snap_indicator.hpp"

namespace snowflake {

void SnapIndicator::show(const Vec2& at, Clock::time_point now, Clock::duration duration) {
    position_ = at;
    deadline_ = now + duration;
}

void SnapIndicator::tick(Clock::time_point now) {
    if (deadline_ && now >= *deadline_) {
        deadline_.reset();
    }
}

void SnapIndicator::hide() {
    deadline_.reset();
}

}  // namespace snowflake
