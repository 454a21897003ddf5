#include "stroke_script.hpp"
#include "pointer_adapter.hpp"
#include <common/logging.hpp>

namespace snowflake {

ReplayResult replay_script(DrawingSession& session, const StrokeScript& script) {
    auto log = logging::get_logger();
    ReplayResult result;
    PointerAdapter adapter(session);

    for (size_t i = 0; i < script.strokes.size(); ++i) {
        const auto& gesture = script.strokes[i];
        if (gesture.points.empty()) {
            log->warn("Scripted stroke {} has no points, skipped", i);
            ++result.rejected;
            continue;
        }

        if (gesture.mode) {
            session.set_mode(*gesture.mode);
        }
        if (gesture.stroke_width) {
            session.set_stroke_width(*gesture.stroke_width);
        }

        adapter.pointer_down(gesture.points.front());
        for (size_t k = 1; k < gesture.points.size(); ++k) {
            adapter.pointer_move(gesture.points[k]);
        }
        auto finished = adapter.pointer_up(gesture.points.back());

        if (finished) {
            ++result.finished;
            log->debug("Scripted stroke {} -> stroke {} ({} points)",
                       i, finished->id, finished->points.size());
        } else {
            ++result.rejected;
            log->warn("Scripted stroke {} never entered the wedge", i);
        }
    }

    return result;
}

}  // namespace snowflake
