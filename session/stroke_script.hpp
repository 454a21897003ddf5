#ifndef SNOWFLAKE_SESSION_STROKE_SCRIPT_HPP
#define SNOWFLAKE_SESSION_STROKE_SCRIPT_HPP

#include "drawing_session.hpp"
#include <optional>
#include <vector>

namespace snowflake {

// A recorded pointer gesture: press at the first point, drag through the
// rest, release at the last. Unset fields keep the session's current value.
struct ScriptedStroke {
    std::optional<StrokeMode> mode;
    std::optional<double> stroke_width;
    std::vector<Vec2> points;
};

struct StrokeScript {
    std::vector<ScriptedStroke> strokes;
};

struct ReplayResult {
    size_t finished = 0;   // gestures that produced a stroke
    size_t rejected = 0;   // gestures that never entered the wedge
};

// Feed a script through a PointerAdapter, exactly as live input would arrive.
// Mode and stroke width set by a gesture stay in effect for later ones.
ReplayResult replay_script(DrawingSession& session, const StrokeScript& script);

}  // namespace snowflake

#endif // SNOWFLAKE_SESSION_STROKE_SCRIPT_HPP
