#ifndef SNOWFLAKE_SERIALIZATION_STROKE_SCRIPT_JSON_HPP
#define SNOWFLAKE_SERIALIZATION_STROKE_SCRIPT_JSON_HPP

#include <nlohmann/json.hpp>
#include <session/stroke_script.hpp>
#include "config_json.hpp"

namespace snowflake {

// ScriptedStroke deserialization
inline void from_json(const nlohmann::json& j, ScriptedStroke& stroke) {
    if (j.contains("mode")) {
        stroke.mode = j["mode"].get<StrokeMode>();
    }
    if (j.contains("stroke_width")) {
        stroke.stroke_width = j["stroke_width"].get<double>();
    }
    stroke.points = j.at("points").get<std::vector<Vec2>>();
}

// StrokeScript deserialization: {"strokes": [...]}
inline StrokeScript stroke_script_from_json(const nlohmann::json& j) {
    StrokeScript script;
    script.strokes = j.at("strokes").get<std::vector<ScriptedStroke>>();
    return script;
}

}  // namespace snowflake

#endif // SNOWFLAKE_SERIALIZATION_STROKE_SCRIPT_JSON_HPP
