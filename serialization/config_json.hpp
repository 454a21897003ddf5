#ifndef SNOWFLAKE_SERIALIZATION_CONFIG_JSON_HPP
#define SNOWFLAKE_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec2.hpp>
#include <geometry/wedge.hpp>
#include <geometry/stroke_synthesizer.hpp>
#include <snapping/endpoint_snapper.hpp>
#include <session/drawing_session.hpp>
#include <export/svg_exporter.hpp>
#include <fill/fill_classifier.hpp>
#include "json_serialization.hpp"
#include <stdexcept>
#include <string>

namespace snowflake {

// Rejects a loaded config value, naming its key
inline void require_config(bool valid, const char* key, const char* rule) {
    if (!valid) {
        throw std::runtime_error(std::string("Invalid config value \"") + key + "\": " + rule);
    }
}

// Vec2 serialization
inline void to_json(nlohmann::json& j, const Vec2& v) {
    j = nlohmann::json::array({v.x, v.y});
}

inline void from_json(const nlohmann::json& j, Vec2& v) {
    if (!j.is_array() || j.size() != 2) {
        throw std::runtime_error("Point must be an [x, y] array");
    }
    v.x = j[0].get<double>();
    v.y = j[1].get<double>();
}

// StrokeMode serialization, as "freehand" / "line"
inline std::string stroke_mode_name(StrokeMode mode) {
    return mode == StrokeMode::Line ? "line" : "freehand";
}

inline StrokeMode stroke_mode_from_name(const std::string& name) {
    if (name == "freehand") return StrokeMode::Freehand;
    if (name == "line") return StrokeMode::Line;
    throw std::runtime_error("Unknown stroke mode: " + name);
}

inline void to_json(nlohmann::json& j, const StrokeMode& mode) {
    j = stroke_mode_name(mode);
}

inline void from_json(const nlohmann::json& j, StrokeMode& mode) {
    mode = stroke_mode_from_name(j.get<std::string>());
}

// WedgeConfig serialization
inline void to_json(nlohmann::json& j, const WedgeConfig& config) {
    j = {
        {"center", config.center},
        {"radius", config.radius},
        {"span_degrees", config.span_degrees}
    };
}

inline void from_json(const nlohmann::json& j, WedgeConfig& config) {
    if (j.contains("center")) {
        config.center = j["center"].get<Vec2>();
    }
    config.radius = j.value("radius", 400.0);
    config.span_degrees = j.value("span_degrees", 30.0);
    require_config(config.radius > 0.0, "radius", "must be positive");
    require_config(config.span_degrees > 0.0 && config.span_degrees < 360.0,
                   "span_degrees", "must lie in (0, 360)");
}

// StrokeConfig serialization
inline void to_json(nlohmann::json& j, const StrokeConfig& config) {
    j = {
        {"simplify_epsilon", config.simplify_epsilon},
        {"stroke_width", config.stroke_width},
        {"mode", config.mode}
    };
}

inline void from_json(const nlohmann::json& j, StrokeConfig& config) {
    config.simplify_epsilon = j.value("simplify_epsilon", 2.0);
    config.stroke_width = j.value("stroke_width", 2.0);
    if (j.contains("mode")) {
        config.mode = j["mode"].get<StrokeMode>();
    }
    require_config(config.simplify_epsilon >= 0.0, "simplify_epsilon", "must not be negative");
    require_config(config.stroke_width > 0.0, "stroke_width", "must be positive");
}

// SnapConfig serialization, durations in milliseconds
inline void to_json(nlohmann::json& j, const SnapConfig& config) {
    j = {
        {"threshold", config.threshold},
        {"start_indicator_ms", config.start_indicator_duration.count()},
        {"finish_indicator_ms", config.finish_indicator_duration.count()}
    };
}

inline void from_json(const nlohmann::json& j, SnapConfig& config) {
    config.threshold = j.value("threshold", 20.0);
    config.start_indicator_duration = std::chrono::milliseconds(j.value("start_indicator_ms", 200));
    config.finish_indicator_duration = std::chrono::milliseconds(j.value("finish_indicator_ms", 300));
    require_config(config.threshold >= 0.0, "threshold", "must not be negative");
    require_config(config.start_indicator_duration.count() >= 0, "start_indicator_ms",
                   "must not be negative");
    require_config(config.finish_indicator_duration.count() >= 0, "finish_indicator_ms",
                   "must not be negative");
}

// SessionConfig serialization
inline void to_json(nlohmann::json& j, const SessionConfig& config) {
    j = {
        {"wedge", config.wedge},
        {"stroke", config.stroke},
        {"snap", config.snap}
    };
}

inline void from_json(const nlohmann::json& j, SessionConfig& config) {
    if (j.contains("wedge")) config.wedge = j["wedge"].get<WedgeConfig>();
    if (j.contains("stroke")) config.stroke = j["stroke"].get<StrokeConfig>();
    if (j.contains("snap")) config.snap = j["snap"].get<SnapConfig>();
}

// ExportConfig serialization
inline void to_json(nlohmann::json& j, const ExportConfig& config) {
    j = {
        {"canvas_size", config.canvas_size},
        {"physical_size_mm", config.physical_size_mm},
        {"cut_width_mm", config.cut_width_mm},
        {"stroke_color", config.stroke_color},
        {"precision", config.precision}
    };
}

inline void from_json(const nlohmann::json& j, ExportConfig& config) {
    config.canvas_size = j.value("canvas_size", 1000.0);
    config.physical_size_mm = j.value("physical_size_mm", 200.0);
    config.cut_width_mm = j.value("cut_width_mm", 0.1);
    config.stroke_color = j.value("stroke_color", std::string("#FF0000"));
    config.precision = j.value("precision", 2);
    require_config(config.canvas_size > 0.0, "canvas_size", "must be positive");
    require_config(config.physical_size_mm > 0.0, "physical_size_mm", "must be positive");
    require_config(config.cut_width_mm > 0.0, "cut_width_mm", "must be positive");
    require_config(config.precision >= 0, "precision", "must not be negative");
}

// FillConfig serialization
inline void to_json(nlohmann::json& j, const FillConfig& config) {
    j = {
        {"resolution", config.resolution},
        {"canvas_size", config.canvas_size},
        {"samples_per_curve", config.samples_per_curve},
        {"num_threads", config.num_threads}
    };
}

inline void from_json(const nlohmann::json& j, FillConfig& config) {
    config.resolution = j.value("resolution", 500);
    config.canvas_size = j.value("canvas_size", 1000.0);
    config.samples_per_curve = j.value("samples_per_curve", 16);
    config.num_threads = j.value("num_threads", 0);
    require_config(config.resolution > 0, "resolution", "must be positive");
    require_config(config.canvas_size > 0.0, "canvas_size", "must be positive");
    require_config(config.samples_per_curve > 0, "samples_per_curve", "must be positive");
    require_config(config.num_threads >= 0, "num_threads", "must not be negative");
}

// Everything a -c/--config file can set. Missing sections keep defaults.
struct AppConfig {
    SessionConfig session;
    ExportConfig export_config;
    FillConfig fill;
};

inline void to_json(nlohmann::json& j, const AppConfig& config) {
    j = {
        {"session", config.session},
        {"export", config.export_config},
        {"fill", config.fill}
    };
}

inline void from_json(const nlohmann::json& j, AppConfig& config) {
    if (j.contains("session")) config.session = j["session"].get<SessionConfig>();
    if (j.contains("export")) config.export_config = j["export"].get<ExportConfig>();
    if (j.contains("fill")) config.fill = j["fill"].get<FillConfig>();
}

inline AppConfig load_app_config(const std::string& path) {
    return json::read_json_file(path).get<AppConfig>();
}

}  // namespace snowflake

#endif // SNOWFLAKE_SERIALIZATION_CONFIG_JSON_HPP
