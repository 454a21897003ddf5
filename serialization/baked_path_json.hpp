#ifndef SNOWFLAKE_SERIALIZATION_BAKED_PATH_JSON_HPP
#define SNOWFLAKE_SERIALIZATION_BAKED_PATH_JSON_HPP

#include <nlohmann/json.hpp>
#include <symmetry/transform_baker.hpp>
#include "config_json.hpp"
#include "json_serialization.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace snowflake {

// BakedPath serialization. "d" is the SVG path data; "commands" carries the
// full-precision coordinates.
inline nlohmann::json baked_path_to_json(const BakedPath& baked, int precision = 2) {
    nlohmann::json commands = nlohmann::json::array();
    for (const auto& cmd : baked.path.commands()) {
        commands.push_back({
            {"type", std::string(1, command_letter(cmd.type))},
            {"points", cmd.points}
        });
    }
    return {
        {"stroke_id", baked.stroke_id},
        {"stroke_width", baked.stroke_width},
        {"d", baked.to_svg(precision)},
        {"commands", commands}
    };
}

inline nlohmann::json baked_paths_to_json(const std::vector<BakedPath>& paths, int precision = 2) {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& baked : paths) {
        j.push_back(baked_path_to_json(baked, precision));
    }
    return j;
}

// Output of `snowflake bake`: the replayed script's baked geometry
struct BakeDocument {
    static constexpr int FORMAT_VERSION = 1;

    std::string source_file;
    SessionConfig session;
    std::vector<BakedPath> paths;
    std::vector<Vec2> endpoints;
    size_t stroke_count = 0;
    int precision = 2;
};

inline nlohmann::json bake_document_to_json(const BakeDocument& doc,
                                            std::chrono::system_clock::time_point generated) {
    return {
        {"format", "snowflake-bake"},
        {"version", BakeDocument::FORMAT_VERSION},
        {"generated", json::utc_timestamp(generated)},
        {"source_file", doc.source_file},
        {"session", doc.session},
        {"stats", {
            {"stroke_count", doc.stroke_count},
            {"path_count", doc.paths.size()},
            {"endpoint_count", doc.endpoints.size()}
        }},
        {"paths", baked_paths_to_json(doc.paths, doc.precision)},
        {"endpoints", doc.endpoints}
    };
}

}  // namespace snowflake

#endif // SNOWFLAKE_SERIALIZATION_BAKED_PATH_JSON_HPP
