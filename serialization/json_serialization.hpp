#ifndef SNOWFLAKE_SERIALIZATION_JSON_SERIALIZATION_HPP
#define SNOWFLAKE_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace snowflake::json {

// UTC, second resolution: "2026-01-31T12:00:00Z"
inline std::string utc_timestamp(std::chrono::system_clock::time_point when) {
    std::time_t time = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
    gmtime_r(&time, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Pretty-printed, two-space indent, trailing newline
inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2) << '\n';
}

// Parse errors are rethrown as std::runtime_error naming the file
inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

}  // namespace snowflake::json

#endif // SNOWFLAKE_SERIALIZATION_JSON_SERIALIZATION_HPP
