#ifndef SNOWFLAKE_CLI_COMMON_HPP
#define SNOWFLAKE_CLI_COMMON_HPP

#include <serialization/config_json.hpp>
#include <serialization/stroke_script_json.hpp>
#include <session/drawing_session.hpp>
#include <session/stroke_script.hpp>
#include <common/logging.hpp>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace snowflake::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;
    bool help = false;
};

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            if (i + 1 < argc) {
                ctx.output_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-o/--output requires an argument");
            }
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                ctx.config_path = argv[++i];
                ++i;
            } else {
                throw std::runtime_error("-c/--config requires an argument");
            }
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (arg[0] != '-') {
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    if (ctx.verbose) {
        logging::enable_verbose();
    }

    return {ctx, i};
}

// Resolve output path: if empty, generate from input path with given suffix
inline std::string resolve_output_path(const std::string& input,
                                       const std::string& suffix,
                                       const std::string& provided_output) {
    if (!provided_output.empty()) {
        return provided_output;
    }

    size_t dot_pos = input.find_last_of('.');
    size_t slash_pos = input.find_last_of('/');

    if (dot_pos != std::string::npos &&
        (slash_pos == std::string::npos || dot_pos > slash_pos)) {
        return input.substr(0, dot_pos) + suffix;
    } else {
        return input + suffix;
    }
}

inline std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

// Binary mode, PGM output carries raw bytes
inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

// Defaults unless -c names a config file
inline AppConfig load_config(const CommandContext& ctx) {
    if (!ctx.config_path) {
        return AppConfig{};
    }
    logging::get_logger()->debug("Loading config from {}", *ctx.config_path);
    return load_app_config(*ctx.config_path);
}

// Replay a stroke script file into a fresh session
inline DrawingSession session_from_script(const std::string& path, const AppConfig& config) {
    auto log = logging::get_logger();
    StrokeScript script = stroke_script_from_json(json::read_json_file(path));

    DrawingSession session(config.session);
    ReplayResult result = replay_script(session, script);
    log->info("Replayed {} strokes from {} ({} rejected)",
              result.finished, path, result.rejected);
    return session;
}

// Command function declarations
int command_render(int argc, char** argv);
int command_bake(int argc, char** argv);
int command_fill(int argc, char** argv);
int command_replicate(int argc, char** argv);
int command_draw(int argc, char** argv);

}  // namespace snowflake::cli

#endif // SNOWFLAKE_CLI_COMMON_HPP
