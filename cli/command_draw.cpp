#include "cli_common.hpp"
#include <visualizer/visualizer.hpp>

namespace snowflake::cli {

int command_draw(int argc, char** argv) {
    auto log = snowflake::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help) {
            std::cerr << "Usage: snowflake draw [strokes.json] [-o <out.svg>] [-c <config.json>]\n";
            return 0;
        }

        if (!visualization_available()) {
            log->error("Visualization not available - recompile with GLFW and OpenGL");
            std::cerr << "Error: Visualization not available\n";
            return 1;
        }

        AppConfig config = load_config(ctx);
        DrawingSession session = ctx.input_path.empty()
            ? DrawingSession(config.session)
            : session_from_script(ctx.input_path, config);

        VisualizerConfig viz_config;
        if (!ctx.output_path.empty()) {
            viz_config.export_path = ctx.output_path;
        }

        VisualizerResult result = run_drawing_window(session, config.export_config, viz_config);
        if (!result.completed) {
            std::cerr << "Error: drawing window could not be opened\n";
            return 1;
        }

        std::cerr << "Drew " << result.strokes_drawn << " strokes, "
                  << result.exports << " exports\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace snowflake::cli
