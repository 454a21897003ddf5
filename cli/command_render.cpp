#include "cli_common.hpp"
#include <export/svg_exporter.hpp>

namespace snowflake::cli {

int command_render(int argc, char** argv) {
    auto log = snowflake::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: snowflake render <strokes.json> [-o <out.svg>] [-c <config.json>]\n";
            return ctx.help ? 0 : 1;
        }

        AppConfig config = load_config(ctx);
        DrawingSession session = session_from_script(ctx.input_path, config);

        SvgExporter exporter(config.export_config);
        std::string output = resolve_output_path(ctx.input_path, ".svg", ctx.output_path);

        if (!exporter.export_to_file(session, output)) {
            std::cerr << "Nothing to export: no strokes were drawn\n";
            return 1;
        }

        std::cerr << "Wrote " << output << " ("
                  << session.stroke_count() << " strokes, "
                  << session.replicator().replica_count() << " paths)\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace snowflake::cli
