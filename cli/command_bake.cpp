#include "cli_common.hpp"
#include <serialization/baked_path_json.hpp>

namespace snowflake::cli {

int command_bake(int argc, char** argv) {
    auto log = snowflake::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: snowflake bake <strokes.json> [-o <baked.json>] [-c <config.json>]\n";
            return ctx.help ? 0 : 1;
        }

        AppConfig config = load_config(ctx);
        DrawingSession session = session_from_script(ctx.input_path, config);

        BakeDocument doc;
        doc.source_file = ctx.input_path;
        doc.session = config.session;
        doc.paths = session.get_all_baked_paths();
        doc.endpoints = session.get_all_baked_endpoints();
        doc.stroke_count = session.stroke_count();
        doc.precision = config.export_config.precision;

        std::string output = resolve_output_path(ctx.input_path, ".baked.json", ctx.output_path);
        json::write_json_file(output, bake_document_to_json(doc, std::chrono::system_clock::now()));

        log->info("Wrote baked paths to {}", output);
        std::cerr << "Wrote " << output << " ("
                  << doc.paths.size() << " paths, "
                  << doc.endpoints.size() << " endpoints)\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace snowflake::cli
