#include "cli_common.hpp"
#include <fill/fill_classifier.hpp>

namespace snowflake::cli {

int command_fill(int argc, char** argv) {
    auto log = snowflake::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: snowflake fill <strokes.json> [-o <mask.pgm>] [-c <config.json>]\n";
            return ctx.help ? 0 : 1;
        }

        AppConfig config = load_config(ctx);
        DrawingSession session = session_from_script(ctx.input_path, config);

        FillClassifier classifier(config.fill);
        FillMask mask = classifier.classify(session.get_all_baked_paths());

        std::string output = resolve_output_path(ctx.input_path, ".pgm", ctx.output_path);
        write_file(output, mask.to_pgm());

        log->info("Fill mask {}x{}, {:.2f}% cut", mask.width(), mask.height(),
                  mask.cut_fraction() * 100.0);
        std::cerr << "Wrote " << output << " (" << mask.width() << "x" << mask.height()
                  << ", cut fraction " << mask.cut_fraction() << ")\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace snowflake::cli
