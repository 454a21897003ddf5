#include "cli_common.hpp"
#include <parser/path_parser.hpp>
#include <symmetry/symmetry_replicator.hpp>
#include <symmetry/transform_baker.hpp>

namespace snowflake::cli {

// Reads one SVG path data string, replicates it twelve times and prints the
// baked path data, one line per replica
int command_replicate(int argc, char** argv) {
    auto log = snowflake::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: snowflake replicate <path.txt> [-o <out.txt>] [-c <config.json>]\n";
            return ctx.help ? 0 : 1;
        }

        AppConfig config = load_config(ctx);

        std::string source = read_file(ctx.input_path);
        parser::PathTokenizer tokenizer(source);
        parser::PathParser path_parser(tokenizer);
        PathData path = path_parser.parse();

        for (const auto& warning : path_parser.warnings()) {
            log->warn("Path warning: {}", warning);
            std::cerr << "Warning: " << warning << "\n";
        }
        if (path_parser.has_errors()) {
            for (const auto& error : path_parser.errors()) {
                log->error("Path error: {}", error);
                std::cerr << "Path error: " << error << "\n";
            }
            return 1;
        }
        if (path.empty()) {
            std::cerr << "Error: path data has no commands\n";
            return 1;
        }

        SourceStroke stroke;
        stroke.id = 1;
        stroke.path = path;
        stroke.stroke_width = config.session.stroke.stroke_width;

        SymmetryReplicator replicator(config.session.wedge.center);
        replicator.add_stroke(stroke);

        TransformBaker baker;
        std::ostringstream out;
        for (const auto& replica : *replicator.replicas_for(stroke.id)) {
            out << baker.bake(replica).to_svg(config.export_config.precision) << "\n";
        }

        if (ctx.output_path.empty()) {
            std::cout << out.str();
        } else {
            write_file(ctx.output_path, out.str());
            std::cerr << "Wrote " << ctx.output_path << " ("
                      << replicator.replica_count() << " paths)\n";
        }
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace snowflake::cli
