#include <iostream>
#include <string>

#include <cli/cli_common.hpp>
#include <common/logging.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Draws inside one 30 degree wedge and replicates it into a\n";
    std::cerr << "twelve-fold symmetric, laser-cuttable snowflake.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  render <strokes.json>   Replay a stroke script, export SVG\n";
    std::cerr << "  bake <strokes.json>     Replay a stroke script, write baked paths as JSON\n";
    std::cerr << "  fill <strokes.json>     Replay a stroke script, write the fill mask (PGM)\n";
    std::cerr << "  replicate <path.txt>    Replicate one SVG path data string\n";
    std::cerr << "  draw [strokes.json]     Open the interactive drawing window\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --output <file>     Output file\n";
    std::cerr << "  -c, --config <file>     JSON configuration\n";
    std::cerr << "  -v, --verbose           Debug logging\n";
    std::cerr << "  -h, --help              Show help\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  SNOWFLAKE_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    auto log = snowflake::logging::get_logger();

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    log->debug("Command: {}", command);

    if (command == "render") {
        return snowflake::cli::command_render(argc, argv);
    } else if (command == "bake") {
        return snowflake::cli::command_bake(argc, argv);
    } else if (command == "fill") {
        return snowflake::cli::command_fill(argc, argv);
    } else if (command == "replicate") {
        return snowflake::cli::command_replicate(argc, argv);
    } else if (command == "draw") {
        return snowflake::cli::command_draw(argc, argv);
    } else if (command == "--help" || command == "-h" || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
