#include "path_parser.hpp"
#include <common/logging.hpp>
#include <cctype>
#include <sstream>

namespace snowflake {
namespace parser {

PathParser::PathParser(PathTokenizer tokenizer) : tokenizer_(std::move(tokenizer)) {
    advance();
}

void PathParser::advance() {
    current_ = tokenizer_.next();
}

bool PathParser::check(PathTokenType type) const {
    return current_.type == type;
}

void PathParser::error(const std::string& message) {
    std::ostringstream oss;
    oss << message << " at column " << current_.column;
    if (!current_.text.empty()) {
        oss << " (got '" << current_.text << "')";
    }
    errors_.push_back(oss.str());
}

void PathParser::warning(const std::string& message) {
    warnings_.push_back(message);
}

std::vector<double> PathParser::read_arguments() {
    std::vector<double> args;
    while (!check(PathTokenType::Command) && !check(PathTokenType::EndOfFile)) {
        if (check(PathTokenType::Number)) {
            args.push_back(*current_.number);
        } else if (check(PathTokenType::Unknown)) {
            error("Unexpected character in path data");
        }
        advance();
    }
    return args;
}

PathData PathParser::parse() {
    PathData path;

    // Leading garbage before the first command
    if (!check(PathTokenType::Command) && !check(PathTokenType::EndOfFile)) {
        error("Path data must start with a command");
        read_arguments();
    }

    while (check(PathTokenType::Command)) {
        char letter = current_.command;
        uint32_t column = current_.column;
        advance();

        char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));
        if (upper != 'M' && upper != 'L' && upper != 'Q' && upper != 'C') {
            read_arguments();
            std::ostringstream oss;
            oss << "Unsupported path command '" << letter << "' at column " << column << " skipped";
            warning(oss.str());
            continue;
        }

        parse_command(letter, path);
    }

    logging::get_logger()->debug("Parsed {} path commands ({} warnings, {} errors)",
                                 path.size(), warnings_.size(), errors_.size());
    return path;
}

void PathParser::parse_command(char letter, PathData& path) {
    bool relative = std::islower(static_cast<unsigned char>(letter));
    char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(letter)));

    std::vector<double> args = read_arguments();

    if (args.size() % 2 != 0) {
        std::ostringstream oss;
        oss << "Dangling coordinate after '" << letter << "' ignored";
        warning(oss.str());
        args.pop_back();
    }

    std::vector<Vec2> pairs;
    for (size_t i = 0; i + 1 < args.size(); i += 2) {
        pairs.emplace_back(args[i], args[i + 1]);
    }

    PathCommandType type = PathCommandType::LineTo;
    switch (upper) {
        case 'M': type = PathCommandType::MoveTo; break;
        case 'L': type = PathCommandType::LineTo; break;
        case 'Q': type = PathCommandType::QuadraticTo; break;
        case 'C': type = PathCommandType::CubicTo; break;
    }

    size_t group = expected_point_count(type);
    if (pairs.empty() || pairs.size() % group != 0) {
        std::ostringstream oss;
        oss << "Malformed '" << letter << "' command with " << pairs.size()
            << " coordinate pairs, incomplete part skipped";
        warning(oss.str());
    }

    for (size_t i = 0; i + group <= pairs.size(); i += group) {
        PathCommand cmd{type, {}};
        // Extra pairs after a move are implicit line-tos
        if (type == PathCommandType::MoveTo && i > 0) {
            cmd.type = PathCommandType::LineTo;
        }

        Vec2 origin = current_point_;
        for (size_t k = 0; k < group; ++k) {
            Vec2 p = pairs[i + k];
            cmd.points.push_back(relative ? origin + p : p);
        }

        current_point_ = cmd.points.back();
        path.add_command(std::move(cmd));
    }
}

}  // namespace parser
}  // namespace snowflake
