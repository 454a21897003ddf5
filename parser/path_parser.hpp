#ifndef SNOWFLAKE_PARSER_PATH_PARSER_HPP
#define SNOWFLAKE_PARSER_PATH_PARSER_HPP

#include "path_tokenizer.hpp"
#include <geometry/path_data.hpp>
#include <string>
#include <vector>

namespace snowflake {
namespace parser {

// Reads SVG path data into PathData. Supports M, L, Q and C in absolute and
// relative form. Anything else is skipped with a warning and parsing goes
// on with the next command; commands already read are kept.
class PathParser {
public:
    explicit PathParser(PathTokenizer tokenizer);

    PathData parse();

    const std::vector<std::string>& errors() const { return errors_; }
    bool has_errors() const { return !errors_.empty(); }

    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    PathTokenizer tokenizer_;
    PathToken current_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;
    Vec2 current_point_;    // end of the last command, origin of relative ones

    void advance();
    bool check(PathTokenType type) const;
    void error(const std::string& message);
    void warning(const std::string& message);

    // Numbers up to the next command, commas skipped
    std::vector<double> read_arguments();
    void parse_command(char letter, PathData& path);
};

}  // namespace parser
}  // namespace snowflake

#endif // SNOWFLAKE_PARSER_PATH_PARSER_HPP
