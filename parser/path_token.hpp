#ifndef SNOWFLAKE_PARSER_PATH_TOKEN_HPP
#define SNOWFLAKE_PARSER_PATH_TOKEN_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace snowflake {
namespace parser {

enum class PathTokenType {
    Command,    // any command letter, supported or not
    Number,
    Comma,
    EndOfFile,
    Unknown
};

struct PathToken {
    PathTokenType type;
    std::string text;
    uint32_t column;
    std::optional<double> number;     // For Number tokens
    char command = '\0';              // For Command tokens
};

}  // namespace parser
}  // namespace snowflake

#endif // SNOWFLAKE_PARSER_PATH_TOKEN_HPP
