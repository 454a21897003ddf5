#ifndef SNOWFLAKE_PARSER_PATH_TOKENIZER_HPP
#define SNOWFLAKE_PARSER_PATH_TOKENIZER_HPP

#include "path_token.hpp"
#include <string_view>

namespace snowflake {
namespace parser {

// Splits SVG path data ("M 1 2 L3,4 c-1-2.5.5 1") into tokens
class PathTokenizer {
public:
    explicit PathTokenizer(std::string_view input);

    PathToken next();
    bool at_end() const;

private:
    std::string_view input_;
    size_t pos_ = 0;

    void skip_whitespace();
    char current() const;
    char peek_char(size_t offset = 1) const;

    PathToken scan_number();
};

}  // namespace parser
}  // namespace snowflake

#endif // SNOWFLAKE_PARSER_PATH_TOKENIZER_HPP
