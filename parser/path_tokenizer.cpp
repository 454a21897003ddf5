#include "path_tokenizer.hpp"
#include <cctype>
#include <charconv>
#include <string>

namespace snowflake {
namespace parser {

PathTokenizer::PathTokenizer(std::string_view input) : input_(input) {}

bool PathTokenizer::at_end() const {
    return pos_ >= input_.size();
}

char PathTokenizer::current() const {
    if (at_end()) return '\0';
    return input_[pos_];
}

char PathTokenizer::peek_char(size_t offset) const {
    if (pos_ + offset >= input_.size()) return '\0';
    return input_[pos_ + offset];
}

void PathTokenizer::skip_whitespace() {
    while (!at_end() && std::isspace(static_cast<unsigned char>(current()))) {
        ++pos_;
    }
}

PathToken PathTokenizer::next() {
    skip_whitespace();

    uint32_t column = static_cast<uint32_t>(pos_ + 1);
    if (at_end()) {
        return PathToken{PathTokenType::EndOfFile, "", column, std::nullopt};
    }

    char c = current();

    if (c == ',') {
        ++pos_;
        return PathToken{PathTokenType::Comma, ",", column, std::nullopt};
    }

    if (std::isalpha(static_cast<unsigned char>(c)) && c != 'e' && c != 'E') {
        ++pos_;
        PathToken token{PathTokenType::Command, std::string(1, c), column, std::nullopt};
        token.command = c;
        return token;
    }

    if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+' ||
        (c == '.' && std::isdigit(static_cast<unsigned char>(peek_char())))) {
        return scan_number();
    }

    ++pos_;
    return PathToken{PathTokenType::Unknown, std::string(1, c), column, std::nullopt};
}

PathToken PathTokenizer::scan_number() {
    size_t start = pos_;
    uint32_t column = static_cast<uint32_t>(pos_ + 1);

    if (current() == '-' || current() == '+') {
        ++pos_;
    }

    bool seen_dot = false;
    bool seen_digit = false;
    while (!at_end()) {
        char c = current();
        if (std::isdigit(static_cast<unsigned char>(c))) {
            seen_digit = true;
            ++pos_;
        } else if (c == '.' && !seen_dot) {
            // A second dot starts the next number ("0.5.5")
            seen_dot = true;
            ++pos_;
        } else {
            break;
        }
    }

    // Exponent
    if (seen_digit && (current() == 'e' || current() == 'E')) {
        size_t exp_pos = pos_ + 1;
        if (exp_pos < input_.size() && (input_[exp_pos] == '-' || input_[exp_pos] == '+')) {
            ++exp_pos;
        }
        if (exp_pos < input_.size() && std::isdigit(static_cast<unsigned char>(input_[exp_pos]))) {
            pos_ = exp_pos;
            while (!at_end() && std::isdigit(static_cast<unsigned char>(current()))) {
                ++pos_;
            }
        }
    }

    std::string text(input_.substr(start, pos_ - start));
    if (!seen_digit) {
        return PathToken{PathTokenType::Unknown, text, column, std::nullopt};
    }

    // std::from_chars rejects a leading '+'
    std::string_view digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
    }

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        return PathToken{PathTokenType::Unknown, text, column, std::nullopt};
    }

    return PathToken{PathTokenType::Number, text, column, value};
}

}  // namespace parser
}  // namespace snowflake
