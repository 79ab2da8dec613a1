#include <toad/css/parser/tokenizer.h>
#include <toad/core/utf8.h>

#include <cctype>
#include <cstdlib>

namespace toad::css {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

CSSToken make_token(CSSToken::Type type, std::string value) {
    CSSToken token;
    token.type = type;
    token.value = std::move(value);
    return token;
}

} // namespace

bool is_name_start_char(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool is_name_char(char c) {
    return is_name_start_char(c) || is_digit(c) || c == '-';
}

bool CSSToken::operator==(const CSSToken& other) const {
    return type == other.type && value == other.value &&
           numeric_value == other.numeric_value && unit == other.unit;
}

CSSTokenizer::CSSTokenizer(std::string_view input) : input_(input) {}

char CSSTokenizer::consume() {
    if (pos_ < input_.size()) return input_[pos_++];
    return '\0';
}

char CSSTokenizer::peek(size_t offset) const {
    if (pos_ + offset < input_.size()) return input_[pos_ + offset];
    return '\0';
}

bool CSSTokenizer::at_end() const {
    return pos_ >= input_.size();
}

void CSSTokenizer::reconsume() {
    if (pos_ > 0) --pos_;
}

// Returns true when something was skipped.
bool CSSTokenizer::skip_comments_and_markers() {
    if (peek() == '/' && peek(1) == '*') {
        auto end = input_.find("*/", pos_ + 2);
        pos_ = end == std::string_view::npos ? input_.size() : end + 2;
        return true;
    }
    if (peek() == '<' && peek(1) == '!' && peek(2) == '-' && peek(3) == '-') {
        pos_ += 4;
        return true;
    }
    if (peek() == '-' && peek(1) == '-' && peek(2) == '>') {
        pos_ += 3;
        return true;
    }
    return false;
}

bool CSSTokenizer::starts_identifier() const {
    char c = peek();
    if (is_name_start_char(c)) return true;
    if (c == '-') {
        char next = peek(1);
        return is_name_start_char(next) || next == '-' || next == '\\';
    }
    if (c == '\\') return peek(1) != '\n' && peek(1) != '\0';
    return false;
}

bool CSSTokenizer::starts_number() const {
    char c = peek();
    if (is_digit(c)) return true;
    if (c == '.') return is_digit(peek(1));
    if (c == '+' || c == '-') {
        return is_digit(peek(1)) || (peek(1) == '.' && is_digit(peek(2)));
    }
    return false;
}

std::string CSSTokenizer::consume_name() {
    std::string result;
    while (!at_end()) {
        char c = peek();
        if (is_name_char(c)) {
            result += consume();
            continue;
        }
        if (c != '\\' || peek(1) == '\n' || peek(1) == '\0') break;

        consume();
        char escaped = consume();
        if (!std::isxdigit(static_cast<unsigned char>(escaped))) {
            result += escaped;
            continue;
        }
        std::string hex(1, escaped);
        while (hex.size() < 6 && std::isxdigit(static_cast<unsigned char>(peek()))) {
            hex += consume();
        }
        if (is_space(peek())) consume();
        auto code = std::strtoul(hex.c_str(), nullptr, 16);
        if (!core::append_utf8(static_cast<std::uint32_t>(code), result)) {
            result += "\xEF\xBF\xBD";
        }
    }
    return result;
}

CSSToken CSSTokenizer::consume_string(char ending) {
    CSSToken token;
    token.type = CSSToken::String;

    while (!at_end()) {
        char c = consume();
        if (c == ending) return token;
        if (c == '\n') {
            // Unterminated at end of line.
            reconsume();
            return token;
        }
        if (c == '\\') {
            if (at_end()) break;
            if (peek() == '\n') {
                consume();
            } else {
                token.value += consume();
            }
            continue;
        }
        token.value += c;
    }
    return token;
}

CSSToken CSSTokenizer::consume_numeric() {
    const size_t start = pos_;
    if (peek() == '+' || peek() == '-') consume();
    while (is_digit(peek())) consume();
    if (peek() == '.' && is_digit(peek(1))) {
        consume();
        while (is_digit(peek())) consume();
    }
    if ((peek() == 'e' || peek() == 'E') &&
        (is_digit(peek(1)) || ((peek(1) == '+' || peek(1) == '-') && is_digit(peek(2))))) {
        consume();
        if (peek() == '+' || peek() == '-') consume();
        while (is_digit(peek())) consume();
    }

    std::string text(input_.substr(start, pos_ - start));
    CSSToken token;
    token.numeric_value = std::strtod(text.c_str(), nullptr);

    if (starts_identifier()) {
        token.type = CSSToken::Dimension;
        token.unit = consume_name();
        token.value = text + token.unit;
    } else if (peek() == '%') {
        consume();
        token.type = CSSToken::Percentage;
        token.value = text + "%";
    } else {
        token.type = CSSToken::Number;
        token.value = std::move(text);
    }
    return token;
}

CSSToken CSSTokenizer::consume_ident_like() {
    std::string name = consume_name();
    if (peek() == '(') {
        consume();
        return make_token(CSSToken::Function, std::move(name));
    }
    return make_token(CSSToken::Ident, std::move(name));
}

CSSToken CSSTokenizer::next_token() {
    while (skip_comments_and_markers()) {}

    if (at_end()) return make_token(CSSToken::EndOfFile, "");

    char c = consume();
    if (is_space(c)) {
        while (is_space(peek())) consume();
        return make_token(CSSToken::Whitespace, " ");
    }

    switch (c) {
        case '"':
        case '\'':
            return consume_string(c);
        case '#':
            if (is_name_char(peek()) || peek() == '\\') {
                return make_token(CSSToken::Hash, consume_name());
            }
            return make_token(CSSToken::Delim, "#");
        case '(': return make_token(CSSToken::LeftParen, "(");
        case ')': return make_token(CSSToken::RightParen, ")");
        case '[': return make_token(CSSToken::LeftBracket, "[");
        case ']': return make_token(CSSToken::RightBracket, "]");
        case '{': return make_token(CSSToken::LeftBrace, "{");
        case '}': return make_token(CSSToken::RightBrace, "}");
        case ',': return make_token(CSSToken::Comma, ",");
        case ':': return make_token(CSSToken::Colon, ":");
        case ';': return make_token(CSSToken::Semicolon, ";");
        case '@':
            if (starts_identifier()) return make_token(CSSToken::AtKeyword, consume_name());
            return make_token(CSSToken::Delim, "@");
        case '+':
        case '-':
        case '.':
            reconsume();
            if (starts_number()) return consume_numeric();
            if (c == '-' && starts_identifier()) return consume_ident_like();
            consume();
            return make_token(CSSToken::Delim, std::string(1, c));
        case '\\':
            reconsume();
            if (starts_identifier()) return consume_ident_like();
            consume();
            return make_token(CSSToken::Delim, "\\");
        default:
            break;
    }

    if (is_digit(c)) {
        reconsume();
        return consume_numeric();
    }
    if (is_name_start_char(c)) {
        reconsume();
        return consume_ident_like();
    }
    return make_token(CSSToken::Delim, std::string(1, c));
}

std::vector<CSSToken> CSSTokenizer::tokenize_all(std::string_view input) {
    CSSTokenizer tokenizer(input);
    std::vector<CSSToken> tokens;
    while (true) {
        tokens.push_back(tokenizer.next_token());
        if (tokens.back().type == CSSToken::EndOfFile) break;
    }
    return tokens;
}

} // namespace toad::css
