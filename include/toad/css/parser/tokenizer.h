#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace toad::css {

struct CSSToken {
    enum Type {
        Ident, Function, AtKeyword, Hash, String, Number, Percentage,
        Dimension, Whitespace, Colon, Semicolon, Comma,
        LeftBrace, RightBrace, LeftParen, RightParen, LeftBracket, RightBracket,
        Delim, EndOfFile
    };
    Type type = EndOfFile;
    std::string value;
    double numeric_value = 0;
    std::string unit;

    bool operator==(const CSSToken& other) const;
};

// Splits stylesheet text (or a style attribute) into tokens. Comments and
// the HTML comment markers <!-- and --> are dropped.
class CSSTokenizer {
public:
    explicit CSSTokenizer(std::string_view input);
    CSSToken next_token();

    static std::vector<CSSToken> tokenize_all(std::string_view input);

private:
    std::string_view input_;
    size_t pos_ = 0;

    char consume();
    char peek(size_t offset = 0) const;
    bool at_end() const;
    void reconsume();

    bool skip_comments_and_markers();
    CSSToken consume_string(char ending);
    CSSToken consume_numeric();
    CSSToken consume_ident_like();
    std::string consume_name();
    bool starts_identifier() const;
    bool starts_number() const;
};

bool is_name_start_char(char c);
bool is_name_char(char c);

} // namespace toad::css
