#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toad::html {

struct Attribute {
    std::string name;
    std::string value;
};

struct Token {
    enum Type { DOCTYPE, StartTag, EndTag, Character, Comment, EndOfFile };
    Type type = EndOfFile;
    std::string name;
    std::vector<Attribute> attributes;
    bool self_closing = false;
    std::string data;  // Character/Comment payload
};

enum class TokenizerState {
    Data, TagOpen, EndTagOpen, TagName,
    BeforeAttributeName, AttributeName, AfterAttributeName,
    BeforeAttributeValue, AttributeValueDoubleQuoted, AttributeValueSingleQuoted,
    AttributeValueUnquoted, SelfClosingStartTag,
    MarkupDeclarationOpen, Comment, BogusComment, DOCTYPE,
    RAWTEXT, RCDATA
};

// Splits markup into tokens. Every input terminates: each state either
// consumes at least one byte or moves to a state that does, and the
// token stream always ends with a single EndOfFile token.
//
// Adjacent character data is batched into one Character token. A tag cut
// off by end of input is emitted as literal text. After a start tag for
// script/style the tokenizer switches to RAWTEXT, and after title/textarea
// to RCDATA, until the matching end tag.
class Tokenizer {
public:
    explicit Tokenizer(std::string_view input);

    Token next_token();
    TokenizerState state() const { return state_; }
    bool done() const { return done_; }

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t tag_start_ = 0;
    TokenizerState state_ = TokenizerState::Data;
    std::string raw_text_tag_;
    Token current_token_;
    std::string text_;
    bool done_ = false;

    char consume();
    char peek(size_t ahead = 0) const;
    bool at_end() const;
    void reconsume();
    bool starts_with_ci(std::string_view literal) const;

    void begin_tag(Token::Type type);
    Token finish_tag();
    Token flush_text();
    Token emit_eof();
    Token emit_unterminated_tag();

    // Called after '&'. Returns the decoded text, or "&" (with the input
    // position restored) when no known reference follows.
    std::string try_consume_entity();
};

std::vector<Token> tokenize(std::string_view input);

} // namespace toad::html
