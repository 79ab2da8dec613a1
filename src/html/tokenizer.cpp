#include <toad/html/tokenizer.h>
#include <toad/core/utf8.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <unordered_map>

namespace toad::html {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\f' || c == '\r';
}

char to_lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

const std::unordered_map<std::string, std::string>& named_entities() {
    static const std::unordered_map<std::string, std::string> entities = {
        {"amp", "&"}, {"lt", "<"}, {"gt", ">"}, {"quot", "\""}, {"apos", "'"},
        {"nbsp", "\xC2\xA0"}, {"iexcl", "\xC2\xA1"}, {"cent", "\xC2\xA2"},
        {"pound", "\xC2\xA3"}, {"curren", "\xC2\xA4"}, {"yen", "\xC2\xA5"},
        {"brvbar", "\xC2\xA6"}, {"sect", "\xC2\xA7"}, {"uml", "\xC2\xA8"},
        {"copy", "\xC2\xA9"}, {"ordf", "\xC2\xAA"}, {"laquo", "\xC2\xAB"},
        {"not", "\xC2\xAC"}, {"shy", "\xC2\xAD"}, {"reg", "\xC2\xAE"},
        {"macr", "\xC2\xAF"}, {"deg", "\xC2\xB0"}, {"plusmn", "\xC2\xB1"},
        {"sup2", "\xC2\xB2"}, {"sup3", "\xC2\xB3"}, {"acute", "\xC2\xB4"},
        {"micro", "\xC2\xB5"}, {"para", "\xC2\xB6"}, {"middot", "\xC2\xB7"},
        {"cedil", "\xC2\xB8"}, {"sup1", "\xC2\xB9"}, {"ordm", "\xC2\xBA"},
        {"raquo", "\xC2\xBB"}, {"frac14", "\xC2\xBC"}, {"frac12", "\xC2\xBD"},
        {"frac34", "\xC2\xBE"}, {"iquest", "\xC2\xBF"},
        {"Agrave", "\xC3\x80"}, {"Aacute", "\xC3\x81"}, {"Auml", "\xC3\x84"},
        {"Aring", "\xC3\x85"}, {"AElig", "\xC3\x86"}, {"Ccedil", "\xC3\x87"},
        {"Eacute", "\xC3\x89"}, {"Ntilde", "\xC3\x91"}, {"Ouml", "\xC3\x96"},
        {"times", "\xC3\x97"}, {"Oslash", "\xC3\x98"}, {"Uuml", "\xC3\x9C"},
        {"szlig", "\xC3\x9F"}, {"agrave", "\xC3\xA0"}, {"aacute", "\xC3\xA1"},
        {"acirc", "\xC3\xA2"}, {"auml", "\xC3\xA4"}, {"aring", "\xC3\xA5"},
        {"aelig", "\xC3\xA6"}, {"ccedil", "\xC3\xA7"}, {"egrave", "\xC3\xA8"},
        {"eacute", "\xC3\xA9"}, {"ecirc", "\xC3\xAA"}, {"euml", "\xC3\xAB"},
        {"iacute", "\xC3\xAD"}, {"ntilde", "\xC3\xB1"}, {"oacute", "\xC3\xB3"},
        {"ouml", "\xC3\xB6"}, {"divide", "\xC3\xB7"}, {"oslash", "\xC3\xB8"},
        {"uacute", "\xC3\xBA"}, {"uuml", "\xC3\xBC"}, {"yuml", "\xC3\xBF"},
        {"ndash", "\xE2\x80\x93"}, {"mdash", "\xE2\x80\x94"},
        {"lsquo", "\xE2\x80\x98"}, {"rsquo", "\xE2\x80\x99"},
        {"sbquo", "\xE2\x80\x9A"}, {"ldquo", "\xE2\x80\x9C"},
        {"rdquo", "\xE2\x80\x9D"}, {"bdquo", "\xE2\x80\x9E"},
        {"dagger", "\xE2\x80\xA0"}, {"Dagger", "\xE2\x80\xA1"},
        {"bull", "\xE2\x80\xA2"}, {"hellip", "\xE2\x80\xA6"},
        {"permil", "\xE2\x80\xB0"}, {"prime", "\xE2\x80\xB2"},
        {"lsaquo", "\xE2\x80\xB9"}, {"rsaquo", "\xE2\x80\xBA"},
        {"euro", "\xE2\x82\xAC"}, {"trade", "\xE2\x84\xA2"},
        {"larr", "\xE2\x86\x90"}, {"uarr", "\xE2\x86\x91"},
        {"rarr", "\xE2\x86\x92"}, {"darr", "\xE2\x86\x93"},
        {"harr", "\xE2\x86\x94"}, {"minus", "\xE2\x88\x92"},
        {"infin", "\xE2\x88\x9E"}, {"ne", "\xE2\x89\xA0"},
        {"le", "\xE2\x89\xA4"}, {"ge", "\xE2\x89\xA5"},
        {"ensp", "\xE2\x80\x82"}, {"emsp", "\xE2\x80\x83"},
        {"thinsp", "\xE2\x80\x89"}, {"zwnj", "\xE2\x80\x8C"},
        {"zwj", "\xE2\x80\x8D"}, {"hearts", "\xE2\x99\xA5"},
        {"alpha", "\xCE\xB1"}, {"beta", "\xCE\xB2"}, {"gamma", "\xCE\xB3"},
        {"delta", "\xCE\xB4"}, {"pi", "\xCF\x80"}, {"sigma", "\xCF\x83"},
        {"omega", "\xCF\x89"}, {"lambda", "\xCE\xBB"}, {"mu", "\xCE\xBC"},
    };
    return entities;
}

} // namespace

Tokenizer::Tokenizer(std::string_view input) : input_(input) {}

char Tokenizer::consume() {
    if (pos_ < input_.size()) return input_[pos_++];
    return '\0';
}

char Tokenizer::peek(size_t ahead) const {
    if (pos_ + ahead < input_.size()) return input_[pos_ + ahead];
    return '\0';
}

bool Tokenizer::at_end() const {
    return pos_ >= input_.size();
}

void Tokenizer::reconsume() {
    if (pos_ > 0) --pos_;
}

bool Tokenizer::starts_with_ci(std::string_view literal) const {
    if (input_.size() - pos_ < literal.size()) return false;
    for (size_t i = 0; i < literal.size(); ++i) {
        if (to_lower(input_[pos_ + i]) != to_lower(literal[i])) return false;
    }
    return true;
}

void Tokenizer::begin_tag(Token::Type type) {
    current_token_ = Token{};
    current_token_.type = type;
}

Token Tokenizer::finish_tag() {
    state_ = TokenizerState::Data;
    if (current_token_.type == Token::StartTag && !current_token_.self_closing) {
        const std::string& name = current_token_.name;
        if (name == "script" || name == "style") {
            raw_text_tag_ = name;
            state_ = TokenizerState::RAWTEXT;
        } else if (name == "title" || name == "textarea") {
            raw_text_tag_ = name;
            state_ = TokenizerState::RCDATA;
        }
    }
    return std::move(current_token_);
}

Token Tokenizer::flush_text() {
    Token t;
    t.type = Token::Character;
    t.data = std::move(text_);
    text_.clear();
    return t;
}

Token Tokenizer::emit_eof() {
    done_ = true;
    Token t;
    t.type = Token::EndOfFile;
    return t;
}

Token Tokenizer::emit_unterminated_tag() {
    state_ = TokenizerState::Data;
    text_.append(input_.substr(tag_start_));
    pos_ = input_.size();
    return flush_text();
}

std::string Tokenizer::try_consume_entity() {
    const size_t start = pos_;

    if (peek() == '#') {
        consume();
        bool hex = false;
        if (peek() == 'x' || peek() == 'X') {
            hex = true;
            consume();
        }

        std::string digits;
        while (!at_end() && digits.size() < 8 &&
               (hex ? std::isxdigit(static_cast<unsigned char>(peek()))
                    : std::isdigit(static_cast<unsigned char>(peek())))) {
            digits += consume();
        }
        if (digits.empty()) {
            pos_ = start;
            return "&";
        }
        if (peek() == ';') consume();

        unsigned long code_point = std::strtoul(digits.c_str(), nullptr, hex ? 16 : 10);
        std::string result;
        if (!core::append_utf8(static_cast<std::uint32_t>(code_point), result)) {
            return "\xEF\xBF\xBD";
        }
        return result;
    }

    std::string name;
    while (!at_end() && name.size() < 32 && std::isalnum(static_cast<unsigned char>(peek()))) {
        name += consume();
    }
    const auto& entities = named_entities();
    auto it = entities.find(name);
    if (name.empty() || it == entities.end()) {
        pos_ = start;
        return "&";
    }
    if (peek() == ';') consume();
    return it->second;
}

Token Tokenizer::next_token() {
    while (true) {
        switch (state_) {

        case TokenizerState::Data: {
            if (at_end()) {
                if (!text_.empty()) return flush_text();
                return emit_eof();
            }
            char c = consume();
            if (c == '<') {
                tag_start_ = pos_ - 1;
                state_ = TokenizerState::TagOpen;
                if (!text_.empty()) return flush_text();
                continue;
            }
            if (c == '&') {
                text_ += try_consume_entity();
                continue;
            }
            if (c == '\0') {
                continue;
            }
            text_ += c;
            continue;
        }

        case TokenizerState::TagOpen: {
            if (at_end()) return emit_unterminated_tag();
            char c = consume();
            if (c == '!') {
                state_ = TokenizerState::MarkupDeclarationOpen;
                continue;
            }
            if (c == '/') {
                state_ = TokenizerState::EndTagOpen;
                continue;
            }
            if (std::isalpha(static_cast<unsigned char>(c))) {
                begin_tag(Token::StartTag);
                reconsume();
                state_ = TokenizerState::TagName;
                continue;
            }
            if (c == '?') {
                begin_tag(Token::Comment);
                reconsume();
                state_ = TokenizerState::BogusComment;
                continue;
            }
            // Not a tag after all: "<" is text.
            text_ += '<';
            reconsume();
            state_ = TokenizerState::Data;
            continue;
        }

        case TokenizerState::EndTagOpen: {
            if (at_end()) return emit_unterminated_tag();
            char c = consume();
            if (std::isalpha(static_cast<unsigned char>(c))) {
                begin_tag(Token::EndTag);
                reconsume();
                state_ = TokenizerState::TagName;
                continue;
            }
            if (c == '>') {
                state_ = TokenizerState::Data;
                continue;
            }
            begin_tag(Token::Comment);
            reconsume();
            state_ = TokenizerState::BogusComment;
            continue;
        }

        case TokenizerState::TagName: {
            if (at_end()) return emit_unterminated_tag();
            char c = consume();
            if (is_space(c)) {
                state_ = TokenizerState::BeforeAttributeName;
                continue;
            }
            if (c == '/') {
                state_ = TokenizerState::SelfClosingStartTag;
                continue;
            }
            if (c == '>') return finish_tag();
            if (c != '\0') current_token_.name += to_lower(c);
            continue;
        }

        case TokenizerState::BeforeAttributeName: {
            if (at_end()) return emit_unterminated_tag();
            char c = consume();
            if (is_space(c)) continue;
            if (c == '/' || c == '>') {
                reconsume();
                state_ = TokenizerState::AfterAttributeName;
                continue;
            }
            current_token_.attributes.push_back(Attribute{});
            if (c == '=') {
                current_token_.attributes.back().name = "=";
            } else {
                reconsume();
            }
            state_ = TokenizerState::AttributeName;
            continue;
        }

        case TokenizerState::AttributeName: {
            if (at_end()) return emit_unterminated_tag();
            char c = consume();
            if (is_space(c) || c == '/' || c == '>') {
                reconsume();
                state_ = TokenizerState::AfterAttributeName;
                continue;
            }
            if (c == '=') {
                state_ = TokenizerState::BeforeAttributeValue;
                continue;
            }
            if (c != '\0') current_token_.attributes.back().name += to_lower(c);
            continue;
        }

        case TokenizerState::AfterAttributeName: {
            if (at_end()) return emit_unterminated_tag();
            char c = consume();
            if (is_space(c)) continue;
            if (c == '/') {
                state_ = TokenizerState::SelfClosingStartTag;
                continue;
            }
            if (c == '=') {
                state_ = TokenizerState::BeforeAttributeValue;
                continue;
            }
            if (c == '>') return finish_tag();
            current_token_.attributes.push_back(Attribute{});
            reconsume();
            state_ = TokenizerState::AttributeName;
            continue;
        }

        case TokenizerState::BeforeAttributeValue: {
            if (at_end()) return emit_unterminated_tag();
            char c = consume();
            if (is_space(c)) continue;
            if (c == '"') {
                state_ = TokenizerState::AttributeValueDoubleQuoted;
                continue;
            }
            if (c == '\'') {
                state_ = TokenizerState::AttributeValueSingleQuoted;
                continue;
            }
            if (c == '>') return finish_tag();
            reconsume();
            state_ = TokenizerState::AttributeValueUnquoted;
            continue;
        }

        case TokenizerState::AttributeValueDoubleQuoted:
        case TokenizerState::AttributeValueSingleQuoted: {
            if (at_end()) return emit_unterminated_tag();
            const char quote = state_ == TokenizerState::AttributeValueDoubleQuoted ? '"' : '\'';
            char c = consume();
            if (c == quote) {
                state_ = TokenizerState::BeforeAttributeName;
                continue;
            }
            if (c == '&') {
                current_token_.attributes.back().value += try_consume_entity();
                continue;
            }
            if (c != '\0') current_token_.attributes.back().value += c;
            continue;
        }

        case TokenizerState::AttributeValueUnquoted: {
            if (at_end()) return emit_unterminated_tag();
            char c = consume();
            if (is_space(c)) {
                state_ = TokenizerState::BeforeAttributeName;
                continue;
            }
            if (c == '>') return finish_tag();
            if (c == '&') {
                current_token_.attributes.back().value += try_consume_entity();
                continue;
            }
            if (c != '\0') current_token_.attributes.back().value += c;
            continue;
        }

        case TokenizerState::SelfClosingStartTag: {
            if (at_end()) return emit_unterminated_tag();
            char c = consume();
            if (c == '>') {
                current_token_.self_closing = true;
                return finish_tag();
            }
            reconsume();
            state_ = TokenizerState::BeforeAttributeName;
            continue;
        }

        case TokenizerState::MarkupDeclarationOpen: {
            if (starts_with_ci("--")) {
                pos_ += 2;
                begin_tag(Token::Comment);
                state_ = TokenizerState::Comment;
                continue;
            }
            if (starts_with_ci("doctype")) {
                pos_ += 7;
                begin_tag(Token::DOCTYPE);
                state_ = TokenizerState::DOCTYPE;
                continue;
            }
            begin_tag(Token::Comment);
            state_ = TokenizerState::BogusComment;
            continue;
        }

        case TokenizerState::Comment: {
            state_ = TokenizerState::Data;
            // "<!-->" and "<!--->" are empty comments.
            if (peek() == '>') {
                consume();
                return std::move(current_token_);
            }
            if (peek() == '-' && peek(1) == '>') {
                pos_ += 2;
                return std::move(current_token_);
            }
            auto end = input_.find("-->", pos_);
            if (end == std::string_view::npos) {
                current_token_.data = std::string(input_.substr(pos_));
                pos_ = input_.size();
            } else {
                current_token_.data = std::string(input_.substr(pos_, end - pos_));
                pos_ = end + 3;
            }
            return std::move(current_token_);
        }

        case TokenizerState::BogusComment: {
            state_ = TokenizerState::Data;
            auto end = input_.find('>', pos_);
            if (end == std::string_view::npos) end = input_.size();
            current_token_.data = std::string(input_.substr(pos_, end - pos_));
            pos_ = std::min(end + 1, input_.size());
            return std::move(current_token_);
        }

        case TokenizerState::DOCTYPE: {
            state_ = TokenizerState::Data;
            auto end = input_.find('>', pos_);
            if (end == std::string_view::npos) end = input_.size();
            std::string_view body = input_.substr(pos_, end - pos_);
            pos_ = std::min(end + 1, input_.size());
            size_t i = 0;
            while (i < body.size() && is_space(body[i])) ++i;
            while (i < body.size() && !is_space(body[i])) {
                current_token_.name += to_lower(body[i]);
                ++i;
            }
            return std::move(current_token_);
        }

        case TokenizerState::RAWTEXT:
        case TokenizerState::RCDATA: {
            // Find "</tag" followed by a delimiter, case-insensitively.
            size_t end = pos_;
            size_t found = input_.size();
            while ((end = input_.find("</", end)) != std::string_view::npos) {
                size_t name_end = end + 2 + raw_text_tag_.size();
                if (name_end <= input_.size()) {
                    bool match = true;
                    for (size_t i = 0; i < raw_text_tag_.size(); ++i) {
                        if (to_lower(input_[end + 2 + i]) != raw_text_tag_[i]) {
                            match = false;
                            break;
                        }
                    }
                    char after = name_end < input_.size() ? input_[name_end] : '>';
                    if (match && (is_space(after) || after == '/' || after == '>')) {
                        found = end;
                        break;
                    }
                }
                end += 2;
            }

            if (state_ == TokenizerState::RCDATA) {
                while (pos_ < found) {
                    char c = consume();
                    if (c == '&') {
                        text_ += try_consume_entity();
                    } else {
                        text_ += c;
                    }
                }
            } else {
                text_.append(input_.substr(pos_, found - pos_));
                pos_ = found;
            }
            raw_text_tag_.clear();
            state_ = TokenizerState::Data;
            if (!text_.empty()) return flush_text();
            continue;
        }

        } // switch
    }
}

std::vector<Token> tokenize(std::string_view input) {
    std::vector<Token> tokens;
    Tokenizer tokenizer(input);
    while (true) {
        tokens.push_back(tokenizer.next_token());
        if (tokens.back().type == Token::EndOfFile) break;
    }
    return tokens;
}

} // namespace toad::html
