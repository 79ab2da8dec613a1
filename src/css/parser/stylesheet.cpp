#include <toad/css/parser/stylesheet.h>
#include <toad/css/parser/tokenizer.h>

#include <algorithm>
#include <cctype>

namespace toad::css {

namespace {

std::string ascii_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Renders tokens back to text with whitespace runs collapsed and trimmed.
std::string tokens_to_text(const std::vector<CSSToken>& tokens, size_t begin, size_t end) {
    std::string out;
    for (size_t i = begin; i < end; ++i) {
        const CSSToken& tok = tokens[i];
        switch (tok.type) {
            case CSSToken::Whitespace:
                if (!out.empty() && out.back() != ' ') out += ' ';
                break;
            case CSSToken::Hash:
                out += '#' + tok.value;
                break;
            case CSSToken::Function:
                out += tok.value + '(';
                break;
            case CSSToken::AtKeyword:
                out += '@' + tok.value;
                break;
            case CSSToken::String:
                out += '"' + tok.value + '"';
                break;
            case CSSToken::EndOfFile:
                break;
            default:
                out += tok.value;
                break;
        }
    }
    while (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

} // namespace

class StyleSheetParser {
public:
    StyleSheetParser(std::vector<CSSToken> tokens, std::vector<std::string>& warnings)
        : tokens_(std::move(tokens)), warnings_(warnings) {}

    void parse_rules(StyleSheet& sheet, Origin origin, bool nested);
    std::vector<Declaration> parse_declarations();

private:
    std::vector<CSSToken> tokens_;
    size_t pos_ = 0;
    size_t next_source_order_ = 0;
    std::vector<std::string>& warnings_;

    const CSSToken& current() const;
    bool at_end() const;
    void advance();
    void skip_whitespace();
    void skip_block();
    void skip_component();

    void parse_at_rule(StyleSheet& sheet, Origin origin);
    void parse_style_rule(StyleSheet& sheet, Origin origin);
    bool parse_declaration(std::vector<Declaration>& out);
};

const CSSToken& StyleSheetParser::current() const {
    if (pos_ < tokens_.size()) return tokens_[pos_];
    static const CSSToken eof;
    return eof;
}

bool StyleSheetParser::at_end() const {
    return pos_ >= tokens_.size() || tokens_[pos_].type == CSSToken::EndOfFile;
}

void StyleSheetParser::advance() {
    if (pos_ < tokens_.size()) ++pos_;
}

void StyleSheetParser::skip_whitespace() {
    while (!at_end() && current().type == CSSToken::Whitespace) advance();
}

void StyleSheetParser::skip_block() {
    // Assumes we're at '{'
    if (current().type == CSSToken::LeftBrace) advance();
    int depth = 1;
    while (!at_end() && depth > 0) {
        if (current().type == CSSToken::LeftBrace) depth++;
        else if (current().type == CSSToken::RightBrace) depth--;
        advance();
    }
}

// Skips one token, or a whole balanced block when at an opening bracket.
// Iterative so deeply nested input cannot exhaust the stack.
void StyleSheetParser::skip_component() {
    auto closer_for = [](CSSToken::Type type, CSSToken::Type& close) {
        switch (type) {
            case CSSToken::LeftBrace: close = CSSToken::RightBrace; return true;
            case CSSToken::LeftBracket: close = CSSToken::RightBracket; return true;
            case CSSToken::LeftParen:
            case CSSToken::Function: close = CSSToken::RightParen; return true;
            default: return false;
        }
    };

    std::vector<CSSToken::Type> pending;
    do {
        if (at_end()) return;
        CSSToken::Type close;
        const CSSToken::Type type = current().type;
        if (closer_for(type, close)) {
            pending.push_back(close);
        } else if (!pending.empty() && type == pending.back()) {
            pending.pop_back();
        }
        advance();
    } while (!pending.empty());
}

void StyleSheetParser::parse_rules(StyleSheet& sheet, Origin origin, bool nested) {
    while (true) {
        skip_whitespace();
        if (at_end()) return;
        if (current().type == CSSToken::RightBrace) {
            if (nested) {
                advance();
                return;
            }
            warnings_.push_back("stray '}' skipped");
            advance();
            continue;
        }
        if (current().type == CSSToken::AtKeyword) {
            parse_at_rule(sheet, origin);
        } else {
            parse_style_rule(sheet, origin);
        }
    }
}

void StyleSheetParser::parse_at_rule(StyleSheet& sheet, Origin origin) {
    const std::string name = ascii_lower(current().value);
    advance();

    size_t prelude_start = pos_;
    while (!at_end() && current().type != CSSToken::LeftBrace &&
           current().type != CSSToken::Semicolon) {
        skip_component();
    }
    size_t prelude_end = pos_;

    if (at_end()) return;
    if (current().type == CSSToken::Semicolon) {
        advance();
        warnings_.push_back("@" + name + " ignored");
        return;
    }

    if (name == "media" &&
        media_query_applies(tokens_to_text(tokens_, prelude_start, prelude_end))) {
        advance();  // '{'
        parse_rules(sheet, origin, true);
        return;
    }
    if (name != "media") warnings_.push_back("@" + name + " block ignored");
    skip_block();
}

void StyleSheetParser::parse_style_rule(StyleSheet& sheet, Origin origin) {
    size_t prelude_start = pos_;
    while (!at_end() && current().type != CSSToken::LeftBrace &&
           current().type != CSSToken::RightBrace) {
        skip_component();
    }
    if (at_end()) {
        warnings_.push_back("rule without a declaration block dropped");
        return;
    }
    if (current().type == CSSToken::RightBrace) {
        warnings_.push_back("malformed rule skipped up to '}'");
        advance();
        return;
    }

    std::vector<CSSToken> prelude(tokens_.begin() + static_cast<std::ptrdiff_t>(prelude_start),
                                  tokens_.begin() + static_cast<std::ptrdiff_t>(pos_));
    std::string selector_text = tokens_to_text(tokens_, prelude_start, pos_);
    size_t invalid = 0;
    auto selectors = parse_selector_list(prelude, &invalid);

    advance();  // '{'
    std::vector<Declaration> declarations;
    while (true) {
        skip_whitespace();
        if (at_end()) break;
        if (current().type == CSSToken::RightBrace) {
            advance();
            break;
        }
        if (current().type == CSSToken::Semicolon) {
            advance();
            continue;
        }
        parse_declaration(declarations);
    }

    if (selectors.empty()) {
        warnings_.push_back("rule with unsupported selector '" + selector_text + "' skipped");
        return;
    }
    if (invalid > 0) {
        warnings_.push_back("unsupported selectors dropped from '" + selector_text + "'");
    }

    const size_t order = next_source_order_++;
    for (auto& selector : selectors) {
        StyleRule rule;
        rule.specificity = compute_specificity(selector);
        rule.selector = std::move(selector);
        rule.selector_text = selector_text;
        rule.declarations = declarations;
        rule.source_order = order;
        rule.origin = origin;
        sheet.rules.push_back(std::move(rule));
    }
}

// Parses "name: value [!important]" up to ';' or the closing '}' (which is
// left for the caller). Returns false and skips when malformed.
bool StyleSheetParser::parse_declaration(std::vector<Declaration>& out) {
    auto skip_rest = [this]() {
        while (!at_end() && current().type != CSSToken::Semicolon &&
               current().type != CSSToken::RightBrace) {
            skip_component();
        }
        if (!at_end() && current().type == CSSToken::Semicolon) advance();
    };

    if (current().type != CSSToken::Ident) {
        warnings_.push_back("invalid declaration start '" + current().value + "' skipped");
        skip_rest();
        return false;
    }
    Declaration decl;
    decl.property = ascii_lower(current().value);
    advance();
    skip_whitespace();

    if (at_end() || current().type != CSSToken::Colon) {
        warnings_.push_back("declaration '" + decl.property + "' missing ':' skipped");
        skip_rest();
        return false;
    }
    advance();

    size_t value_start = pos_;
    bool has_block = false;
    while (!at_end() && current().type != CSSToken::Semicolon &&
           current().type != CSSToken::RightBrace) {
        if (current().type == CSSToken::LeftBrace) has_block = true;
        skip_component();
    }
    size_t value_end = pos_;
    if (!at_end() && current().type == CSSToken::Semicolon) advance();

    // Trailing "! important".
    size_t last = value_end;
    while (last > value_start && tokens_[last - 1].type == CSSToken::Whitespace) --last;
    if (last > value_start && tokens_[last - 1].type == CSSToken::Ident &&
        ascii_lower(tokens_[last - 1].value) == "important") {
        size_t bang = last - 1;
        while (bang > value_start && tokens_[bang - 1].type == CSSToken::Whitespace) --bang;
        if (bang > value_start && tokens_[bang - 1].type == CSSToken::Delim &&
            tokens_[bang - 1].value == "!") {
            decl.important = true;
            value_end = bang - 1;
        }
    }

    decl.value = tokens_to_text(tokens_, value_start, value_end);
    if (decl.value.empty() || has_block) {
        warnings_.push_back("declaration '" + decl.property + "' has no usable value");
        return false;
    }
    out.push_back(std::move(decl));
    return true;
}

std::vector<Declaration> StyleSheetParser::parse_declarations() {
    std::vector<Declaration> decls;
    while (true) {
        skip_whitespace();
        if (at_end()) break;
        if (current().type == CSSToken::Semicolon) {
            advance();
            continue;
        }
        if (current().type == CSSToken::RightBrace) {
            warnings_.push_back("stray '}' in declaration list skipped");
            advance();
            continue;
        }
        parse_declaration(decls);
    }
    return decls;
}

bool media_query_applies(std::string_view prelude) {
    std::string text = ascii_lower(std::string(prelude));
    if (text.find_first_not_of(" \t\n") == std::string::npos) return true;

    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        std::string query = text.substr(start, comma - start);
        bool negated = query.find("not ") != std::string::npos;
        bool names_medium = query.find("screen") != std::string::npos ||
                            query.find("all") != std::string::npos;
        // "(min-width: ...)" alone means all media.
        bool features_only = query.find_first_not_of(" \t\n") != std::string::npos &&
                             query[query.find_first_not_of(" \t\n")] == '(';
        if (!negated && (names_medium || features_only)) return true;
        start = comma + 1;
    }
    return false;
}

StyleSheet parse_stylesheet(std::string_view css, Origin origin) {
    StyleSheet sheet;
    StyleSheetParser parser(CSSTokenizer::tokenize_all(css), sheet.warnings);
    parser.parse_rules(sheet, origin, false);
    return sheet;
}

std::vector<Declaration> parse_declaration_block(std::string_view css,
                                                 std::vector<std::string>* warnings) {
    std::vector<std::string> local;
    StyleSheetParser parser(CSSTokenizer::tokenize_all(css), warnings ? *warnings : local);
    return parser.parse_declarations();
}

} // namespace toad::css
