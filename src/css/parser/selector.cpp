#include <toad/css/parser/selector.h>

#include <algorithm>
#include <cctype>

namespace toad::css {

namespace {

std::string ascii_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool is_delim(const CSSToken& token, const char* value) {
    return token.type == CSSToken::Delim && token.value == value;
}

} // namespace

bool Specificity::operator<(const Specificity& other) const {
    if (a != other.a) return a < other.a;
    if (b != other.b) return b < other.b;
    return c < other.c;
}

bool Specificity::operator==(const Specificity& other) const {
    return a == other.a && b == other.b && c == other.c;
}

Specificity compute_specificity(const ComplexSelector& selector) {
    Specificity spec;
    for (auto& part : selector.parts) {
        for (auto& ss : part.compound.simple_selectors) {
            switch (ss.type) {
                case SimpleSelectorType::Id:
                    spec.a++;
                    break;
                case SimpleSelectorType::Class:
                case SimpleSelectorType::Attribute:
                case SimpleSelectorType::PseudoClass:
                    spec.b++;
                    break;
                case SimpleSelectorType::Type:
                    spec.c++;
                    break;
                case SimpleSelectorType::Universal:
                    break;
            }
        }
    }
    return spec;
}

bool is_supported_pseudo_class(std::string_view name) {
    return name == "link" || name == "any-link" || name == "visited" ||
           name == "hover" || name == "active" || name == "focus" ||
           name == "first-child" || name == "last-child" || name == "root";
}

// Parses a single complex selector from a token range with no top-level
// commas. Returns nullopt on anything outside the supported grammar.
class SelectorParser {
public:
    SelectorParser(const std::vector<CSSToken>& tokens, size_t begin, size_t end)
        : tokens_(tokens), pos_(begin), end_(end) {}

    std::optional<ComplexSelector> parse();

private:
    const std::vector<CSSToken>& tokens_;
    size_t pos_;
    size_t end_;

    const CSSToken& current() const { return tokens_[pos_]; }
    bool at_end() const { return pos_ >= end_; }
    void advance() { if (pos_ < end_) ++pos_; }
    bool skip_whitespace();

    std::optional<CompoundSelector> parse_compound_selector();
    std::optional<SimpleSelector> parse_attribute_selector();
};

bool SelectorParser::skip_whitespace() {
    bool skipped = false;
    while (!at_end() && current().type == CSSToken::Whitespace) {
        advance();
        skipped = true;
    }
    return skipped;
}

std::optional<ComplexSelector> SelectorParser::parse() {
    ComplexSelector result;
    skip_whitespace();
    std::optional<Combinator> pending;

    while (true) {
        auto compound = parse_compound_selector();
        if (!compound) return std::nullopt;
        result.parts.push_back({std::move(*compound), pending});

        bool had_whitespace = skip_whitespace();
        if (at_end()) break;

        if (is_delim(current(), ">")) {
            advance();
            skip_whitespace();
            pending = Combinator::Child;
        } else if (is_delim(current(), "+") || is_delim(current(), "~")) {
            return std::nullopt;
        } else if (had_whitespace) {
            pending = Combinator::Descendant;
        } else {
            return std::nullopt;
        }
        if (at_end()) return std::nullopt;
    }
    return result;
}

std::optional<CompoundSelector> SelectorParser::parse_compound_selector() {
    CompoundSelector compound;

    while (!at_end()) {
        const CSSToken& tok = current();

        if (tok.type == CSSToken::Ident && compound.simple_selectors.empty()) {
            SimpleSelector ss;
            ss.type = SimpleSelectorType::Type;
            ss.value = ascii_lower(tok.value);
            compound.simple_selectors.push_back(std::move(ss));
            advance();
            continue;
        }

        if (is_delim(tok, "*") && compound.simple_selectors.empty()) {
            SimpleSelector ss;
            ss.type = SimpleSelectorType::Universal;
            ss.value = "*";
            compound.simple_selectors.push_back(std::move(ss));
            advance();
            continue;
        }

        if (is_delim(tok, ".")) {
            advance();
            if (at_end() || current().type != CSSToken::Ident) return std::nullopt;
            SimpleSelector ss;
            ss.type = SimpleSelectorType::Class;
            ss.value = current().value;
            compound.simple_selectors.push_back(std::move(ss));
            advance();
            continue;
        }

        if (tok.type == CSSToken::Hash) {
            if (tok.value.empty() || std::isdigit(static_cast<unsigned char>(tok.value[0]))) {
                return std::nullopt;
            }
            SimpleSelector ss;
            ss.type = SimpleSelectorType::Id;
            ss.value = tok.value;
            compound.simple_selectors.push_back(std::move(ss));
            advance();
            continue;
        }

        if (tok.type == CSSToken::LeftBracket) {
            auto attr = parse_attribute_selector();
            if (!attr) return std::nullopt;
            compound.simple_selectors.push_back(std::move(*attr));
            continue;
        }

        if (tok.type == CSSToken::Colon) {
            advance();
            if (at_end() || current().type != CSSToken::Ident) return std::nullopt;
            std::string name = ascii_lower(current().value);
            if (!is_supported_pseudo_class(name)) return std::nullopt;
            SimpleSelector ss;
            ss.type = SimpleSelectorType::PseudoClass;
            ss.value = std::move(name);
            compound.simple_selectors.push_back(std::move(ss));
            advance();
            continue;
        }

        if (tok.type == CSSToken::Whitespace || is_delim(tok, ">") ||
            is_delim(tok, "+") || is_delim(tok, "~")) {
            break;
        }
        return std::nullopt;
    }

    if (compound.simple_selectors.empty()) return std::nullopt;
    return compound;
}

std::optional<SimpleSelector> SelectorParser::parse_attribute_selector() {
    SimpleSelector ss;
    ss.type = SimpleSelectorType::Attribute;

    advance();  // '['
    skip_whitespace();
    if (at_end() || current().type != CSSToken::Ident) return std::nullopt;
    ss.attr_name = ascii_lower(current().value);
    advance();
    skip_whitespace();

    if (!at_end() && current().type == CSSToken::RightBracket) {
        advance();
        return ss;
    }

    if (at_end() || current().type != CSSToken::Delim) return std::nullopt;
    const std::string op = current().value;
    advance();
    if (op == "=") {
        ss.attr_match = AttributeMatch::Exact;
    } else {
        if (at_end() || !is_delim(current(), "=")) return std::nullopt;
        advance();
        if (op == "~") ss.attr_match = AttributeMatch::Includes;
        else if (op == "|") ss.attr_match = AttributeMatch::DashMatch;
        else if (op == "^") ss.attr_match = AttributeMatch::Prefix;
        else if (op == "$") ss.attr_match = AttributeMatch::Suffix;
        else if (op == "*") ss.attr_match = AttributeMatch::Substring;
        else return std::nullopt;
    }

    skip_whitespace();
    if (at_end() || (current().type != CSSToken::Ident && current().type != CSSToken::String &&
                     current().type != CSSToken::Number)) {
        return std::nullopt;
    }
    ss.attr_value = current().value;
    advance();
    skip_whitespace();
    // Case-sensitivity flags ("i" / "s") are accepted and ignored.
    if (!at_end() && current().type == CSSToken::Ident &&
        (current().value == "i" || current().value == "s")) {
        advance();
        skip_whitespace();
    }
    if (at_end() || current().type != CSSToken::RightBracket) return std::nullopt;
    advance();
    return ss;
}

std::vector<ComplexSelector> parse_selector_list(const std::vector<CSSToken>& tokens,
                                                 size_t* invalid_count) {
    std::vector<ComplexSelector> selectors;
    size_t invalid = 0;
    size_t start = 0;
    int depth = 0;

    auto flush = [&](size_t end) {
        size_t first = start;
        while (first < end && tokens[first].type == CSSToken::Whitespace) ++first;
        if (first == end) {
            ++invalid;
            return;
        }
        auto selector = SelectorParser(tokens, first, end).parse();
        if (selector) {
            selectors.push_back(std::move(*selector));
        } else {
            ++invalid;
        }
    };

    size_t end = tokens.size();
    if (end > 0 && tokens.back().type == CSSToken::EndOfFile) --end;
    for (size_t i = 0; i < end; ++i) {
        switch (tokens[i].type) {
            case CSSToken::Function:
            case CSSToken::LeftParen:
                ++depth;
                break;
            case CSSToken::RightParen:
                if (depth > 0) --depth;
                break;
            case CSSToken::Comma:
                if (depth == 0) {
                    flush(i);
                    start = i + 1;
                }
                break;
            default:
                break;
        }
    }
    flush(end);

    if (invalid_count) *invalid_count = invalid;
    return selectors;
}

std::vector<ComplexSelector> parse_selector_list(std::string_view input, size_t* invalid_count) {
    return parse_selector_list(CSSTokenizer::tokenize_all(input), invalid_count);
}

} // namespace toad::css
