#pragma once
#include <toad/css/parser/selector.h>

#include <string>
#include <string_view>
#include <vector>

namespace toad::css {

enum class Origin {
    UserAgent,
    Author,
    Inline
};

struct Declaration {
    std::string property;  // lowercase
    std::string value;     // normalized token text, "!important" removed
    bool important = false;
};

// One rule per complex selector: "h1, h2 { ... }" yields two rules that
// share declarations and source order.
struct StyleRule {
    ComplexSelector selector;
    std::string selector_text;
    std::vector<Declaration> declarations;
    Specificity specificity;
    size_t source_order = 0;
    Origin origin = Origin::Author;
};

struct StyleSheet {
    std::vector<StyleRule> rules;
    // Recovered parse errors: skipped declarations, rules and at-rules.
    std::vector<std::string> warnings;
};

StyleSheet parse_stylesheet(std::string_view css, Origin origin = Origin::Author);
std::vector<Declaration> parse_declaration_block(std::string_view css,
                                                 std::vector<std::string>* warnings = nullptr);

// True when an @media prelude applies to a terminal screen: an empty query,
// or any comma-separated query naming "screen" or "all" without "not".
bool media_query_applies(std::string_view prelude);

} // namespace toad::css
