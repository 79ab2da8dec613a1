#pragma once
#include <toad/css/parser/tokenizer.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toad::css {

enum class SimpleSelectorType {
    Type,        // div, p, span
    Class,       // .foo
    Id,          // #bar
    Universal,   // *
    Attribute,   // [attr], [attr=val]
    PseudoClass  // :link, :first-child
};

enum class AttributeMatch {
    Exists,     // [attr]
    Exact,      // [attr=val]
    Includes,   // [attr~=val]
    DashMatch,  // [attr|=val]
    Prefix,     // [attr^=val]
    Suffix,     // [attr$=val]
    Substring   // [attr*=val]
};

struct SimpleSelector {
    SimpleSelectorType type = SimpleSelectorType::Universal;
    std::string value;

    AttributeMatch attr_match = AttributeMatch::Exists;
    std::string attr_name;
    std::string attr_value;
};

enum class Combinator {
    Descendant,   // space
    Child         // >
};

struct CompoundSelector {
    std::vector<SimpleSelector> simple_selectors;
};

struct ComplexSelector {
    struct Part {
        CompoundSelector compound;
        std::optional<Combinator> combinator;  // combinator BEFORE this compound
    };
    std::vector<Part> parts;
};

struct Specificity {
    int a = 0;  // ID selectors
    int b = 0;  // class, attribute, pseudo-class
    int c = 0;  // type

    bool operator<(const Specificity& other) const;
    bool operator==(const Specificity& other) const;
    bool operator>(const Specificity& other) const { return other < *this; }
};

Specificity compute_specificity(const ComplexSelector& selector);

// Pseudo-classes the matcher understands. Any other pseudo-class, any
// pseudo-element and the sibling combinators make a selector invalid.
bool is_supported_pseudo_class(std::string_view name);

// Parses one comma-separated selector list. Each invalid complex selector is
// dropped on its own; invalid_count reports how many were dropped.
std::vector<ComplexSelector> parse_selector_list(const std::vector<CSSToken>& tokens,
                                                 size_t* invalid_count = nullptr);
std::vector<ComplexSelector> parse_selector_list(std::string_view input,
                                                 size_t* invalid_count = nullptr);

} // namespace toad::css
