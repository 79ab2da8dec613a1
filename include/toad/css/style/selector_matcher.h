#pragma once
#include <toad/css/parser/selector.h>
#include <toad/dom/document.h>

#include <cstdint>
#include <unordered_set>

namespace toad::css {

// Matches selectors against elements of a dom::Document, walking the
// ancestor chain right to left for combinators.
class SelectorMatcher {
public:
    explicit SelectorMatcher(const dom::Document& document) : document_(document) {}

    bool matches(dom::NodeId element, const ComplexSelector& selector) const;
    bool matches_compound(dom::NodeId element, const CompoundSelector& compound) const;
    bool matches_simple(dom::NodeId element, const SimpleSelector& simple) const;

private:
    using FailedSet = std::unordered_set<std::uint64_t>;

    const dom::Document& document_;

    bool matches_from(dom::NodeId element, const ComplexSelector& selector, size_t part,
                      FailedSet& failed) const;
    std::optional<dom::NodeId> parent_element(dom::NodeId element) const;
};

} // namespace toad::css
