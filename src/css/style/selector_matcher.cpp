#include <toad/css/style/selector_matcher.h>

#include <cctype>
#include <cstdint>

namespace toad::css {

namespace {

bool contains_word(const std::string& list, const std::string& word) {
    if (word.empty()) return false;
    size_t pos = 0;
    while (pos < list.size()) {
        while (pos < list.size() && std::isspace(static_cast<unsigned char>(list[pos]))) ++pos;
        size_t end = pos;
        while (end < list.size() && !std::isspace(static_cast<unsigned char>(list[end]))) ++end;
        if (end > pos && list.compare(pos, end - pos, word) == 0 && end - pos == word.size()) {
            return true;
        }
        pos = end;
    }
    return false;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::optional<dom::NodeId> SelectorMatcher::parent_element(dom::NodeId element) const {
    auto parent = document_.parent(element);
    if (!parent || !document_.node(*parent).is_element()) return std::nullopt;
    return parent;
}

bool SelectorMatcher::matches_simple(dom::NodeId element, const SimpleSelector& simple) const {
    const dom::Node& node = document_.node(element);

    switch (simple.type) {
        case SimpleSelectorType::Universal:
            return true;
        case SimpleSelectorType::Type:
            return node.tag_name == simple.value;
        case SimpleSelectorType::Id: {
            const std::string* id = node.attribute("id");
            return id && *id == simple.value;
        }
        case SimpleSelectorType::Class: {
            const std::string* cls = node.attribute("class");
            return cls && contains_word(*cls, simple.value);
        }
        case SimpleSelectorType::Attribute: {
            const std::string* value = node.attribute(simple.attr_name);
            if (!value) return false;
            const std::string& want = simple.attr_value;
            switch (simple.attr_match) {
                case AttributeMatch::Exists: return true;
                case AttributeMatch::Exact: return *value == want;
                case AttributeMatch::Includes: return contains_word(*value, want);
                case AttributeMatch::DashMatch:
                    return *value == want || value->rfind(want + "-", 0) == 0;
                case AttributeMatch::Prefix:
                    return !want.empty() && value->rfind(want, 0) == 0;
                case AttributeMatch::Suffix:
                    return !want.empty() && ends_with(*value, want);
                case AttributeMatch::Substring:
                    return !want.empty() && value->find(want) != std::string::npos;
            }
            return false;
        }
        case SimpleSelectorType::PseudoClass: {
            const std::string& name = simple.value;
            if (name == "link" || name == "any-link") {
                return (node.tag_name == "a" || node.tag_name == "area") &&
                       node.has_attribute("href");
            }
            if (name == "root") {
                return !parent_element(element).has_value();
            }
            if (name == "first-child" || name == "last-child") {
                auto parent = document_.parent(element);
                if (!parent) return false;
                const auto& siblings = document_.children(*parent);
                std::optional<dom::NodeId> edge;
                if (name == "first-child") {
                    for (auto id : siblings) {
                        if (document_.node(id).is_element()) { edge = id; break; }
                    }
                } else {
                    for (auto it = siblings.rbegin(); it != siblings.rend(); ++it) {
                        if (document_.node(*it).is_element()) { edge = *it; break; }
                    }
                }
                return edge && *edge == element;
            }
            // Dynamic states (:hover, :focus, ...) and :visited never match.
            return false;
        }
    }
    return false;
}

bool SelectorMatcher::matches_compound(dom::NodeId element, const CompoundSelector& compound) const {
    if (!document_.node(element).is_element()) return false;
    for (auto& simple : compound.simple_selectors) {
        if (!matches_simple(element, simple)) return false;
    }
    return true;
}

// failed holds (element, part) pairs already known not to match, so a
// descendant chain is tried at most once per ancestor and part.
bool SelectorMatcher::matches_from(dom::NodeId element, const ComplexSelector& selector,
                                   size_t part, FailedSet& failed) const {
    const std::uint64_t key = (static_cast<std::uint64_t>(element) << 32) | part;
    if (failed.count(key)) return false;

    bool matched = false;
    if (matches_compound(element, selector.parts[part].compound)) {
        if (part == 0) return true;
        auto combinator = selector.parts[part].combinator.value_or(Combinator::Descendant);
        if (combinator == Combinator::Child) {
            auto parent = parent_element(element);
            matched = parent && matches_from(*parent, selector, part - 1, failed);
        } else {
            auto ancestor = parent_element(element);
            while (ancestor && !matched) {
                matched = matches_from(*ancestor, selector, part - 1, failed);
                ancestor = parent_element(*ancestor);
            }
        }
    }
    if (!matched) failed.insert(key);
    return matched;
}

bool SelectorMatcher::matches(dom::NodeId element, const ComplexSelector& selector) const {
    if (selector.parts.empty()) return false;
    FailedSet failed;
    return matches_from(element, selector, selector.parts.size() - 1, failed);
}

} // namespace toad::css
