#pragma once
#include <toad/css/parser/stylesheet.h>
#include <toad/css/style/computed_style.h>
#include <toad/css/style/selector_matcher.h>
#include <toad/dom/document.h>

#include <string>
#include <vector>

namespace toad::css {

// Values of the CanvasText and LinkText system colors; the root element
// inherits canvas_text.
struct SystemColors {
    Color canvas_text = Color::black();
    Color link_text = {0, 0, 238, 255};
};

struct MatchedDeclaration {
    const Declaration* declaration = nullptr;
    Origin origin = Origin::Author;
    Specificity specificity;
    size_t sheet_index = 0;
    size_t source_order = 0;
    size_t declaration_index = 0;
};

// Ascending cascade order: origin, then importance within the origin, then
// specificity, then position in the source. Applying a sorted list in order
// makes the last applied value win.
bool cascade_less(const MatchedDeclaration& a, const MatchedDeclaration& b);

class PropertyCascade {
public:
    explicit PropertyCascade(SystemColors colors = {}) : colors_(colors) {}

    ComputedStyle cascade(const std::vector<MatchedDeclaration>& matched,
                          const ComputedStyle& parent_style) const;

    // Returns false when the property or value is not supported; the
    // style is left untouched in that case.
    bool apply_declaration(ComputedStyle& style, const Declaration& decl,
                           const ComputedStyle& parent) const;

private:
    SystemColors colors_;

    bool apply_longhand(ComputedStyle& style, const std::string& property,
                        const std::string& value, const ComputedStyle& parent) const;
    bool apply_shorthand(ComputedStyle& style, const std::string& property,
                         const std::string& value, const ComputedStyle& parent) const;
    std::optional<Color> resolve_color(const std::string& value, const Color& current) const;
};

// One computed style per node of a document, indexed by dom::NodeId.
// Text and comment nodes carry their parent's style.
using StyleMap = std::vector<ComputedStyle>;

// Resolves computed styles from the user-agent sheet, author sheets (in
// document order) and style attributes. A pure function of its inputs.
class StyleResolver {
public:
    explicit StyleResolver(const StyleSheet& user_agent, SystemColors colors = {});

    void add_author_sheet(StyleSheet sheet);
    size_t author_sheet_count() const { return author_sheets_.size(); }

    std::vector<MatchedDeclaration> collect_matching(const dom::Document& document,
                                                     dom::NodeId element,
                                                     std::vector<Declaration>& inline_storage) const;

    ComputedStyle resolve(const dom::Document& document, dom::NodeId element,
                          const ComputedStyle& parent_style) const;

    StyleMap resolve_document(const dom::Document& document) const;

    ComputedStyle root_style() const;

private:
    const StyleSheet& user_agent_;
    std::vector<StyleSheet> author_sheets_;
    SystemColors colors_;
    PropertyCascade cascade_;
};

} // namespace toad::css
