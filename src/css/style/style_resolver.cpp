#include <toad/css/style/style_resolver.h>
#include <toad/core/config.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <tuple>

namespace toad::css {

namespace {

std::string ascii_lower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Whitespace-separated components; parenthesized groups stay whole.
std::vector<std::string> split_components(const std::string& value) {
    std::vector<std::string> parts;
    std::string current;
    int depth = 0;
    for (char c : value) {
        if (c == '(') ++depth;
        if (c == ')' && depth > 0) --depth;
        if (depth == 0 && std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) parts.push_back(std::move(current));
            current.clear();
            continue;
        }
        current += c;
    }
    if (!current.empty()) parts.push_back(std::move(current));
    return parts;
}

const char* const kSideNames[4] = {"top", "right", "bottom", "left"};

// Expands the 1-4 value box notation to top, right, bottom, left.
bool expand_box(const std::vector<std::string>& parts, std::array<std::string, 4>& out) {
    switch (parts.size()) {
        case 1: out = {parts[0], parts[0], parts[0], parts[0]}; return true;
        case 2: out = {parts[0], parts[1], parts[0], parts[1]}; return true;
        case 3: out = {parts[0], parts[1], parts[2], parts[1]}; return true;
        case 4: out = {parts[0], parts[1], parts[2], parts[3]}; return true;
        default: return false;
    }
}

std::vector<std::string> longhands_of(const std::string& shorthand) {
    std::vector<std::string> out;
    auto per_side = [&](const std::string& prefix, const std::string& suffix) {
        for (const char* side : kSideNames) out.push_back(prefix + side + suffix);
    };
    if (shorthand == "margin" || shorthand == "padding") {
        per_side(shorthand + "-", "");
    } else if (shorthand == "border-width" || shorthand == "border-style" ||
               shorthand == "border-color") {
        per_side("border-", shorthand.substr(6));
    } else if (shorthand == "border") {
        per_side("border-", "-width");
        per_side("border-", "-style");
        per_side("border-", "-color");
    } else if (shorthand.rfind("border-", 0) == 0) {
        out.push_back(shorthand + "-width");
        out.push_back(shorthand + "-style");
        out.push_back(shorthand + "-color");
    } else if (shorthand == "background") {
        out.push_back("background-color");
    } else if (shorthand == "list-style") {
        out.push_back("list-style-type");
    }
    return out;
}

int side_index(std::string_view name) {
    for (int i = 0; i < 4; ++i) {
        if (name == kSideNames[i]) return i;
    }
    return -1;
}

// Splits "margin-top" style names into prefix and side; side is -1 when the
// name carries none. "border-top-width" yields ("border", kTop, "width").
struct SideProperty {
    std::string prefix;
    int side = -1;
    std::string suffix;
};

SideProperty split_side_property(const std::string& name) {
    SideProperty out;
    auto first = name.find('-');
    if (first == std::string::npos) return out;
    out.prefix = name.substr(0, first);
    auto second = name.find('-', first + 1);
    std::string side = name.substr(first + 1, second == std::string::npos
                                                  ? std::string::npos
                                                  : second - first - 1);
    out.side = side_index(side);
    if (second != std::string::npos) out.suffix = name.substr(second + 1);
    return out;
}

// Absolute lengths in CSS pixels; percentages and auto are rejected.
std::optional<float> length_to_px(const Length& length) {
    switch (length.unit) {
        case Length::Unit::Px: return length.value;
        case Length::Unit::Em:
        case Length::Unit::Rem:
        case Length::Unit::Ch: return length.value * core::config::kPixelsPerColumn;
        case Length::Unit::Lh: return length.value * core::config::kPixelsPerRow;
        case Length::Unit::Auto:
        case Length::Unit::Percent: return std::nullopt;
    }
    return std::nullopt;
}

std::optional<float> parse_border_width(const std::string& value) {
    if (value == "thin") return 1.0f;
    if (value == "medium") return 3.0f;
    if (value == "thick") return 5.0f;
    auto length = parse_length(value);
    if (!length) return std::nullopt;
    auto px = length_to_px(*length);
    if (!px || *px < 0) return std::nullopt;
    return px;
}

std::optional<BorderStyle> parse_border_style(const std::string& value) {
    if (value == "none" || value == "hidden") return BorderStyle::None;
    if (value == "solid" || value == "groove" || value == "ridge" ||
        value == "inset" || value == "outset") return BorderStyle::Solid;
    if (value == "dashed") return BorderStyle::Dashed;
    if (value == "dotted") return BorderStyle::Dotted;
    if (value == "double") return BorderStyle::Double;
    return std::nullopt;
}

std::optional<ListStyleType> parse_list_style_type(const std::string& value) {
    if (value == "disc") return ListStyleType::Disc;
    if (value == "circle") return ListStyleType::Circle;
    if (value == "square") return ListStyleType::Square;
    if (value == "decimal" || value == "decimal-leading-zero") return ListStyleType::Decimal;
    if (value == "lower-alpha" || value == "lower-latin") return ListStyleType::LowerAlpha;
    if (value == "upper-alpha" || value == "upper-latin") return ListStyleType::UpperAlpha;
    if (value == "none") return ListStyleType::None;
    return std::nullopt;
}

std::optional<Display> parse_display(const std::string& value) {
    if (value == "block" || value == "flow-root" || value == "flex" || value == "grid" ||
        value == "table" || value == "table-row" || value == "table-row-group" ||
        value == "table-header-group" || value == "table-footer-group" ||
        value == "table-caption") {
        return Display::Block;
    }
    if (value == "inline" || value == "table-cell" || value == "contents") return Display::Inline;
    if (value == "inline-block" || value == "inline-flex" || value == "inline-grid" ||
        value == "inline-table") {
        return Display::InlineBlock;
    }
    if (value == "list-item") return Display::ListItem;
    if (value == "none") return Display::None;
    return std::nullopt;
}

// Copies one longhand from source into style. Returns false for names the
// cascade does not know.
bool copy_longhand(ComputedStyle& style, const ComputedStyle& source, const std::string& prop) {
    if (prop == "display") { style.display = source.display; return true; }
    if (prop == "color") { style.color = source.color; return true; }
    if (prop == "background-color") { style.background_color = source.background_color; return true; }
    if (prop == "font-weight") { style.font_weight = source.font_weight; return true; }
    if (prop == "font-style") { style.font_style = source.font_style; return true; }
    if (prop == "text-decoration" || prop == "text-decoration-line") {
        style.text_decoration = source.text_decoration;
        return true;
    }
    if (prop == "text-align") { style.text_align = source.text_align; return true; }
    if (prop == "white-space") { style.white_space = source.white_space; return true; }
    if (prop == "visibility") { style.visibility = source.visibility; return true; }
    if (prop == "list-style-type") { style.list_style_type = source.list_style_type; return true; }
    if (prop == "width") { style.width = source.width; return true; }
    if (prop == "max-width") { style.max_width = source.max_width; return true; }
    if (prop == "height") { style.height = source.height; return true; }
    if (prop == "float" || prop == "position") return true;

    SideProperty sp = split_side_property(prop);
    if (sp.side < 0) return false;
    if (sp.prefix == "margin" && sp.suffix.empty()) {
        style.margin[sp.side] = source.margin[sp.side];
        return true;
    }
    if (sp.prefix == "padding" && sp.suffix.empty()) {
        style.padding[sp.side] = source.padding[sp.side];
        return true;
    }
    if (sp.prefix == "border") {
        if (sp.suffix == "width") { style.border_width[sp.side] = source.border_width[sp.side]; return true; }
        if (sp.suffix == "style") { style.border_style[sp.side] = source.border_style[sp.side]; return true; }
        if (sp.suffix == "color") { style.border_color[sp.side] = source.border_color[sp.side]; return true; }
    }
    return false;
}

} // namespace

bool cascade_less(const MatchedDeclaration& a, const MatchedDeclaration& b) {
    auto key = [](const MatchedDeclaration& m) {
        return std::make_tuple(static_cast<int>(m.origin), m.declaration->important);
    };
    if (key(a) != key(b)) return key(a) < key(b);
    if (!(a.specificity == b.specificity)) return a.specificity < b.specificity;
    return std::tie(a.sheet_index, a.source_order, a.declaration_index) <
           std::tie(b.sheet_index, b.source_order, b.declaration_index);
}

// ---------------------------------------------------------------------------
// PropertyCascade
// ---------------------------------------------------------------------------

ComputedStyle PropertyCascade::cascade(const std::vector<MatchedDeclaration>& matched,
                                       const ComputedStyle& parent_style) const {
    ComputedStyle result = inherited_style(parent_style);

    std::vector<MatchedDeclaration> sorted = matched;
    std::stable_sort(sorted.begin(), sorted.end(), cascade_less);

    for (const auto& m : sorted) {
        apply_declaration(result, *m.declaration, parent_style);
    }
    return result;
}

std::optional<Color> PropertyCascade::resolve_color(const std::string& value,
                                                    const Color& current) const {
    if (value == "currentcolor") return current;
    if (value == "canvastext") return colors_.canvas_text;
    if (value == "linktext") return colors_.link_text;
    return parse_color(value);
}

bool PropertyCascade::apply_declaration(ComputedStyle& style, const Declaration& decl,
                                        const ComputedStyle& parent) const {
    const std::string& prop = decl.property;
    const std::string value = ascii_lower(trim(decl.value));
    if (value.empty()) return false;

    if (value == "inherit" || value == "initial" || value == "unset") {
        std::vector<std::string> targets;
        if (is_shorthand_property(prop)) {
            targets = longhands_of(prop);
        } else {
            targets.push_back(prop);
        }
        ComputedStyle initial = initial_style();
        initial.color = colors_.canvas_text;
        for (const auto& name : targets) {
            const PropertyInfo* info = find_property(name);
            if (!info) return false;
            bool from_parent = value == "inherit" || (value == "unset" && info->inherited);
            copy_longhand(style, from_parent ? parent : initial, name);
        }
        return true;
    }

    if (is_shorthand_property(prop)) {
        // Shorthands apply all-or-nothing.
        ComputedStyle scratch = style;
        if (!apply_shorthand(scratch, prop, value, parent)) return false;
        style = scratch;
        return true;
    }
    if (!find_property(prop)) return false;
    return apply_longhand(style, prop, value, parent);
}

bool PropertyCascade::apply_longhand(ComputedStyle& style, const std::string& prop,
                                     const std::string& value,
                                     const ComputedStyle& parent) const {
    if (prop == "display") {
        auto display = parse_display(value);
        if (!display) return false;
        style.display = *display;
        return true;
    }
    if (prop == "color") {
        auto color = resolve_color(value, parent.color);
        if (!color) return false;
        style.color = *color;
        return true;
    }
    if (prop == "background-color") {
        auto color = resolve_color(value, style.color);
        if (!color) return false;
        style.background_color = *color;
        return true;
    }
    if (prop == "font-weight") {
        if (value == "normal" || value == "lighter") {
            style.font_weight = FontWeight::Normal;
        } else if (value == "bold" || value == "bolder") {
            style.font_weight = FontWeight::Bold;
        } else {
            if (!std::all_of(value.begin(), value.end(),
                             [](unsigned char c) { return std::isdigit(c) != 0; }) ||
                value.size() > 4) {
                return false;
            }
            int weight = std::stoi(value);
            if (weight < 1 || weight > 1000) return false;
            style.font_weight = weight >= 600 ? FontWeight::Bold : FontWeight::Normal;
        }
        return true;
    }
    if (prop == "font-style") {
        if (value == "normal") style.font_style = FontStyle::Normal;
        else if (value == "italic" || value.rfind("oblique", 0) == 0) style.font_style = FontStyle::Italic;
        else return false;
        return true;
    }
    if (prop == "text-decoration" || prop == "text-decoration-line") {
        bool recognized = false;
        for (const auto& part : split_components(value)) {
            if (part == "underline") { style.text_decoration = TextDecoration::Underline; return true; }
            if (part == "line-through") { style.text_decoration = TextDecoration::LineThrough; return true; }
            if (part == "none") recognized = true;
        }
        if (!recognized) return false;
        style.text_decoration = TextDecoration::None;
        return true;
    }
    if (prop == "text-align") {
        if (value == "left" || value == "start" || value == "justify") style.text_align = TextAlign::Left;
        else if (value == "center") style.text_align = TextAlign::Center;
        else if (value == "right" || value == "end") style.text_align = TextAlign::Right;
        else return false;
        return true;
    }
    if (prop == "white-space") {
        if (value == "normal") style.white_space = WhiteSpace::Normal;
        else if (value == "nowrap") style.white_space = WhiteSpace::NoWrap;
        else if (value == "pre") style.white_space = WhiteSpace::Pre;
        else if (value == "pre-wrap" || value == "break-spaces") style.white_space = WhiteSpace::PreWrap;
        else if (value == "pre-line") style.white_space = WhiteSpace::PreLine;
        else return false;
        return true;
    }
    if (prop == "visibility") {
        if (value == "visible") style.visibility = Visibility::Visible;
        else if (value == "hidden" || value == "collapse") style.visibility = Visibility::Hidden;
        else return false;
        return true;
    }
    if (prop == "list-style-type") {
        auto type = parse_list_style_type(value);
        if (!type) return false;
        style.list_style_type = *type;
        return true;
    }
    if (prop == "width" || prop == "height" || prop == "max-width") {
        std::optional<Length> length;
        if (prop == "max-width" && value == "none") {
            length = Length::auto_val();
        } else {
            length = parse_length(value);
        }
        if (!length || length->value < 0) return false;
        if (prop == "width") style.width = *length;
        else if (prop == "height") style.height = *length;
        else style.max_width = *length;
        return true;
    }
    if (prop == "float" || prop == "position") return true;

    SideProperty sp = split_side_property(prop);
    if (sp.side < 0) return false;
    if (sp.prefix == "margin" && sp.suffix.empty()) {
        auto length = parse_length(value);
        if (!length) return false;
        style.margin[sp.side] = *length;
        return true;
    }
    if (sp.prefix == "padding" && sp.suffix.empty()) {
        auto length = parse_length(value);
        if (!length || length->is_auto() || length->value < 0) return false;
        style.padding[sp.side] = *length;
        return true;
    }
    if (sp.prefix == "border") {
        if (sp.suffix == "width") {
            auto width = parse_border_width(value);
            if (!width) return false;
            style.border_width[sp.side] = *width;
            return true;
        }
        if (sp.suffix == "style") {
            auto border_style = parse_border_style(value);
            if (!border_style) return false;
            style.border_style[sp.side] = *border_style;
            return true;
        }
        if (sp.suffix == "color") {
            if (value == "currentcolor") {
                style.border_color[sp.side] = std::nullopt;
                return true;
            }
            auto color = resolve_color(value, style.color);
            if (!color) return false;
            style.border_color[sp.side] = *color;
            return true;
        }
    }
    return false;
}

bool PropertyCascade::apply_shorthand(ComputedStyle& style, const std::string& prop,
                                      const std::string& value,
                                      const ComputedStyle& parent) const {
    auto parts = split_components(value);

    if (prop == "margin" || prop == "padding" || prop == "border-width" ||
        prop == "border-style" || prop == "border-color") {
        std::array<std::string, 4> sides;
        if (!expand_box(parts, sides)) return false;
        auto names = longhands_of(prop);
        for (size_t i = 0; i < 4; ++i) {
            if (!apply_longhand(style, names[i], sides[i], parent)) return false;
        }
        return true;
    }

    if (prop == "border" || prop.rfind("border-", 0) == 0) {
        std::optional<float> width;
        std::optional<BorderStyle> border_style;
        std::optional<Color> color;
        bool explicit_current = false;
        for (const auto& part : parts) {
            if (!width) {
                if (auto w = parse_border_width(part)) { width = w; continue; }
            }
            if (!border_style) {
                if (auto s = parse_border_style(part)) { border_style = s; continue; }
            }
            if (!color && !explicit_current) {
                if (part == "currentcolor") { explicit_current = true; continue; }
                if (auto c = resolve_color(part, style.color)) { color = c; continue; }
            }
            return false;
        }
        if (parts.empty()) return false;

        std::vector<int> sides;
        if (prop == "border") {
            sides = {kTop, kRight, kBottom, kLeft};
        } else {
            int side = side_index(prop.substr(7));
            if (side < 0) return false;
            sides.push_back(side);
        }
        for (int side : sides) {
            style.border_width[side] = width.value_or(3.0f);
            style.border_style[side] = border_style.value_or(BorderStyle::None);
            style.border_color[side] = color;
        }
        return true;
    }

    if (prop == "background") {
        std::optional<Color> color;
        for (const auto& part : parts) {
            if (auto c = resolve_color(part, style.color)) color = c;
        }
        style.background_color = color.value_or(Color::transparent());
        return true;
    }

    if (prop == "list-style") {
        for (const auto& part : parts) {
            if (auto type = parse_list_style_type(part)) {
                style.list_style_type = *type;
                return true;
            }
        }
        return false;
    }
    return false;
}

// ---------------------------------------------------------------------------
// StyleResolver
// ---------------------------------------------------------------------------

StyleResolver::StyleResolver(const StyleSheet& user_agent, SystemColors colors)
    : user_agent_(user_agent), colors_(colors), cascade_(colors) {}

void StyleResolver::add_author_sheet(StyleSheet sheet) {
    author_sheets_.push_back(std::move(sheet));
}

std::vector<MatchedDeclaration> StyleResolver::collect_matching(
    const dom::Document& document, dom::NodeId element,
    std::vector<Declaration>& inline_storage) const {
    std::vector<MatchedDeclaration> matched;
    SelectorMatcher matcher(document);

    auto collect = [&](const StyleSheet& sheet, size_t sheet_index) {
        for (const auto& rule : sheet.rules) {
            if (!matcher.matches(element, rule.selector)) continue;
            for (size_t i = 0; i < rule.declarations.size(); ++i) {
                MatchedDeclaration m;
                m.declaration = &rule.declarations[i];
                m.origin = rule.origin;
                m.specificity = rule.specificity;
                m.sheet_index = sheet_index;
                m.source_order = rule.source_order;
                m.declaration_index = i;
                matched.push_back(m);
            }
        }
    };

    collect(user_agent_, 0);
    for (size_t i = 0; i < author_sheets_.size(); ++i) {
        collect(author_sheets_[i], i + 1);
    }

    inline_storage.clear();
    if (const std::string* style_attr = document.node(element).attribute("style")) {
        inline_storage = parse_declaration_block(*style_attr);
        for (size_t i = 0; i < inline_storage.size(); ++i) {
            MatchedDeclaration m;
            m.declaration = &inline_storage[i];
            m.origin = Origin::Inline;
            m.sheet_index = author_sheets_.size() + 1;
            m.declaration_index = i;
            matched.push_back(m);
        }
    }
    return matched;
}

ComputedStyle StyleResolver::resolve(const dom::Document& document, dom::NodeId element,
                                     const ComputedStyle& parent_style) const {
    std::vector<Declaration> inline_storage;
    auto matched = collect_matching(document, element, inline_storage);
    return cascade_.cascade(matched, parent_style);
}

ComputedStyle StyleResolver::root_style() const {
    ComputedStyle root = initial_style();
    root.display = Display::Block;
    root.color = colors_.canvas_text;
    return root;
}

StyleMap StyleResolver::resolve_document(const dom::Document& document) const {
    StyleMap styles(document.size());
    styles[dom::Document::kRoot] = root_style();

    // Parents are always allocated before their children, so a single pass
    // in id order sees every parent style first.
    for (dom::NodeId id = 1; id < document.size(); ++id) {
        const dom::Node& node = document.node(id);
        const ComputedStyle& parent = styles[node.parent.value_or(dom::Document::kRoot)];
        if (node.is_element()) {
            styles[id] = resolve(document, id, parent);
        } else {
            styles[id] = parent;
        }
    }
    return styles;
}

} // namespace toad::css
