#include <toad/css/style/computed_style.h>
#include <toad/core/config.h>
#include <toad/css/parser/tokenizer.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <unordered_map>
#include <vector>

namespace toad::css {

namespace {

std::string ascii_lower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// Length in CSS pixels; one em (and rem, ch) is one cell wide, one lh one
// cell tall.
float to_px(const Length& length) {
    switch (length.unit) {
        case Length::Unit::Px: return length.value;
        case Length::Unit::Em:
        case Length::Unit::Rem:
        case Length::Unit::Ch: return length.value * core::config::kPixelsPerColumn;
        case Length::Unit::Lh: return length.value * core::config::kPixelsPerRow;
        case Length::Unit::Auto:
        case Length::Unit::Percent: return 0;
    }
    return 0;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<Color> parse_hex_color(std::string_view hex) {
    for (char c : hex) {
        if (hex_digit(c) < 0) return std::nullopt;
    }
    auto nibble = [&](size_t i) { return static_cast<uint8_t>(hex_digit(hex[i]) * 17); };
    auto byte = [&](size_t i) {
        return static_cast<uint8_t>(hex_digit(hex[i]) * 16 + hex_digit(hex[i + 1]));
    };
    switch (hex.size()) {
        case 3: return Color{nibble(0), nibble(1), nibble(2), 255};
        case 4: return Color{nibble(0), nibble(1), nibble(2), nibble(3)};
        case 6: return Color{byte(0), byte(2), byte(4), 255};
        case 8: return Color{byte(0), byte(2), byte(4), byte(6)};
        default: return std::nullopt;
    }
}

uint8_t clamp_channel(float v) {
    return static_cast<uint8_t>(std::clamp(std::lround(v), 0L, 255L));
}

// rgb()/rgba() with comma or space separated components.
std::optional<Color> parse_rgb_function(std::string_view args) {
    auto tokens = CSSTokenizer::tokenize_all(args);
    std::vector<CSSToken> parts;
    for (auto& tok : tokens) {
        if (tok.type == CSSToken::Number || tok.type == CSSToken::Percentage) {
            parts.push_back(tok);
        } else if (tok.type == CSSToken::Whitespace || tok.type == CSSToken::Comma ||
                   tok.type == CSSToken::EndOfFile ||
                   (tok.type == CSSToken::Delim && tok.value == "/")) {
            continue;
        } else {
            return std::nullopt;
        }
    }
    if (parts.size() != 3 && parts.size() != 4) return std::nullopt;

    Color color;
    uint8_t* channels[3] = {&color.r, &color.g, &color.b};
    for (size_t i = 0; i < 3; ++i) {
        float v = static_cast<float>(parts[i].numeric_value);
        if (parts[i].type == CSSToken::Percentage) v = v * 255.0f / 100.0f;
        *channels[i] = clamp_channel(v);
    }
    if (parts.size() == 4) {
        float alpha = static_cast<float>(parts[3].numeric_value);
        if (parts[3].type == CSSToken::Percentage) alpha /= 100.0f;
        color.a = clamp_channel(alpha * 255.0f);
    }
    return color;
}

const std::unordered_map<std::string, Color>& named_colors() {
    static const std::unordered_map<std::string, Color> colors = {
        {"black", {0, 0, 0, 255}},         {"silver", {192, 192, 192, 255}},
        {"gray", {128, 128, 128, 255}},    {"grey", {128, 128, 128, 255}},
        {"white", {255, 255, 255, 255}},   {"maroon", {128, 0, 0, 255}},
        {"red", {255, 0, 0, 255}},         {"purple", {128, 0, 128, 255}},
        {"fuchsia", {255, 0, 255, 255}},   {"magenta", {255, 0, 255, 255}},
        {"green", {0, 128, 0, 255}},       {"lime", {0, 255, 0, 255}},
        {"olive", {128, 128, 0, 255}},     {"yellow", {255, 255, 0, 255}},
        {"navy", {0, 0, 128, 255}},        {"blue", {0, 0, 255, 255}},
        {"teal", {0, 128, 128, 255}},      {"aqua", {0, 255, 255, 255}},
        {"cyan", {0, 255, 255, 255}},      {"orange", {255, 165, 0, 255}},
        {"pink", {255, 192, 203, 255}},    {"brown", {165, 42, 42, 255}},
        {"gold", {255, 215, 0, 255}},      {"indigo", {75, 0, 130, 255}},
        {"violet", {238, 130, 238, 255}},  {"coral", {255, 127, 80, 255}},
        {"crimson", {220, 20, 60, 255}},   {"salmon", {250, 128, 114, 255}},
        {"tomato", {255, 99, 71, 255}},    {"khaki", {240, 230, 140, 255}},
        {"beige", {245, 245, 220, 255}},   {"ivory", {255, 255, 240, 255}},
        {"lavender", {230, 230, 250, 255}}, {"plum", {221, 160, 221, 255}},
        {"orchid", {218, 112, 214, 255}},  {"tan", {210, 180, 140, 255}},
        {"chocolate", {210, 105, 30, 255}}, {"sienna", {160, 82, 45, 255}},
        {"darkred", {139, 0, 0, 255}},     {"darkgreen", {0, 100, 0, 255}},
        {"darkblue", {0, 0, 139, 255}},    {"darkgray", {169, 169, 169, 255}},
        {"darkgrey", {169, 169, 169, 255}}, {"lightgray", {211, 211, 211, 255}},
        {"lightgrey", {211, 211, 211, 255}}, {"dimgray", {105, 105, 105, 255}},
        {"gainsboro", {220, 220, 220, 255}}, {"whitesmoke", {245, 245, 245, 255}},
        {"lightblue", {173, 216, 230, 255}}, {"skyblue", {135, 206, 235, 255}},
        {"steelblue", {70, 130, 180, 255}}, {"royalblue", {65, 105, 225, 255}},
        {"dodgerblue", {30, 144, 255, 255}}, {"midnightblue", {25, 25, 112, 255}},
        {"lightgreen", {144, 238, 144, 255}}, {"seagreen", {46, 139, 87, 255}},
        {"forestgreen", {34, 139, 34, 255}}, {"limegreen", {50, 205, 50, 255}},
        {"darkorange", {255, 140, 0, 255}}, {"orangered", {255, 69, 0, 255}},
        {"firebrick", {178, 34, 34, 255}}, {"lightyellow", {255, 255, 224, 255}},
        {"darkviolet", {148, 0, 211, 255}}, {"slategray", {112, 128, 144, 255}},
        {"slategrey", {112, 128, 144, 255}}, {"aliceblue", {240, 248, 255, 255}},
        {"ghostwhite", {248, 248, 255, 255}}, {"linen", {250, 240, 230, 255}},
    };
    return colors;
}

} // namespace

int Length::to_columns(int parent_columns) const {
    if (unit == Unit::Auto) return 0;
    if (unit == Unit::Percent) {
        return static_cast<int>(std::floor(static_cast<float>(parent_columns) * value / 100.0f));
    }
    return static_cast<int>(std::lround(to_px(*this) / core::config::kPixelsPerColumn));
}

int Length::to_rows() const {
    if (unit == Unit::Auto || unit == Unit::Percent) return 0;
    return static_cast<int>(std::lround(to_px(*this) / core::config::kPixelsPerRow));
}

bool ComputedStyle::has_border(Side side) const {
    return border_style[side] != BorderStyle::None && border_width[side] > 0;
}

Color ComputedStyle::resolved_border_color(Side side) const {
    return border_color[side].value_or(color);
}

bool ComputedStyle::operator==(const ComputedStyle& o) const {
    return display == o.display && color == o.color && background_color == o.background_color &&
           font_weight == o.font_weight && font_style == o.font_style &&
           text_decoration == o.text_decoration && text_align == o.text_align &&
           white_space == o.white_space && visibility == o.visibility &&
           list_style_type == o.list_style_type && margin == o.margin && padding == o.padding &&
           border_width == o.border_width && border_style == o.border_style &&
           border_color == o.border_color && width == o.width && max_width == o.max_width &&
           height == o.height;
}

const PropertyInfo* find_property(std::string_view name) {
    static const PropertyInfo kProperties[] = {
        {"display", false},
        {"color", true},
        {"background-color", false},
        {"font-weight", true},
        {"font-style", true},
        {"text-decoration", true},
        {"text-decoration-line", true},
        {"text-align", true},
        {"white-space", true},
        {"visibility", true},
        {"list-style-type", true},
        {"margin-top", false}, {"margin-right", false},
        {"margin-bottom", false}, {"margin-left", false},
        {"padding-top", false}, {"padding-right", false},
        {"padding-bottom", false}, {"padding-left", false},
        {"border-top-width", false}, {"border-right-width", false},
        {"border-bottom-width", false}, {"border-left-width", false},
        {"border-top-style", false}, {"border-right-style", false},
        {"border-bottom-style", false}, {"border-left-style", false},
        {"border-top-color", false}, {"border-right-color", false},
        {"border-bottom-color", false}, {"border-left-color", false},
        {"width", false},
        {"max-width", false},
        {"height", false},
        // Accepted so that they are not reported, but layout ignores them.
        {"float", false},
        {"position", false},
    };
    for (const auto& info : kProperties) {
        if (name == info.name) return &info;
    }
    return nullptr;
}

bool is_shorthand_property(std::string_view name) {
    return name == "margin" || name == "padding" || name == "border" ||
           name == "border-top" || name == "border-right" || name == "border-bottom" ||
           name == "border-left" || name == "border-width" || name == "border-style" ||
           name == "border-color" || name == "background" || name == "list-style";
}

ComputedStyle initial_style() {
    return ComputedStyle{};
}

ComputedStyle inherited_style(const ComputedStyle& parent) {
    ComputedStyle style;
    style.color = parent.color;
    style.font_weight = parent.font_weight;
    style.font_style = parent.font_style;
    style.text_decoration = parent.text_decoration;
    style.text_align = parent.text_align;
    style.white_space = parent.white_space;
    style.visibility = parent.visibility;
    style.list_style_type = parent.list_style_type;
    return style;
}

std::optional<Color> parse_color(std::string_view raw) {
    std::string value = ascii_lower(trim(raw));
    if (value.empty()) return std::nullopt;

    if (value == "transparent") return Color::transparent();
    if (value.front() == '#') return parse_hex_color(std::string_view(value).substr(1));

    if ((value.rfind("rgb(", 0) == 0 || value.rfind("rgba(", 0) == 0) && value.back() == ')') {
        auto open = value.find('(');
        return parse_rgb_function(std::string_view(value).substr(open + 1, value.size() - open - 2));
    }

    auto& names = named_colors();
    auto it = names.find(value);
    if (it != names.end()) return it->second;
    return std::nullopt;
}

std::optional<Length> parse_length(std::string_view raw) {
    std::string value = ascii_lower(trim(raw));
    if (value.empty()) return std::nullopt;
    if (value == "auto") return Length::auto_val();

    auto tokens = CSSTokenizer::tokenize_all(value);
    if (tokens.size() != 2) return std::nullopt;
    const CSSToken& tok = tokens[0];
    auto v = static_cast<float>(tok.numeric_value);

    if (tok.type == CSSToken::Number) {
        if (v == 0) return Length::zero();
        return std::nullopt;
    }
    if (tok.type == CSSToken::Percentage) return Length::percent(v);
    if (tok.type != CSSToken::Dimension) return std::nullopt;

    if (tok.unit == "px") return Length{v, Length::Unit::Px};
    if (tok.unit == "em") return Length{v, Length::Unit::Em};
    if (tok.unit == "rem") return Length{v, Length::Unit::Rem};
    if (tok.unit == "ch") return Length{v, Length::Unit::Ch};
    if (tok.unit == "lh") return Length{v, Length::Unit::Lh};
    if (tok.unit == "pt") return Length{v * 4.0f / 3.0f, Length::Unit::Px};
    return std::nullopt;
}

std::string color_to_string(const Color& color) {
    return "rgba(" + std::to_string(color.r) + ", " + std::to_string(color.g) + ", " +
           std::to_string(color.b) + ", " + std::to_string(color.a) + ")";
}

} // namespace toad::css
