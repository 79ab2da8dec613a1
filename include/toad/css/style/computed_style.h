#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace toad::css {

enum class Display { Block, Inline, InlineBlock, ListItem, None };
enum class TextAlign { Left, Center, Right };
enum class TextDecoration { None, Underline, LineThrough };
enum class FontStyle { Normal, Italic };
enum class FontWeight { Normal = 400, Bold = 700 };
enum class WhiteSpace { Normal, NoWrap, Pre, PreWrap, PreLine };
enum class Visibility { Visible, Hidden };
enum class BorderStyle { None, Solid, Dashed, Dotted, Double };
enum class ListStyleType { Disc, Circle, Square, Decimal, LowerAlpha, UpperAlpha, None };

struct Color {
    uint8_t r = 0, g = 0, b = 0, a = 255;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    bool is_transparent() const { return a == 0; }

    static Color black() { return {0, 0, 0, 255}; }
    static Color white() { return {255, 255, 255, 255}; }
    static Color transparent() { return {0, 0, 0, 0}; }
};

// A CSS length before it is resolved to terminal cells.
struct Length {
    enum class Unit { Auto, Px, Em, Rem, Ch, Lh, Percent };
    float value = 0;
    Unit unit = Unit::Px;

    static Length px(float v) { return {v, Unit::Px}; }
    static Length em(float v) { return {v, Unit::Em}; }
    static Length percent(float v) { return {v, Unit::Percent}; }
    static Length auto_val() { return {0, Unit::Auto}; }
    static Length zero() { return {0, Unit::Px}; }

    bool is_auto() const { return unit == Unit::Auto; }
    bool operator==(const Length& other) const { return value == other.value && unit == other.unit; }

    // Horizontal extent in columns. Percentages resolve against
    // parent_columns; auto resolves to 0.
    int to_columns(int parent_columns) const;
    // Vertical extent in rows. Percentages of an unknown height are 0.
    int to_rows() const;
};

enum Side { kTop = 0, kRight = 1, kBottom = 2, kLeft = 3 };

// Resolved values for the fixed property set. Field comments note which
// properties inherit.
struct ComputedStyle {
    Display display = Display::Inline;
    Color color = Color::black();                        // inherited
    Color background_color = Color::transparent();
    FontWeight font_weight = FontWeight::Normal;         // inherited
    FontStyle font_style = FontStyle::Normal;            // inherited
    TextDecoration text_decoration = TextDecoration::None;  // inherited (propagated)
    TextAlign text_align = TextAlign::Left;              // inherited
    WhiteSpace white_space = WhiteSpace::Normal;         // inherited
    Visibility visibility = Visibility::Visible;         // inherited
    ListStyleType list_style_type = ListStyleType::Disc; // inherited

    std::array<Length, 4> margin{};
    std::array<Length, 4> padding{};
    std::array<float, 4> border_width{};                 // px
    std::array<BorderStyle, 4> border_style{};
    std::array<std::optional<Color>, 4> border_color{};  // nullopt: currentColor

    Length width = Length::auto_val();
    Length max_width = Length::auto_val();
    Length height = Length::auto_val();

    bool is_bold() const { return font_weight == FontWeight::Bold; }
    // A side draws a border cell when it has a visible style and width.
    bool has_border(Side side) const;
    Color resolved_border_color(Side side) const;

    bool operator==(const ComputedStyle& other) const;
    bool operator!=(const ComputedStyle& other) const { return !(*this == other); }
};

struct PropertyInfo {
    const char* name;
    bool inherited;
};

// The longhand properties the cascade understands. Shorthands (margin,
// padding, border*, background) expand onto these.
const PropertyInfo* find_property(std::string_view name);
bool is_shorthand_property(std::string_view name);

ComputedStyle initial_style();
// Initial values, with the inherited properties taken from parent.
ComputedStyle inherited_style(const ComputedStyle& parent);

std::optional<Color> parse_color(std::string_view value);
std::optional<Length> parse_length(std::string_view value);
std::string color_to_string(const Color& color);

} // namespace toad::css
