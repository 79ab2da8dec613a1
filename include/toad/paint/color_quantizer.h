#pragma once
#include <toad/css/style/computed_style.h>

namespace toad::paint {

enum class ColorMode {
    TrueColor,
    Palette256
};

// COLORTERM=truecolor or 24bit selects TrueColor; anything else, including
// an unset variable (nullptr), selects the xterm 256-color palette.
ColorMode detect_color_mode(const char* colorterm);

// RGB value of an xterm palette entry (0-255).
css::Color palette_color(int index);

// Nearest entry of the 6x6x6 cube and gray ramp (16-255). The first 16
// entries are skipped since terminals theme them freely.
int nearest_palette_index(const css::Color& color);

css::Color quantize(const css::Color& color, ColorMode mode);

// Source-over compositing of top onto an opaque bottom.
css::Color blend(const css::Color& top, const css::Color& bottom);

} // namespace toad::paint
