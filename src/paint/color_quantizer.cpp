#include <toad/paint/color_quantizer.h>

#include <string_view>

namespace toad::paint {

namespace {

constexpr int kCubeLevels[6] = {0, 95, 135, 175, 215, 255};

constexpr css::Color kSystemColors[16] = {
    {0, 0, 0, 255},       {128, 0, 0, 255},     {0, 128, 0, 255},     {128, 128, 0, 255},
    {0, 0, 128, 255},     {128, 0, 128, 255},   {0, 128, 128, 255},   {192, 192, 192, 255},
    {128, 128, 128, 255}, {255, 0, 0, 255},     {0, 255, 0, 255},     {255, 255, 0, 255},
    {0, 0, 255, 255},     {255, 0, 255, 255},   {0, 255, 255, 255},   {255, 255, 255, 255},
};

int nearest_cube_level(int value) {
    int best = 0;
    for (int i = 1; i < 6; ++i) {
        int d = value - kCubeLevels[i];
        int best_d = value - kCubeLevels[best];
        if (d * d < best_d * best_d) best = i;
    }
    return best;
}

int distance(const css::Color& a, const css::Color& b) {
    int dr = a.r - b.r;
    int dg = a.g - b.g;
    int db = a.b - b.b;
    // Weighted for perceived brightness.
    return 2 * dr * dr + 4 * dg * dg + 3 * db * db;
}

} // namespace

ColorMode detect_color_mode(const char* colorterm) {
    if (!colorterm) return ColorMode::Palette256;
    std::string_view value(colorterm);
    if (value == "truecolor" || value == "24bit") return ColorMode::TrueColor;
    return ColorMode::Palette256;
}

css::Color palette_color(int index) {
    if (index < 0) index = 0;
    if (index > 255) index = 255;
    if (index < 16) return kSystemColors[index];
    if (index < 232) {
        int i = index - 16;
        return {static_cast<uint8_t>(kCubeLevels[i / 36]),
                static_cast<uint8_t>(kCubeLevels[(i / 6) % 6]),
                static_cast<uint8_t>(kCubeLevels[i % 6]), 255};
    }
    auto level = static_cast<uint8_t>(8 + (index - 232) * 10);
    return {level, level, level, 255};
}

int nearest_palette_index(const css::Color& color) {
    int cube = 16 + 36 * nearest_cube_level(color.r) + 6 * nearest_cube_level(color.g) +
               nearest_cube_level(color.b);
    int best = cube;
    int best_distance = distance(color, palette_color(cube));

    int average = (color.r + color.g + color.b) / 3;
    int gray_step = (average - 8 + 5) / 10;
    if (gray_step < 0) gray_step = 0;
    if (gray_step > 23) gray_step = 23;
    int gray = 232 + gray_step;
    int gray_distance = distance(color, palette_color(gray));
    if (gray_distance < best_distance) best = gray;
    return best;
}

css::Color quantize(const css::Color& color, ColorMode mode) {
    if (mode == ColorMode::TrueColor) return color;
    css::Color q = palette_color(nearest_palette_index(color));
    q.a = color.a;
    return q;
}

css::Color blend(const css::Color& top, const css::Color& bottom) {
    if (top.a == 255) return top;
    if (top.a == 0) return bottom;
    auto mix = [&](uint8_t t, uint8_t b) {
        return static_cast<uint8_t>((t * top.a + b * (255 - top.a) + 127) / 255);
    };
    return {mix(top.r, bottom.r), mix(top.g, bottom.g), mix(top.b, bottom.b), 255};
}

} // namespace toad::paint
