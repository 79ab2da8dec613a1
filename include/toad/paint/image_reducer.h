#pragma once
#include <toad/css/style/computed_style.h>

#include <cstdint>
#include <string>
#include <vector>

namespace toad::paint {

// Decoded image: width * height RGBA pixels, row-major.
struct PixelMatrix {
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> rgba;

    bool valid() const {
        return width > 0 && height > 0 &&
               rgba.size() == static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
    }
    css::Color at(int x, int y) const;
};

enum class ReductionMode {
    BlockAverage,   // one averaged color per cell, drawn as background
    HalfBlock       // upper half block glyph: top half foreground, bottom half background
};

struct ReducedCell {
    std::string glyph = " ";
    css::Color foreground = css::Color::black();
    css::Color background = css::Color::white();
};

// Cell footprint of an image at its natural size: one column per 8 pixels,
// one row per 16 pixels, at least one cell each way.
struct Footprint {
    int columns = 1;
    int rows = 1;
};
Footprint natural_footprint(int width_px, int height_px);

// Reduces image to columns x rows cells, row-major. Each cell averages the
// pixel block it covers, with transparent pixels blended into background.
std::vector<ReducedCell> reduce_image(const PixelMatrix& image, int columns, int rows,
                                      ReductionMode mode, const css::Color& background);

} // namespace toad::paint
