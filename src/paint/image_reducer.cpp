#include <toad/paint/image_reducer.h>
#include <toad/core/config.h>
#include <toad/paint/color_quantizer.h>

#include <algorithm>

namespace toad::paint {

namespace {

constexpr const char kUpperHalfBlock[] = "▀";

// Average of the pixels in [x0, x1) x [y0, y1), each composited over
// background first.
css::Color average_block(const PixelMatrix& image, int x0, int x1, int y0, int y1,
                         const css::Color& background) {
    x0 = std::clamp(x0, 0, image.width - 1);
    y0 = std::clamp(y0, 0, image.height - 1);
    x1 = std::clamp(x1, x0 + 1, image.width);
    y1 = std::clamp(y1, y0 + 1, image.height);
    uint64_t r = 0, g = 0, b = 0, count = 0;
    for (int y = y0; y < y1; ++y) {
        for (int x = x0; x < x1; ++x) {
            css::Color c = blend(image.at(x, y), background);
            r += c.r;
            g += c.g;
            b += c.b;
            ++count;
        }
    }
    return {static_cast<uint8_t>(r / count), static_cast<uint8_t>(g / count),
            static_cast<uint8_t>(b / count), 255};
}

} // namespace

css::Color PixelMatrix::at(int x, int y) const {
    size_t i = (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * 4;
    return {rgba[i], rgba[i + 1], rgba[i + 2], rgba[i + 3]};
}

Footprint natural_footprint(int width_px, int height_px) {
    Footprint footprint;
    footprint.columns = std::max(1, (width_px + core::config::kPixelsPerColumn - 1) /
                                        core::config::kPixelsPerColumn);
    footprint.rows = std::max(1, (height_px + core::config::kPixelsPerRow - 1) /
                                     core::config::kPixelsPerRow);
    return footprint;
}

std::vector<ReducedCell> reduce_image(const PixelMatrix& image, int columns, int rows,
                                      ReductionMode mode, const css::Color& background) {
    std::vector<ReducedCell> cells;
    if (!image.valid() || columns <= 0 || rows <= 0) return cells;
    cells.resize(static_cast<size_t>(columns) * static_cast<size_t>(rows));

    const int64_t w = image.width;
    const int64_t h = image.height;
    for (int row = 0; row < rows; ++row) {
        for (int col = 0; col < columns; ++col) {
            int x0 = static_cast<int>(col * w / columns);
            int x1 = static_cast<int>((col + 1) * w / columns);
            ReducedCell& cell = cells[static_cast<size_t>(row) * columns + col];
            if (mode == ReductionMode::BlockAverage) {
                int y0 = static_cast<int>(row * h / rows);
                int y1 = static_cast<int>((row + 1) * h / rows);
                cell.glyph = " ";
                cell.background = average_block(image, x0, x1, y0, y1, background);
                cell.foreground = cell.background;
            } else {
                int half_rows = rows * 2;
                int top0 = static_cast<int>((row * 2) * h / half_rows);
                int top1 = static_cast<int>((row * 2 + 1) * h / half_rows);
                int bottom1 = static_cast<int>((row * 2 + 2) * h / half_rows);
                cell.glyph = kUpperHalfBlock;
                cell.foreground = average_block(image, x0, x1, top0, top1, background);
                cell.background = average_block(image, x0, x1, top1, bottom1, background);
            }
        }
    }
    return cells;
}

} // namespace toad::paint
