#pragma once
#include <toad/layout/layout_engine.h>
#include <toad/paint/cell_grid.h>
#include <toad/paint/color_quantizer.h>
#include <toad/paint/image_reducer.h>

#include <functional>
#include <optional>

namespace toad::paint {

// Decoded pixels for an <img> node, or nullptr.
using ImageLookupFn = std::function<const PixelMatrix*(dom::NodeId image)>;

struct PaintOptions {
    int scroll_row = 0;     // first document row shown
    int columns = 80;
    int rows = 24;
    css::Color page_background = css::Color::white();
    css::Color page_foreground = css::Color::black();
    std::optional<dom::NodeId> focused;   // link or control drawn in reverse video
    ImageLookupFn images;
    ReductionMode reduction = ReductionMode::HalfBlock;
    ColorMode color_mode = ColorMode::TrueColor;
};

// Paints the visible window of a laid-out page into a fresh grid. Every call
// is a full repaint.
class Painter {
public:
    CellGrid paint(const layout::LayoutTree& tree, const PaintOptions& options) const;

private:
    void paint_box(CellGrid& grid, const layout::Box& box, const PaintOptions& options) const;
    void paint_border(CellGrid& grid, const layout::Box& box, const PaintOptions& options) const;
    void paint_fragment(CellGrid& grid, const layout::LineFragment& fragment,
                        const PaintOptions& options) const;
    void paint_image(CellGrid& grid, const layout::LineFragment& fragment,
                     const PaintOptions& options) const;
};

} // namespace toad::paint
