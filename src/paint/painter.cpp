#include <toad/paint/painter.h>
#include <toad/core/utf8.h>

#include <algorithm>

namespace toad::paint {

namespace {

struct BorderGlyphs {
    const char* horizontal;
    const char* vertical;
    const char* top_left;
    const char* top_right;
    const char* bottom_left;
    const char* bottom_right;
};

const BorderGlyphs& glyphs_for(css::BorderStyle style) {
    static const BorderGlyphs kSolid{"─", "│", "┌", "┐", "└", "┘"};
    static const BorderGlyphs kDashed{"╌", "╎", "┌", "┐", "└", "┘"};
    static const BorderGlyphs kDotted{"┄", "┆", "┌", "┐", "└", "┘"};
    static const BorderGlyphs kDouble{"═", "║", "╔", "╗", "╚", "╝"};
    switch (style) {
        case css::BorderStyle::Dashed: return kDashed;
        case css::BorderStyle::Dotted: return kDotted;
        case css::BorderStyle::Double: return kDouble;
        case css::BorderStyle::Solid:
        case css::BorderStyle::None: return kSolid;
    }
    return kSolid;
}

CellAttributes attributes_for(const css::ComputedStyle& style) {
    CellAttributes attrs;
    attrs.bold = style.is_bold();
    attrs.italic = style.font_style == css::FontStyle::Italic;
    attrs.underline = style.text_decoration == css::TextDecoration::Underline;
    attrs.strikethrough = style.text_decoration == css::TextDecoration::LineThrough;
    return attrs;
}

bool is_focused(const layout::LineFragment& fragment, const PaintOptions& options) {
    if (!options.focused) return false;
    if (fragment.link && *fragment.link == *options.focused) return true;
    return fragment.kind == layout::LineFragment::Kind::Atomic &&
           fragment.node == *options.focused;
}

} // namespace

CellGrid Painter::paint(const layout::LayoutTree& tree, const PaintOptions& options) const {
    Cell blank;
    blank.foreground = options.page_foreground;
    blank.background = options.page_background;
    CellGrid grid(options.columns, options.rows, blank);
    if (tree.root) paint_box(grid, *tree.root, options);

    if (options.color_mode == ColorMode::Palette256) {
        for (int r = 0; r < grid.rows(); ++r) {
            for (int c = 0; c < grid.columns(); ++c) {
                Cell& cell = grid.at(r, c);
                cell.foreground = quantize(cell.foreground, options.color_mode);
                cell.background = quantize(cell.background, options.color_mode);
            }
        }
    }
    return grid;
}

void Painter::paint_box(CellGrid& grid, const layout::Box& box, const PaintOptions& options) const {
    const bool visible = box.style.visibility == css::Visibility::Visible;

    if (box.is_block_level() && visible) {
        if (!box.style.background_color.is_transparent()) {
            layout::Rect rect = box.geometry.border_rect();
            int r0 = std::max(0, rect.y - options.scroll_row);
            int r1 = std::min(grid.rows(), rect.bottom() - options.scroll_row);
            int c0 = std::max(0, rect.x);
            int c1 = std::min(grid.columns(), rect.right());
            for (int r = r0; r < r1; ++r) {
                for (int c = c0; c < c1; ++c) {
                    Cell& cell = grid.at(r, c);
                    cell.background = blend(box.style.background_color, cell.background);
                }
            }
        }
        paint_border(grid, box, options);
    }

    if (box.marker) paint_fragment(grid, *box.marker, options);
    for (const auto& fragment : box.fragments) paint_fragment(grid, fragment, options);
    for (const auto& child : box.children) paint_box(grid, *child, options);
}

void Painter::paint_border(CellGrid& grid, const layout::Box& box,
                           const PaintOptions& options) const {
    const layout::BoxGeometry& g = box.geometry;
    if (g.border.top + g.border.right + g.border.bottom + g.border.left == 0) return;

    layout::Rect rect = box.geometry.border_rect();
    if (rect.width <= 0 || rect.height <= 0) return;
    const int top = rect.y - options.scroll_row;
    const int bottom = rect.bottom() - 1 - options.scroll_row;
    const int left = rect.x;
    const int right = rect.right() - 1;

    auto put = [&](int row, int column, const char* glyph, css::Side side) {
        if (!grid.in_bounds(row, column)) return;
        Cell style = grid.at(row, column);
        style.foreground = blend(box.style.resolved_border_color(side), style.background);
        style.attributes = CellAttributes{};
        grid.put_glyph(row, column, glyph, style);
    };

    const bool has_top = g.border.top > 0;
    const bool has_bottom = g.border.bottom > 0;
    const bool has_left = g.border.left > 0;
    const bool has_right = g.border.right > 0;

    if (has_top) {
        const auto& glyphs = glyphs_for(box.style.border_style[css::kTop]);
        for (int c = left; c <= right; ++c) put(top, c, glyphs.horizontal, css::kTop);
    }
    if (has_bottom) {
        const auto& glyphs = glyphs_for(box.style.border_style[css::kBottom]);
        for (int c = left; c <= right; ++c) put(bottom, c, glyphs.horizontal, css::kBottom);
    }
    if (has_left) {
        const auto& glyphs = glyphs_for(box.style.border_style[css::kLeft]);
        for (int r = top; r <= bottom; ++r) put(r, left, glyphs.vertical, css::kLeft);
    }
    if (has_right) {
        const auto& glyphs = glyphs_for(box.style.border_style[css::kRight]);
        for (int r = top; r <= bottom; ++r) put(r, right, glyphs.vertical, css::kRight);
    }

    const auto& corner = glyphs_for(box.style.border_style[css::kTop]);
    if (has_top && has_left) put(top, left, corner.top_left, css::kTop);
    if (has_top && has_right) put(top, right, corner.top_right, css::kTop);
    const auto& bottom_corner = glyphs_for(box.style.border_style[css::kBottom]);
    if (has_bottom && has_left) put(bottom, left, bottom_corner.bottom_left, css::kBottom);
    if (has_bottom && has_right) put(bottom, right, bottom_corner.bottom_right, css::kBottom);
}

void Painter::paint_fragment(CellGrid& grid, const layout::LineFragment& fragment,
                             const PaintOptions& options) const {
    if (!fragment.box) return;
    const css::ComputedStyle& style = fragment.box->style;
    if (style.visibility != css::Visibility::Visible) return;

    const int row = fragment.row - options.scroll_row;
    if (row + fragment.height <= 0 || row >= grid.rows()) return;

    if (fragment.kind == layout::LineFragment::Kind::Atomic &&
        fragment.box->kind == layout::BoxKind::Replaced) {
        paint_image(grid, fragment, options);
        return;
    }

    const bool focused = is_focused(fragment, options);
    CellAttributes attrs = attributes_for(style);
    attrs.reverse = focused;

    // Writes one line of text, taking each cell's background from what is
    // already painted unless the text carries its own.
    auto write_line = [&](int target_row, const std::string& text) {
        int column = fragment.column;
        const int limit = fragment.column + fragment.width;
        for (const auto& glyph : core::split_glyphs(text)) {
            size_t pos = 0;
            int width = std::max(1, core::code_point_width(core::next_code_point(glyph, pos)));
            if (column + width > limit) break;
            if (grid.in_bounds(target_row, column)) {
                Cell cell;
                css::Color under = grid.at(target_row, column).background;
                cell.background = style.background_color.is_transparent()
                                      ? under
                                      : blend(style.background_color, under);
                cell.foreground = blend(style.color, cell.background);
                cell.attributes = attrs;
                grid.put_glyph(target_row, column, glyph, cell);
            }
            column += width;
        }
    };

    if (fragment.kind == layout::LineFragment::Kind::Atomic) {
        // Form control footprint, one row per line.
        const std::string& text = fragment.box->text;
        size_t start = 0;
        int line = 0;
        while (start <= text.size() && line < fragment.height) {
            size_t end = text.find('\n', start);
            if (end == std::string::npos) end = text.size();
            write_line(row + line, text.substr(start, end - start));
            start = end + 1;
            ++line;
        }
        return;
    }
    write_line(row, fragment.text);
}

void Painter::paint_image(CellGrid& grid, const layout::LineFragment& fragment,
                          const PaintOptions& options) const {
    const int row = fragment.row - options.scroll_row;
    const PixelMatrix* pixels = options.images ? options.images(fragment.node) : nullptr;
    const bool focused = is_focused(fragment, options);

    if (!pixels || !pixels->valid()) {
        for (int r = 0; r < fragment.height; ++r) {
            for (int c = 0; c < fragment.width; ++c) {
                if (!grid.in_bounds(row + r, fragment.column + c)) continue;
                Cell cell = grid.at(row + r, fragment.column + c);
                cell.foreground = blend(fragment.box->style.color, cell.background);
                cell.attributes.reverse = focused;
                grid.put_glyph(row + r, fragment.column + c, "░", cell);
            }
        }
        return;
    }

    auto cells = reduce_image(*pixels, fragment.width, fragment.height, options.reduction,
                              options.page_background);
    for (int r = 0; r < fragment.height; ++r) {
        for (int c = 0; c < fragment.width; ++c) {
            if (!grid.in_bounds(row + r, fragment.column + c)) continue;
            const ReducedCell& reduced = cells[static_cast<size_t>(r) * fragment.width + c];
            Cell cell;
            cell.foreground = reduced.foreground;
            cell.background = reduced.background;
            cell.attributes.reverse = focused;
            grid.put_glyph(row + r, fragment.column + c, reduced.glyph, cell);
        }
    }
}

} // namespace toad::paint
