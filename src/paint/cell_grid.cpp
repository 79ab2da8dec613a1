#include <toad/paint/cell_grid.h>
#include <toad/core/utf8.h>

#include <algorithm>

namespace toad::paint {

CellGrid::CellGrid(int columns, int rows, const Cell& fill)
    : columns_(std::max(0, columns)), rows_(std::max(0, rows)),
      cells_(static_cast<size_t>(columns_) * static_cast<size_t>(rows_), fill) {}

void CellGrid::fill_background(int row, int column, int width, int height,
                               const css::Color& color) {
    int r0 = std::max(0, row);
    int c0 = std::max(0, column);
    int r1 = std::min(rows_, row + height);
    int c1 = std::min(columns_, column + width);
    for (int r = r0; r < r1; ++r) {
        for (int c = c0; c < c1; ++c) {
            at(r, c).background = color;
        }
    }
}

void CellGrid::put_glyph(int row, int column, std::string_view glyph, const Cell& style) {
    if (!in_bounds(row, column)) return;
    size_t pos = 0;
    uint32_t cp = core::next_code_point(glyph, pos);
    int width = core::code_point_width(cp);

    // Overwriting half of a wide glyph leaves a blank in the other half.
    auto detach = [this, row](int col) {
        Cell& cell = at(row, col);
        if (cell.continuation) {
            if (col > 0) at(row, col - 1).glyph = " ";
        } else if (col + 1 < columns_ && at(row, col + 1).continuation) {
            at(row, col + 1).continuation = false;
            at(row, col + 1).glyph = " ";
        }
    };
    detach(column);
    if (width == 2 && column + 1 < columns_) detach(column + 1);

    Cell& target = at(row, column);
    target = style;
    target.continuation = false;
    if (cp < 0x20 || (cp >= 0x7f && cp < 0xa0)) {
        target.glyph = " ";
        return;
    }
    if (width == 2) {
        if (column + 1 >= columns_) {
            target.glyph = " ";
            return;
        }
        target.glyph = std::string(glyph);
        Cell& next = at(row, column + 1);
        next = style;
        next.glyph.clear();
        next.continuation = true;
        return;
    }
    target.glyph = std::string(glyph);
}

int CellGrid::put_text(int row, int column, std::string_view text, const Cell& style, int limit) {
    int end = limit < 0 ? columns_ : std::min(limit, columns_);
    int col = column;
    for (const auto& glyph : core::split_glyphs(text)) {
        size_t pos = 0;
        int width = std::max(1, core::code_point_width(core::next_code_point(glyph, pos)));
        if (col + width > end) break;
        if (col >= 0) put_glyph(row, col, glyph, style);
        col += width;
    }
    return col - column;
}

std::string CellGrid::row_text(int row) const {
    std::string out;
    if (row < 0 || row >= rows_) return out;
    for (int c = 0; c < columns_; ++c) {
        const Cell& cell = at(row, c);
        if (cell.continuation) continue;
        out += cell.glyph;
    }
    while (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

std::string CellGrid::to_text() const {
    std::vector<std::string> lines;
    for (int r = 0; r < rows_; ++r) lines.push_back(row_text(r));
    while (!lines.empty() && lines.back().empty()) lines.pop_back();
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

} // namespace toad::paint
