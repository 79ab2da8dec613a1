#pragma once
#include <toad/css/style/computed_style.h>

#include <string>
#include <string_view>
#include <vector>

namespace toad::paint {

struct CellAttributes {
    bool bold = false;
    bool italic = false;
    bool underline = false;
    bool strikethrough = false;
    bool reverse = false;

    bool operator==(const CellAttributes& o) const {
        return bold == o.bold && italic == o.italic && underline == o.underline &&
               strikethrough == o.strikethrough && reverse == o.reverse;
    }
    bool operator!=(const CellAttributes& o) const { return !(*this == o); }
};

// One glyph cell. A double-width glyph occupies its cell and marks the next
// one as a continuation with an empty glyph.
struct Cell {
    std::string glyph = " ";
    css::Color foreground = css::Color::black();
    css::Color background = css::Color::white();
    CellAttributes attributes;
    bool continuation = false;

    bool operator==(const Cell& o) const {
        return glyph == o.glyph && foreground == o.foreground && background == o.background &&
               attributes == o.attributes && continuation == o.continuation;
    }
    bool operator!=(const Cell& o) const { return !(*this == o); }
};

class CellGrid {
public:
    CellGrid() = default;
    CellGrid(int columns, int rows, const Cell& fill = Cell{});

    int columns() const { return columns_; }
    int rows() const { return rows_; }
    bool in_bounds(int row, int column) const {
        return row >= 0 && row < rows_ && column >= 0 && column < columns_;
    }

    Cell& at(int row, int column) { return cells_[index(row, column)]; }
    const Cell& at(int row, int column) const { return cells_[index(row, column)]; }

    // Sets the background of every cell in the rectangle (clipped), keeping
    // glyphs and foregrounds.
    void fill_background(int row, int column, int width, int height, const css::Color& color);

    // Writes one glyph. Out-of-bounds writes are dropped; a wide glyph that
    // would cross the right edge is replaced by a space.
    void put_glyph(int row, int column, std::string_view glyph, const Cell& style);

    // Writes text left to right, stopping before column limit (or the grid
    // edge). Returns the number of columns consumed.
    int put_text(int row, int column, std::string_view text, const Cell& style, int limit = -1);

    // Plain text of one row, trailing blanks removed.
    std::string row_text(int row) const;
    // All rows joined by '\n', trailing blank rows removed.
    std::string to_text() const;

    bool operator==(const CellGrid& o) const {
        return columns_ == o.columns_ && rows_ == o.rows_ && cells_ == o.cells_;
    }
    bool operator!=(const CellGrid& o) const { return !(*this == o); }

private:
    size_t index(int row, int column) const {
        return static_cast<size_t>(row) * static_cast<size_t>(columns_) + static_cast<size_t>(column);
    }

    int columns_ = 0;
    int rows_ = 0;
    std::vector<Cell> cells_;
};

} // namespace toad::paint
