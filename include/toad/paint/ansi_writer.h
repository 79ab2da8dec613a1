#pragma once
#include <toad/paint/cell_grid.h>
#include <toad/paint/color_quantizer.h>

#include <string>

namespace toad::paint {

// SGR parameters ("0;1;38;2;r;g;b;48;...") for one cell's style.
std::string sgr_parameters(const Cell& cell, ColorMode mode);

// Escape sequences that redraw the whole grid from the top-left corner.
// Attributes are only re-emitted when they change between cells.
std::string encode_ansi(const CellGrid& grid, ColorMode mode);

} // namespace toad::paint
