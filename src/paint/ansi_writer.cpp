#include <toad/paint/ansi_writer.h>

namespace toad::paint {

namespace {

void append_color(std::string& out, int selector, const css::Color& color, ColorMode mode) {
    out += ';';
    out += std::to_string(selector);
    if (mode == ColorMode::TrueColor) {
        out += ";2;" + std::to_string(color.r) + ';' + std::to_string(color.g) + ';' +
               std::to_string(color.b);
    } else {
        out += ";5;" + std::to_string(nearest_palette_index(color));
    }
}

bool same_style(const Cell& a, const Cell& b) {
    return a.foreground == b.foreground && a.background == b.background &&
           a.attributes == b.attributes;
}

} // namespace

std::string sgr_parameters(const Cell& cell, ColorMode mode) {
    std::string params = "0";
    if (cell.attributes.bold) params += ";1";
    if (cell.attributes.italic) params += ";3";
    if (cell.attributes.underline) params += ";4";
    if (cell.attributes.reverse) params += ";7";
    if (cell.attributes.strikethrough) params += ";9";
    append_color(params, 38, cell.foreground, mode);
    append_color(params, 48, cell.background, mode);
    return params;
}

std::string encode_ansi(const CellGrid& grid, ColorMode mode) {
    std::string out;
    out.reserve(static_cast<size_t>(grid.columns() * grid.rows()) * 4 + 64);
    for (int row = 0; row < grid.rows(); ++row) {
        out += "\x1b[" + std::to_string(row + 1) + ";1H";
        const Cell* previous = nullptr;
        for (int col = 0; col < grid.columns(); ++col) {
            const Cell& cell = grid.at(row, col);
            if (cell.continuation) continue;
            if (!previous || !same_style(*previous, cell)) {
                out += "\x1b[" + sgr_parameters(cell, mode) + "m";
            }
            out += cell.glyph.empty() ? " " : cell.glyph;
            previous = &cell;
        }
    }
    out += "\x1b[0m";
    return out;
}

} // namespace toad::paint
