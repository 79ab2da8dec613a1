#include <toad/engine/chrome.h>

#include <toad/core/utf8.h>

#include <algorithm>

namespace toad::engine {

namespace {

css::Color to_color(const core::ThemeColor& c) {
    return {c.r, c.g, c.b, 255};
}

paint::Cell style_cell(const css::Color& foreground, const css::Color& background,
                       paint::ColorMode mode) {
    paint::Cell cell;
    cell.foreground = paint::quantize(foreground, mode);
    cell.background = paint::quantize(background, mode);
    return cell;
}

void fill_row(paint::CellGrid& grid, int row, const paint::Cell& style) {
    for (int col = 0; col < grid.columns(); ++col) grid.put_glyph(row, col, " ", style);
}

void draw_tab_bar(paint::CellGrid& grid, const Session& session, const core::Theme& theme,
                  paint::ColorMode mode) {
    const paint::Cell bar = style_cell(to_color(theme.text), to_color(theme.ui), mode);
    const paint::Cell active = style_cell(to_color(theme.text), to_color(theme.background), mode);
    fill_row(grid, 0, bar);

    const int count = static_cast<int>(session.tab_count());
    const int slot = std::max(4, grid.columns() / std::max(1, count));
    int column = 0;
    for (int i = 0; i < count && column < grid.columns(); ++i) {
        const bool is_active = static_cast<size_t>(i) == session.active_index();
        std::string title = core::truncate_to_width(dom::collapse_whitespace(session.tab(
                                                        static_cast<size_t>(i)).title()),
                                                    slot - 3);
        column += grid.put_text(0, column, "[" + title + "]", is_active ? active : bar);
        column += 1;
    }
}

void draw_address_line(paint::CellGrid& grid, const Session& session, const ChromeState& chrome,
                       const core::Theme& theme, paint::ColorMode mode) {
    const paint::Cell line = style_cell(to_color(theme.text), to_color(theme.background), mode);
    fill_row(grid, 1, line);
    if (!chrome.editor) {
        grid.put_text(1, 1, session.active_tab().address(), line);
        return;
    }

    int column = 1 + grid.put_text(1, 1, chrome.prompt, line);
    const std::string& text = chrome.editor->text();
    // Keep the cursor on screen by dropping leading text.
    const int available = std::max(1, grid.columns() - column - 1);
    std::string_view visible = text;
    int skipped_columns = 0;
    size_t offset = 0;
    while (chrome.editor->cursor_column() - skipped_columns >= available && offset < text.size()) {
        size_t next = offset;
        skipped_columns += core::code_point_width(core::next_code_point(text, next));
        offset = next;
    }
    visible = visible.substr(offset);
    grid.put_text(1, column, visible, line);

    const int cursor = column + chrome.editor->cursor_column() - skipped_columns;
    if (grid.in_bounds(1, cursor)) grid.at(1, cursor).attributes.reverse = true;
}

void draw_status_line(paint::CellGrid& grid, const Session& session, const ChromeState& chrome,
                      const core::Theme& theme, paint::ColorMode mode) {
    const int row = grid.rows() - 1;
    const paint::Cell status = style_cell(to_color(theme.text), to_color(theme.ui), mode);
    fill_row(grid, row, status);
    grid.put_text(row, 1, chrome.notice.empty() ? session.status_line() : chrome.notice, status);
}

void draw_page(paint::CellGrid& grid, const Session& session, const core::Theme& theme,
               paint::ColorMode mode) {
    const int page_rows = grid.rows() - kChromeRows;
    if (page_rows <= 0) return;
    paint::CellGrid page = session.render(mode);
    for (int row = 0; row < page_rows && row < page.rows(); ++row) {
        for (int col = 0; col < page.columns() && col < grid.columns(); ++col) {
            grid.at(kChromeTopRows + row, col) = page.at(row, col);
        }
    }

    if (grid.columns() < 2) return;
    const int bar_column = grid.columns() - 1;
    const paint::Cell track = style_cell(to_color(theme.text), to_color(theme.ui), mode);
    const paint::Cell thumb = style_cell(to_color(theme.text), to_color(theme.interactive), mode);
    ScrollThumb geometry = scrollbar_thumb(session.scroll_row(),
                                           session.max_scroll_row() + session.rows(), page_rows);
    for (int row = 0; row < page_rows; ++row) {
        const bool in_thumb = row >= geometry.start && row < geometry.start + geometry.length;
        grid.put_glyph(kChromeTopRows + row, bar_column, " ", in_thumb ? thumb : track);
    }
}

} // namespace

ScrollThumb scrollbar_thumb(int scroll_row, int document_rows, int track_rows) {
    ScrollThumb thumb;
    if (track_rows <= 0) return thumb;
    document_rows = std::max(document_rows, track_rows);
    thumb.length = std::max(1, track_rows * track_rows / document_rows);
    const int max_scroll = document_rows - track_rows;
    if (max_scroll > 0) {
        const int clamped = std::clamp(scroll_row, 0, max_scroll);
        thumb.start = (track_rows - thumb.length) * clamped / max_scroll;
    }
    return thumb;
}

paint::CellGrid compose_screen(const Session& session, const ChromeState& chrome, int columns,
                               int rows, paint::ColorMode mode) {
    const core::Theme& theme = session.settings().theme();
    paint::CellGrid grid(std::max(1, columns), std::max(kChromeRows, rows),
                         style_cell(to_color(theme.text), to_color(theme.background), mode));
    draw_tab_bar(grid, session, theme, mode);
    draw_address_line(grid, session, chrome, theme, mode);
    draw_page(grid, session, theme, mode);
    draw_status_line(grid, session, chrome, theme, mode);
    return grid;
}

} // namespace toad::engine
