#pragma once
#include <toad/engine/input.h>
#include <toad/engine/session.h>
#include <toad/paint/cell_grid.h>
#include <toad/paint/color_quantizer.h>

#include <string>

namespace toad::engine {

// Tab bar and address line above the page, status line below it.
inline constexpr int kChromeTopRows = 2;
inline constexpr int kChromeBottomRows = 1;
inline constexpr int kChromeRows = kChromeTopRows + kChromeBottomRows;

struct ChromeState {
    // Non-null while the address bar or a text field is being edited.
    const LineEditor* editor = nullptr;
    std::string prompt;   // shown before the editor text
    // Replaces the session's status line when non-empty ("Loading ...").
    std::string notice;
};

struct ScrollThumb {
    int start = 0;
    int length = 0;
};

// Thumb position in a track of track_rows cells for a document of
// document_rows rows scrolled to scroll_row.
ScrollThumb scrollbar_thumb(int scroll_row, int document_rows, int track_rows);

// Full-screen grid: chrome plus the visible page and its scrollbar. The
// session's page area must be (columns, rows - kChromeRows).
paint::CellGrid compose_screen(const Session& session, const ChromeState& chrome, int columns,
                               int rows, paint::ColorMode mode);

} // namespace toad::engine
