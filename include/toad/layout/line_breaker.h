#pragma once
#include <toad/css/style/computed_style.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace toad::layout {

// One unit of inline content ready for line breaking.
struct InlineItem {
    enum class Type {
        Text,     // unbreakable run of glyphs
        Space,    // collapsible or preserved white space
        Atomic,   // image or form control footprint
        Break     // forced line break
    };
    Type type = Type::Text;
    std::string text;
    int width = 0;
    int height = 1;
    // Spaces only: false for nowrap, where the space joins its neighbours.
    bool breakable = true;
    // Spaces only: kept at the start of a line (pre-wrap).
    bool preserved = false;
    // Caller's index for the source of this item.
    size_t source = 0;
};

struct PlacedItem {
    size_t item = 0;
    int column = 0;   // relative to the line start
};

struct LineBoxLayout {
    std::vector<PlacedItem> items;
    int width = 0;
    int height = 1;
};

// Appends the items for one text run under the given white-space mode.
// collapse_pending tracks whether the previous run ended in collapsible
// space, so spaces collapse across inline element boundaries.
void append_text_items(std::string_view text, css::WhiteSpace mode, size_t source,
                       std::vector<InlineItem>& items, bool& collapse_pending);

// Greedy line breaking: a chunk goes on the current line when it fits in
// the remaining width, else it starts a new line. A chunk wider than the
// whole line is placed alone and overflows.
std::vector<LineBoxLayout> break_lines(const std::vector<InlineItem>& items, int available_width);

} // namespace toad::layout
