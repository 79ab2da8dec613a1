#pragma once
#include <toad/css/style/computed_style.h>
#include <toad/dom/document.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toad::layout {

struct EdgeSizes {
    int top = 0, right = 0, bottom = 0, left = 0;
};

struct Rect {
    int x = 0, y = 0;
    int width = 0, height = 0;

    int right() const { return x + width; }
    int bottom() const { return y + height; }
    bool contains(const Rect& other) const {
        return other.x >= x && other.y >= y && other.right() <= right() && other.bottom() <= bottom();
    }
    bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
};

// Cell geometry in page coordinates (row 0 is the top of the document).
// x/y is the origin of the content box.
struct BoxGeometry {
    int x = 0, y = 0;
    int width = 0, height = 0;
    EdgeSizes margin, border, padding;

    Rect content_rect() const { return {x, y, width, height}; }
    Rect padding_rect() const {
        return {x - padding.left, y - padding.top, width + padding.left + padding.right,
                height + padding.top + padding.bottom};
    }
    Rect border_rect() const {
        Rect p = padding_rect();
        return {p.x - border.left, p.y - border.top, p.width + border.left + border.right,
                p.height + border.top + border.bottom};
    }
    int margin_box_height() const {
        return margin.top + border.top + padding.top + height + padding.bottom + border.bottom +
               margin.bottom;
    }
};

enum class BoxKind {
    Block,
    Inline,
    Anonymous,
    Replaced,
    FormControl
};

const char* box_kind_name(BoxKind kind);

struct Box;

// A piece of inline content placed on one line. Text fragments carry their
// characters; atomic fragments (images, controls) point at their box.
struct LineFragment {
    enum class Kind { Text, Atomic };
    Kind kind = Kind::Text;
    int row = 0;
    int column = 0;
    int width = 0;
    int height = 1;
    std::string text;
    dom::NodeId node = dom::Document::kRoot;   // node whose style applies
    std::optional<dom::NodeId> link;           // enclosing <a href>
    const Box* box = nullptr;
};

struct Box {
    BoxKind kind = BoxKind::Block;
    std::optional<dom::NodeId> node;     // nullopt for anonymous boxes
    css::ComputedStyle style;
    BoxGeometry geometry;
    Box* parent = nullptr;
    std::vector<std::unique_ptr<Box>> children;
    std::optional<dom::NodeId> link;

    // Inline boxes generated for text runs, list markers and image alt text.
    std::string text;
    bool text_run = false;
    bool forced_break = false;

    // Replaced boxes: natural footprint in cells.
    int intrinsic_columns = 0;
    int intrinsic_rows = 0;

    // Block and anonymous boxes that hold inline content own the laid-out
    // fragments of all their inline descendants.
    std::vector<LineFragment> fragments;
    int line_count = 0;

    // List items: the marker, placed left of the first line.
    std::optional<LineFragment> marker;

    Box* append_child(std::unique_ptr<Box> child);

    bool is_block_level() const { return kind == BoxKind::Block || kind == BoxKind::Anonymous; }
    bool is_atomic_inline() const {
        return kind == BoxKind::Replaced || kind == BoxKind::FormControl;
    }
    // True when the children are inline-level and flow into lines.
    bool has_inline_children() const;

    // Debug rendering: kind, node and geometry per line.
    std::string dump(int indent = 0) const;
};

} // namespace toad::layout
