#pragma once
#include <toad/css/style/style_resolver.h>
#include <toad/dom/document.h>
#include <toad/form/form.h>
#include <toad/layout/box.h>
#include <toad/layout/line_breaker.h>

#include <functional>
#include <memory>
#include <optional>

namespace toad::layout {

struct CellSize {
    int columns = 0;
    int rows = 0;
};

// Natural cell footprint of a decoded image, or nullopt when the image is
// unavailable (not fetched, failed to decode, or images disabled).
using ImageSizeFn = std::function<std::optional<CellSize>(dom::NodeId image)>;

struct LayoutOptions {
    int viewport_columns = 80;
    int viewport_rows = 24;
    ImageSizeFn image_size;
    const form::FormState* form_state = nullptr;
};

struct LayoutTree {
    std::unique_ptr<Box> root;
    int width = 0;
    int height = 0;   // document height in rows, at least the viewport
};

// A link or form control in document order, for keyboard focus.
struct FocusTarget {
    enum class Kind { Link, Control };
    Kind kind = Kind::Link;
    dom::NodeId node = 0;
    int row = 0;
    int column = 0;
};

class LayoutEngine {
public:
    LayoutTree layout(const dom::Document& document, const css::StyleMap& styles,
                      const LayoutOptions& options) const;

    // Box generation only; geometry is left at zero.
    std::unique_ptr<Box> build_box_tree(const dom::Document& document,
                                        const css::StyleMap& styles,
                                        const LayoutOptions& options) const;

private:
    void layout_block(Box& box, int containing_x, int containing_width, int top) const;
    void layout_block_children(Box& box) const;
    void layout_inline_children(Box& box) const;
    void resolve_horizontal(Box& box, int containing_width) const;
};

std::vector<FocusTarget> collect_focus_targets(const Box& root);

// Every fragment of the tree in paint order.
void for_each_fragment(const Box& root, const std::function<void(const LineFragment&)>& fn);

} // namespace toad::layout
