#include <toad/layout/layout_engine.h>
#include <toad/core/utf8.h>

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace toad::layout {

namespace {

std::string alphabetic_ordinal(int n, char base) {
    std::string out;
    while (n > 0) {
        --n;
        out.insert(out.begin(), static_cast<char>(base + n % 26));
        n /= 26;
    }
    return out;
}

std::string marker_text(css::ListStyleType type, int ordinal) {
    switch (type) {
        case css::ListStyleType::Disc: return "• ";
        case css::ListStyleType::Circle: return "◦ ";
        case css::ListStyleType::Square: return "▪ ";
        case css::ListStyleType::Decimal: return std::to_string(ordinal) + ". ";
        case css::ListStyleType::LowerAlpha: return alphabetic_ordinal(ordinal, 'a') + ". ";
        case css::ListStyleType::UpperAlpha: return alphabetic_ordinal(ordinal, 'A') + ". ";
        case css::ListStyleType::None: return "";
    }
    return "";
}

int start_attribute(const dom::Node& list) {
    const std::string* start = list.attribute("start");
    if (!start || start->empty()) return 1;
    int value = 0;
    bool negative = false;
    size_t i = 0;
    if ((*start)[0] == '-') {
        negative = true;
        i = 1;
    }
    for (; i < start->size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>((*start)[i]))) return 1;
        value = std::min(value * 10 + ((*start)[i] - '0'), 1000000);
    }
    return negative ? -value : value;
}

bool is_collapsible_whitespace_run(const Box& box) {
    if (!box.text_run) return false;
    if (box.style.white_space == css::WhiteSpace::Pre ||
        box.style.white_space == css::WhiteSpace::PreWrap) {
        return false;
    }
    return std::all_of(box.text.begin(), box.text.end(), [](unsigned char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
    });
}

// Turns the styled DOM into boxes: one per visible element, text runs for
// text, anonymous blocks around inline runs that sit beside blocks.
class BoxBuilder {
public:
    BoxBuilder(const dom::Document& document, const css::StyleMap& styles,
               const LayoutOptions& options)
        : document_(document), styles_(styles), options_(options) {}

    std::unique_ptr<Box> build_root() {
        auto root = std::make_unique<Box>();
        root->kind = BoxKind::Block;
        root->node = dom::Document::kRoot;
        root->style = styles_[dom::Document::kRoot];
        build_children(*root, dom::Document::kRoot, std::nullopt);
        fix_up(*root);
        return root;
    }

private:
    const dom::Document& document_;
    const css::StyleMap& styles_;
    const LayoutOptions& options_;

    std::unique_ptr<Box> make_text_run(dom::NodeId node, std::string text,
                                       const css::ComputedStyle& style,
                                       std::optional<dom::NodeId> link) {
        auto box = std::make_unique<Box>();
        box->kind = BoxKind::Inline;
        box->node = node;
        box->style = style;
        box->text = std::move(text);
        box->text_run = true;
        box->link = link;
        return box;
    }

    std::unique_ptr<Box> build_element(dom::NodeId id, std::optional<dom::NodeId> link,
                                       int ordinal) {
        const dom::Node& node = document_.node(id);
        const css::ComputedStyle& style = styles_[id];
        if (style.display == css::Display::None) return nullptr;

        if (node.is_element("a") && node.has_attribute("href")) link = id;

        if (node.is_element("br")) {
            auto box = std::make_unique<Box>();
            box->kind = BoxKind::Inline;
            box->node = id;
            box->style = style;
            box->forced_break = true;
            return box;
        }

        if (node.is_element("img")) {
            std::optional<CellSize> size;
            if (options_.image_size) size = options_.image_size(id);
            if (size && size->columns > 0 && size->rows > 0) {
                auto box = std::make_unique<Box>();
                box->kind = BoxKind::Replaced;
                box->node = id;
                box->style = style;
                box->link = link;
                box->intrinsic_columns = size->columns;
                box->intrinsic_rows = size->rows;
                return box;
            }
            const std::string* alt = node.attribute("alt");
            if (alt && dom::collapse_whitespace(*alt).empty()) return nullptr;
            std::string label = alt ? "[" + dom::collapse_whitespace(*alt) + "]" : "[image]";
            return make_text_run(id, std::move(label), style, link);
        }

        if (form::is_form_control(document_, id)) {
            auto lines = form::control_footprint(document_, id, options_.form_state);
            if (lines.empty()) return nullptr;
            auto box = std::make_unique<Box>();
            box->kind = BoxKind::FormControl;
            box->node = id;
            box->style = style;
            box->link = link;
            for (const auto& line : lines) {
                box->intrinsic_columns = std::max(box->intrinsic_columns, core::display_width(line));
                if (!box->text.empty()) box->text += '\n';
                box->text += line;
            }
            box->intrinsic_rows = static_cast<int>(lines.size());
            return box;
        }

        auto box = std::make_unique<Box>();
        box->node = id;
        box->style = style;
        box->link = link;
        switch (style.display) {
            case css::Display::Block:
            case css::Display::ListItem:
                box->kind = BoxKind::Block;
                break;
            case css::Display::Inline:
            case css::Display::InlineBlock:
            case css::Display::None:
                box->kind = BoxKind::Inline;
                break;
        }

        if (style.display == css::Display::ListItem) {
            std::string text = marker_text(style.list_style_type, ordinal);
            if (!text.empty()) {
                LineFragment marker;
                marker.width = core::display_width(text);
                marker.text = std::move(text);
                marker.node = id;
                box->marker = std::move(marker);
            }
        }

        build_children(*box, id, link);
        fix_up(*box);
        return box;
    }

    void build_children(Box& box, dom::NodeId id, std::optional<dom::NodeId> link) {
        int ordinal = start_attribute(document_.node(id)) - 1;
        for (dom::NodeId child : document_.children(id)) {
            const dom::Node& node = document_.node(child);
            if (node.is_text()) {
                if (node.data.empty()) continue;
                box.append_child(make_text_run(child, node.data, styles_[child], link));
            } else if (node.is_element()) {
                if (styles_[child].display == css::Display::ListItem) ++ordinal;
                if (auto built = build_element(child, link, ordinal)) {
                    box.append_child(std::move(built));
                }
            }
        }
    }

    // Inline boxes that contain blocks become blocks; blocks with mixed
    // children get anonymous wrappers around each inline run.
    void fix_up(Box& box) {
        bool any_block = false;
        bool any_inline = false;
        for (const auto& child : box.children) {
            if (child->is_block_level()) any_block = true;
            else any_inline = true;
        }
        if (box.kind == BoxKind::Inline && any_block) box.kind = BoxKind::Block;
        if (!box.is_block_level() || !any_block || !any_inline) return;

        std::vector<std::unique_ptr<Box>> children = std::move(box.children);
        box.children.clear();
        std::unique_ptr<Box> run;
        auto flush = [&]() {
            if (!run) return;
            bool blank = std::all_of(run->children.begin(), run->children.end(),
                                     [](const std::unique_ptr<Box>& b) {
                                         return is_collapsible_whitespace_run(*b);
                                     });
            if (!blank) box.append_child(std::move(run));
            run.reset();
        };
        for (auto& child : children) {
            if (child->is_block_level()) {
                flush();
                box.append_child(std::move(child));
                continue;
            }
            if (!run) {
                run = std::make_unique<Box>();
                run->kind = BoxKind::Anonymous;
                run->style = css::inherited_style(box.style);
                run->style.display = css::Display::Block;
                run->link = box.link;
            }
            run->append_child(std::move(child));
        }
        flush();
    }
};

// Where an inline item came from.
struct ItemSource {
    Box* box = nullptr;
};

void unite(Rect& into, const Rect& r, bool& initialized) {
    if (!initialized) {
        into = r;
        initialized = true;
        return;
    }
    int right = std::max(into.right(), r.right());
    int bottom = std::max(into.bottom(), r.bottom());
    into.x = std::min(into.x, r.x);
    into.y = std::min(into.y, r.y);
    into.width = right - into.x;
    into.height = bottom - into.y;
}

} // namespace

std::unique_ptr<Box> LayoutEngine::build_box_tree(const dom::Document& document,
                                                  const css::StyleMap& styles,
                                                  const LayoutOptions& options) const {
    BoxBuilder builder(document, styles, options);
    return builder.build_root();
}

LayoutTree LayoutEngine::layout(const dom::Document& document, const css::StyleMap& styles,
                                const LayoutOptions& options) const {
    LayoutTree tree;
    tree.width = std::max(0, options.viewport_columns);
    tree.root = build_box_tree(document, styles, options);
    layout_block(*tree.root, 0, tree.width, 0);
    tree.height = std::max(tree.root->geometry.margin_box_height(), options.viewport_rows);
    return tree;
}

void LayoutEngine::resolve_horizontal(Box& box, int containing_width) const {
    BoxGeometry& g = box.geometry;
    const css::ComputedStyle& s = box.style;
    const int cw = std::max(0, containing_width);

    const bool auto_left = s.margin[css::kLeft].is_auto();
    const bool auto_right = s.margin[css::kRight].is_auto();
    g.margin.left = auto_left ? 0 : std::max(0, s.margin[css::kLeft].to_columns(cw));
    g.margin.right = auto_right ? 0 : std::max(0, s.margin[css::kRight].to_columns(cw));
    g.margin.top = std::max(0, s.margin[css::kTop].to_rows());
    g.margin.bottom = std::max(0, s.margin[css::kBottom].to_rows());

    g.border.top = s.has_border(css::kTop) ? 1 : 0;
    g.border.right = s.has_border(css::kRight) ? 1 : 0;
    g.border.bottom = s.has_border(css::kBottom) ? 1 : 0;
    g.border.left = s.has_border(css::kLeft) ? 1 : 0;

    g.padding.left = std::max(0, s.padding[css::kLeft].to_columns(cw));
    g.padding.right = std::max(0, s.padding[css::kRight].to_columns(cw));
    g.padding.top = std::max(0, s.padding[css::kTop].to_rows());
    g.padding.bottom = std::max(0, s.padding[css::kBottom].to_rows());

    auto edges = [&]() {
        return g.margin.left + g.margin.right + g.border.left + g.border.right +
               g.padding.left + g.padding.right;
    };

    // Edges that do not fit are given up: margins first, then padding,
    // then borders.
    if (edges() > cw) g.margin.left = g.margin.right = 0;
    if (edges() > cw) g.padding.left = g.padding.right = 0;
    if (edges() > cw) g.border.left = g.border.right = 0;

    int available = std::max(0, cw - edges());
    int width = s.width.is_auto() ? available : std::max(0, s.width.to_columns(cw));
    if (!s.max_width.is_auto()) width = std::min(width, std::max(0, s.max_width.to_columns(cw)));
    width = std::min(width, available);

    int leftover = available - width;
    if (leftover > 0) {
        if (auto_left && auto_right) {
            g.margin.left += leftover / 2;
            g.margin.right += leftover - leftover / 2;
        } else if (auto_left) {
            g.margin.left += leftover;
        }
    }
    g.width = width;
}

void LayoutEngine::layout_block(Box& box, int containing_x, int containing_width, int top) const {
    resolve_horizontal(box, containing_width);
    BoxGeometry& g = box.geometry;
    g.x = containing_x + g.margin.left + g.border.left + g.padding.left;
    g.y = top + g.margin.top + g.border.top + g.padding.top;
    g.height = 0;

    if (box.has_inline_children()) {
        layout_inline_children(box);
    } else {
        layout_block_children(box);
    }

    // An explicit height acts as a minimum: content never spills out of its
    // box, so child boxes stay inside the parent's content rectangle.
    if (!box.style.height.is_auto()) g.height = std::max(g.height, box.style.height.to_rows());

    if (box.marker) {
        box.marker->row = g.y;
        box.marker->column = std::max(0, g.x - box.marker->width);
        box.marker->box = &box;
    }
}

void LayoutEngine::layout_block_children(Box& box) const {
    BoxGeometry& g = box.geometry;
    int cursor = g.y;
    int previous_margin = 0;
    bool first = true;
    for (auto& child : box.children) {
        // Adjacent sibling margins collapse to the larger of the two.
        int margin_top = std::max(0, child->style.margin[css::kTop].to_rows());
        int overlap = first ? 0 : std::min(previous_margin, margin_top);
        int child_top = cursor - overlap;
        layout_block(*child, g.x, g.width, child_top);
        cursor = child_top + child->geometry.margin_box_height();
        previous_margin = child->geometry.margin.bottom;
        first = false;
    }
    g.height = cursor - g.y;
}

void LayoutEngine::layout_inline_children(Box& box) const {
    BoxGeometry& g = box.geometry;
    std::vector<InlineItem> items;
    std::vector<ItemSource> sources;
    bool collapse_pending = true;

    auto add_atomic = [&](Box& atomic, int columns, int rows) {
        InlineItem item;
        item.type = InlineItem::Type::Atomic;
        item.width = columns;
        item.height = std::max(1, rows);
        item.source = sources.size();
        sources.push_back({&atomic});
        items.push_back(std::move(item));
        collapse_pending = false;
    };

    std::function<void(Box&)> gather = [&](Box& parent) {
        for (auto& child_ptr : parent.children) {
            Box& child = *child_ptr;
            switch (child.kind) {
                case BoxKind::Inline:
                    if (child.forced_break) {
                        InlineItem item;
                        item.type = InlineItem::Type::Break;
                        item.source = sources.size();
                        sources.push_back({&child});
                        items.push_back(std::move(item));
                        collapse_pending = true;
                    } else if (child.text_run) {
                        size_t source = sources.size();
                        sources.push_back({&child});
                        append_text_items(child.text, child.style.white_space, source, items,
                                          collapse_pending);
                    } else {
                        gather(child);
                    }
                    break;
                case BoxKind::Replaced: {
                    int columns = child.intrinsic_columns;
                    int rows = child.intrinsic_rows;
                    if (!child.style.width.is_auto()) {
                        int wanted = std::max(1, child.style.width.to_columns(g.width));
                        rows = std::max(1, rows * wanted / std::max(1, columns));
                        columns = wanted;
                    }
                    if (!child.style.height.is_auto() && child.style.height.to_rows() > 0) {
                        rows = child.style.height.to_rows();
                    }
                    if (columns > g.width && g.width > 0) {
                        rows = std::max(1, rows * g.width / columns);
                        columns = g.width;
                    }
                    add_atomic(child, columns, rows);
                    break;
                }
                case BoxKind::FormControl:
                    add_atomic(child, std::min(child.intrinsic_columns, std::max(1, g.width)),
                               child.intrinsic_rows);
                    break;
                case BoxKind::Block:
                case BoxKind::Anonymous:
                    // Inline boxes holding blocks were promoted during box
                    // generation, so nothing block-level is reached here.
                    break;
            }
        }
    };
    gather(box);

    auto lines = break_lines(items, g.width);
    box.fragments.clear();
    box.line_count = static_cast<int>(lines.size());

    int row = g.y;
    for (const auto& line : lines) {
        int offset = 0;
        int slack = std::max(0, g.width - line.width);
        if (box.style.text_align == css::TextAlign::Center) offset = slack / 2;
        else if (box.style.text_align == css::TextAlign::Right) offset = slack;

        for (const auto& placed : line.items) {
            const InlineItem& item = items[placed.item];
            Box* source = sources[item.source].box;
            int column = g.x + offset + placed.column;

            if (item.type == InlineItem::Type::Atomic) {
                LineFragment fragment;
                fragment.kind = LineFragment::Kind::Atomic;
                fragment.row = row;
                fragment.column = column;
                fragment.width = item.width;
                fragment.height = item.height;
                fragment.node = source->node.value_or(dom::Document::kRoot);
                fragment.link = source->link;
                fragment.box = source;
                source->geometry.x = column;
                source->geometry.y = row;
                source->geometry.width = item.width;
                source->geometry.height = item.height;
                box.fragments.push_back(std::move(fragment));
                continue;
            }

            if (!box.fragments.empty()) {
                LineFragment& last = box.fragments.back();
                if (last.kind == LineFragment::Kind::Text && last.box == source &&
                    last.row == row && last.column + last.width == column) {
                    last.text += item.text;
                    last.width += item.width;
                    continue;
                }
            }
            LineFragment fragment;
            fragment.row = row;
            fragment.column = column;
            fragment.width = item.width;
            fragment.text = item.text;
            fragment.node = source->node.value_or(dom::Document::kRoot);
            fragment.link = source->link;
            fragment.box = source;
            box.fragments.push_back(std::move(fragment));
        }
        row += line.height;
    }
    g.height = row - g.y;

    // Inline boxes span the fragments of their descendants.
    std::unordered_map<const Box*, Rect> extents;
    std::unordered_set<const Box*> seen;
    for (const auto& fragment : box.fragments) {
        Rect r{fragment.column, fragment.row, fragment.width, fragment.height};
        for (const Box* b = fragment.box; b && b != &box; b = b->parent) {
            bool initialized = seen.count(b) > 0;
            unite(extents[b], r, initialized);
            seen.insert(b);
        }
    }
    std::function<void(Box&)> assign = [&](Box& parent) {
        for (auto& child : parent.children) {
            if (child->kind != BoxKind::Inline) continue;
            auto it = extents.find(child.get());
            if (it != extents.end()) {
                child->geometry.x = it->second.x;
                child->geometry.y = it->second.y;
                child->geometry.width = it->second.width;
                child->geometry.height = it->second.height;
            } else {
                child->geometry.x = g.x;
                child->geometry.y = g.y;
                child->geometry.width = 0;
                child->geometry.height = 0;
            }
            assign(*child);
        }
    };
    assign(box);
}

void for_each_fragment(const Box& root, const std::function<void(const LineFragment&)>& fn) {
    if (root.marker) fn(*root.marker);
    for (const auto& fragment : root.fragments) fn(fragment);
    for (const auto& child : root.children) for_each_fragment(*child, fn);
}

std::vector<FocusTarget> collect_focus_targets(const Box& root) {
    std::vector<FocusTarget> targets;
    std::unordered_set<dom::NodeId> seen;
    for_each_fragment(root, [&](const LineFragment& fragment) {
        if (fragment.kind == LineFragment::Kind::Atomic && fragment.box &&
            fragment.box->kind == BoxKind::FormControl) {
            if (seen.insert(fragment.node).second) {
                targets.push_back({FocusTarget::Kind::Control, fragment.node, fragment.row,
                                   fragment.column});
            }
            return;
        }
        if (fragment.link && seen.insert(*fragment.link).second) {
            targets.push_back({FocusTarget::Kind::Link, *fragment.link, fragment.row,
                               fragment.column});
        }
    });
    return targets;
}

} // namespace toad::layout
