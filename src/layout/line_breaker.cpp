#include <toad/layout/line_breaker.h>
#include <toad/core/utf8.h>

#include <algorithm>
#include <optional>

namespace toad::layout {

namespace {

constexpr int kTabStop = 8;

bool is_collapsible_space(uint32_t cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '\f';
}

void push_text(std::string& word, size_t source, std::vector<InlineItem>& items) {
    if (word.empty()) return;
    InlineItem item;
    item.type = InlineItem::Type::Text;
    item.width = core::display_width(word);
    item.text = std::move(word);
    item.source = source;
    items.push_back(std::move(item));
    word.clear();
}

void push_break(size_t source, std::vector<InlineItem>& items) {
    InlineItem item;
    item.type = InlineItem::Type::Break;
    item.width = 0;
    item.source = source;
    items.push_back(std::move(item));
}

// normal, nowrap and pre-line: runs of white space become one space.
void append_collapsed(std::string_view text, css::WhiteSpace mode, size_t source,
                      std::vector<InlineItem>& items, bool& collapse_pending) {
    std::string word;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = pos;
        uint32_t cp = core::next_code_point(text, pos);
        if (!is_collapsible_space(cp)) {
            word.append(text.substr(start, pos - start));
            collapse_pending = false;
            continue;
        }
        push_text(word, source, items);
        if (cp == '\n' && mode == css::WhiteSpace::PreLine) {
            // Spaces before a preserved newline vanish.
            if (!items.empty() && items.back().type == InlineItem::Type::Space) items.pop_back();
            push_break(source, items);
            collapse_pending = true;
            continue;
        }
        if (collapse_pending) continue;
        InlineItem space;
        space.type = InlineItem::Type::Space;
        space.text = " ";
        space.width = 1;
        space.breakable = mode != css::WhiteSpace::NoWrap;
        space.source = source;
        items.push_back(std::move(space));
        collapse_pending = true;
    }
    push_text(word, source, items);
}

// pre and pre-wrap: spaces are kept, newlines force breaks, tabs expand.
void append_preserved(std::string_view text, css::WhiteSpace mode, size_t source,
                      std::vector<InlineItem>& items) {
    const bool wrap = mode == css::WhiteSpace::PreWrap;
    std::string segment;
    int column = 0;
    int space_run = 0;

    auto flush_spaces = [&]() {
        if (space_run == 0) return;
        InlineItem space;
        space.type = InlineItem::Type::Space;
        space.text.assign(static_cast<size_t>(space_run), ' ');
        space.width = space_run;
        space.preserved = true;
        space.source = source;
        items.push_back(std::move(space));
        space_run = 0;
    };

    size_t pos = 0;
    while (pos < text.size()) {
        size_t start = pos;
        uint32_t cp = core::next_code_point(text, pos);
        if (cp == '\r') continue;
        if (cp == '\n') {
            push_text(segment, source, items);
            flush_spaces();
            push_break(source, items);
            column = 0;
            continue;
        }
        if (cp == ' ' || cp == '\t') {
            int width = cp == '\t' ? kTabStop - column % kTabStop : 1;
            column += width;
            if (wrap) {
                push_text(segment, source, items);
                space_run += width;
            } else {
                segment.append(static_cast<size_t>(width), ' ');
            }
            continue;
        }
        if (wrap) flush_spaces();
        segment.append(text.substr(start, pos - start));
        column += core::code_point_width(cp);
    }
    push_text(segment, source, items);
    flush_spaces();
}

} // namespace

void append_text_items(std::string_view text, css::WhiteSpace mode, size_t source,
                       std::vector<InlineItem>& items, bool& collapse_pending) {
    switch (mode) {
        case css::WhiteSpace::Normal:
        case css::WhiteSpace::NoWrap:
        case css::WhiteSpace::PreLine:
            append_collapsed(text, mode, source, items, collapse_pending);
            break;
        case css::WhiteSpace::Pre:
        case css::WhiteSpace::PreWrap:
            append_preserved(text, mode, source, items);
            collapse_pending = false;
            break;
    }
}

std::vector<LineBoxLayout> break_lines(const std::vector<InlineItem>& items, int available_width) {
    std::vector<LineBoxLayout> lines;
    LineBoxLayout line;
    bool has_content = false;
    std::optional<size_t> pending_space;

    auto finish_line = [&]() {
        lines.push_back(std::move(line));
        line = LineBoxLayout{};
        has_content = false;
        pending_space.reset();
    };

    auto place = [&](size_t index) {
        const InlineItem& item = items[index];
        line.items.push_back({index, line.width});
        line.width += item.width;
        line.height = std::max(line.height, item.height);
    };

    size_t i = 0;
    while (i < items.size()) {
        const InlineItem& item = items[i];
        if (item.type == InlineItem::Type::Break) {
            finish_line();
            ++i;
            continue;
        }
        if (item.type == InlineItem::Type::Space) {
            if (item.breakable) {
                if (has_content || item.preserved) pending_space = i;
                ++i;
                continue;
            }
            if (!has_content) {
                ++i;
                continue;
            }
        }

        // The chunk [i, end) has no break opportunity inside it.
        size_t end = i + 1;
        int chunk_width = item.width;
        if (item.type != InlineItem::Type::Atomic) {
            while (end < items.size()) {
                const InlineItem& next = items[end];
                bool joins = next.type == InlineItem::Type::Text ||
                             (next.type == InlineItem::Type::Space && !next.breakable);
                if (!joins) break;
                chunk_width += next.width;
                ++end;
            }
        }

        int space_width = pending_space ? items[*pending_space].width : 0;
        if (has_content && line.width + space_width + chunk_width > available_width) {
            finish_line();
            space_width = 0;
        }
        if (space_width > 0) place(*pending_space);
        pending_space.reset();
        for (size_t k = i; k < end; ++k) place(k);
        has_content = true;
        i = end;
    }
    if (has_content) finish_line();
    return lines;
}

} // namespace toad::layout
