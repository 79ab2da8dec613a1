#include <toad/layout/box.h>

namespace toad::layout {

const char* box_kind_name(BoxKind kind) {
    switch (kind) {
        case BoxKind::Block: return "block";
        case BoxKind::Inline: return "inline";
        case BoxKind::Anonymous: return "anonymous";
        case BoxKind::Replaced: return "replaced";
        case BoxKind::FormControl: return "control";
    }
    return "block";
}

Box* Box::append_child(std::unique_ptr<Box> child) {
    child->parent = this;
    auto* raw = child.get();
    children.push_back(std::move(child));
    return raw;
}

bool Box::has_inline_children() const {
    if (!is_block_level() || children.empty()) return false;
    for (const auto& child : children) {
        if (child->is_block_level()) return false;
    }
    return true;
}

std::string Box::dump(int indent) const {
    std::string out(static_cast<size_t>(indent) * 2, ' ');
    out += box_kind_name(kind);
    if (node) out += " #" + std::to_string(*node);
    if (text_run) out += " \"" + text + "\"";
    out += " (" + std::to_string(geometry.x) + "," + std::to_string(geometry.y) + " " +
           std::to_string(geometry.width) + "x" + std::to_string(geometry.height) + ")\n";
    for (const auto& child : children) out += child->dump(indent + 1);
    return out;
}

} // namespace toad::layout
