#include <toad/dom/document.h>

#include <algorithm>
#include <cctype>

namespace toad::dom {

const std::string* Node::attribute(std::string_view name) const {
    for (auto& attr : attributes) {
        if (attr.name == name) return &attr.value;
    }
    return nullptr;
}

Document::Document() {
    nodes_.emplace_back();
}

NodeId Document::append(NodeId parent, Node node) {
    auto id = static_cast<NodeId>(nodes_.size());
    node.parent = parent;
    nodes_.push_back(std::move(node));
    nodes_[parent].children.push_back(id);
    return id;
}

NodeId Document::create_element(NodeId parent, std::string_view tag_name) {
    Node node;
    node.type = NodeType::Element;
    node.tag_name = std::string(tag_name);
    std::transform(node.tag_name.begin(), node.tag_name.end(), node.tag_name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return append(parent, std::move(node));
}

NodeId Document::create_text(NodeId parent, std::string_view data) {
    Node node;
    node.type = NodeType::Text;
    node.data = std::string(data);
    return append(parent, std::move(node));
}

NodeId Document::create_comment(NodeId parent, std::string_view data) {
    Node node;
    node.type = NodeType::Comment;
    node.data = std::string(data);
    return append(parent, std::move(node));
}

bool Document::set_attribute(NodeId element, std::string_view name, std::string_view value) {
    Node& node = nodes_[element];
    if (node.has_attribute(name)) return false;
    node.attributes.push_back({std::string(name), std::string(value)});
    return true;
}

std::optional<NodeId> Document::find_first(std::string_view tag_name, NodeId from) const {
    if (nodes_[from].is_element(tag_name)) return from;
    for (NodeId child : nodes_[from].children) {
        if (auto found = find_first(tag_name, child)) return found;
    }
    return std::nullopt;
}

std::vector<NodeId> Document::find_all(std::string_view tag_name, NodeId from) const {
    std::vector<NodeId> result;
    std::vector<NodeId> stack{from};
    while (!stack.empty()) {
        NodeId id = stack.back();
        stack.pop_back();
        if (nodes_[id].is_element(tag_name)) result.push_back(id);
        const auto& kids = nodes_[id].children;
        for (auto it = kids.rbegin(); it != kids.rend(); ++it) stack.push_back(*it);
    }
    return result;
}

std::optional<NodeId> Document::ancestor(NodeId id, std::string_view tag_name) const {
    auto current = nodes_[id].parent;
    while (current) {
        if (nodes_[*current].is_element(tag_name)) return current;
        current = nodes_[*current].parent;
    }
    return std::nullopt;
}

std::string Document::text_content(NodeId id) const {
    const Node& node = nodes_[id];
    if (node.type == NodeType::Text) return node.data;
    if (node.type == NodeType::Comment) return {};
    std::string out;
    for (NodeId child : node.children) out += text_content(child);
    return out;
}

std::string Document::title() const {
    auto id = find_first("title");
    if (!id) return {};
    return collapse_whitespace(text_content(*id));
}

int Document::depth(NodeId id) const {
    int deepest = 0;
    for (NodeId child : nodes_[id].children) deepest = std::max(deepest, depth(child));
    return deepest + 1;
}

std::string Document::dump(NodeId id) const {
    std::string out;
    struct Frame { NodeId id; int level; };
    std::vector<Frame> stack{{id, 0}};
    while (!stack.empty()) {
        Frame frame = stack.back();
        stack.pop_back();
        const Node& node = nodes_[frame.id];
        out.append(static_cast<size_t>(frame.level) * 2, ' ');
        switch (node.type) {
            case NodeType::Document: out += "#document"; break;
            case NodeType::Element:
                out += '<' + node.tag_name;
                for (auto& attr : node.attributes) {
                    out += ' ' + attr.name + "=\"" + attr.value + '"';
                }
                out += '>';
                break;
            case NodeType::Text: out += '"' + node.data + '"'; break;
            case NodeType::Comment: out += "<!--" + node.data + "-->"; break;
        }
        out += '\n';
        for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
            stack.push_back({*it, frame.level + 1});
        }
    }
    return out;
}

std::string collapse_whitespace(std::string_view text) {
    std::string out;
    bool pending_space = false;
    for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f') {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out += ' ';
        pending_space = false;
        out += c;
    }
    return out;
}

} // namespace toad::dom
