#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toad::dom {

using NodeId = std::uint32_t;

enum class NodeType {
    Document, Element, Text, Comment
};

struct Attribute {
    std::string name;
    std::string value;
};

// One arena slot. Children are ordered handles; the parent handle is a
// lookup-only back-reference and never owns anything.
struct Node {
    NodeType type = NodeType::Document;
    std::string tag_name;                 // lowercase, elements only
    std::vector<Attribute> attributes;    // unique names, source order
    std::string data;                     // text and comment payload
    std::optional<NodeId> parent;
    std::vector<NodeId> children;

    bool is_element() const { return type == NodeType::Element; }
    bool is_element(std::string_view tag) const {
        return type == NodeType::Element && tag_name == tag;
    }
    bool is_text() const { return type == NodeType::Text; }

    const std::string* attribute(std::string_view name) const;
    bool has_attribute(std::string_view name) const { return attribute(name) != nullptr; }
};

// Arena-backed DOM tree. Slot 0 is the document root; every other node is
// created as the last child of an existing node, so the tree is acyclic.
class Document {
public:
    Document();

    static constexpr NodeId kRoot = 0;

    NodeId create_element(NodeId parent, std::string_view tag_name);
    NodeId create_text(NodeId parent, std::string_view data);
    NodeId create_comment(NodeId parent, std::string_view data);

    // Adds the attribute unless the element already has one with that name.
    // Returns false when the duplicate was ignored.
    bool set_attribute(NodeId element, std::string_view name, std::string_view value);

    const Node& node(NodeId id) const { return nodes_[id]; }
    Node& node(NodeId id) { return nodes_[id]; }
    std::size_t size() const { return nodes_.size(); }

    std::optional<NodeId> parent(NodeId id) const { return nodes_[id].parent; }
    const std::vector<NodeId>& children(NodeId id) const { return nodes_[id].children; }

    // Pre-order search below (and including) from.
    std::optional<NodeId> find_first(std::string_view tag_name, NodeId from = kRoot) const;
    std::vector<NodeId> find_all(std::string_view tag_name, NodeId from = kRoot) const;
    std::optional<NodeId> ancestor(NodeId id, std::string_view tag_name) const;

    std::string text_content(NodeId id) const;

    // Whitespace-collapsed text of the first <title>, or empty.
    std::string title() const;

    // Number of nodes on the longest root-to-leaf path below id, counting id.
    int depth(NodeId id) const;

    // Debug rendering: one node per line, indented two spaces per level.
    std::string dump(NodeId id = kRoot) const;

private:
    NodeId append(NodeId parent, Node node);

    std::vector<Node> nodes_;
};

std::string collapse_whitespace(std::string_view text);

} // namespace toad::dom
