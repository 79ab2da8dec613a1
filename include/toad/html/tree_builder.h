#pragma once
#include <toad/dom/document.h>
#include <toad/html/tokenizer.h>

#include <string>
#include <string_view>
#include <vector>

namespace toad::html {

enum class InsertionMode {
    Initial,
    BeforeHtml,
    BeforeHead,
    InHead,
    AfterHead,
    InBody,
    Text,
    AfterBody
};

// Builds a dom::Document from tokens with lenient recovery: implicit
// html/head/body, implied end tags for p/li/dd/dt/option/headings/table
// cells, and no token is ever discarded except ignorable whitespace
// before <body> and stray end tags. Each recovery is recorded as a warning.
class TreeBuilder {
public:
    explicit TreeBuilder(dom::Document& document);

    void process_token(const Token& token);

    InsertionMode mode() const { return mode_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    dom::Document& document_;
    dom::NodeId html_ = dom::Document::kRoot;
    dom::NodeId head_ = dom::Document::kRoot;
    dom::NodeId body_ = dom::Document::kRoot;
    bool has_head_ = false;
    std::vector<dom::NodeId> open_elements_;
    InsertionMode mode_ = InsertionMode::Initial;
    InsertionMode original_mode_ = InsertionMode::Initial;
    std::vector<std::string> warnings_;

    void handle_initial(const Token& token);
    void handle_before_html(const Token& token);
    void handle_before_head(const Token& token);
    void handle_in_head(const Token& token);
    void handle_after_head(const Token& token);
    void handle_in_body(const Token& token);
    void handle_text(const Token& token);
    void handle_after_body(const Token& token);
    void handle_end_of_file();

    dom::NodeId current_node() const;
    const std::string& current_tag() const;
    dom::NodeId insert_element(const Token& token);
    dom::NodeId insert_element(const std::string& tag);
    void insert_text(const std::string& data);
    void insert_comment(const std::string& data);
    void merge_attributes(dom::NodeId element, const Token& token);
    void enter_text_mode_if_raw(const Token& token);

    void generate_implied_end_tags(const std::string& except = "");
    bool has_element_in_scope(const std::string& tag) const;
    bool has_element_in_button_scope(const std::string& tag) const;
    bool has_element_in_list_item_scope(const std::string& tag) const;
    bool has_element_in_table_scope(const std::string& tag) const;
    void pop_until(const std::string& tag);
    void close_element(const std::string& tag);
    void apply_implicit_closures(const std::string& tag);

    void warn(std::string message);
};

// Tokenizes and builds in one pass. Recoveries are appended to warnings
// when it is non-null.
dom::Document parse(std::string_view html, std::vector<std::string>* warnings = nullptr);

bool is_void_element(std::string_view tag);

} // namespace toad::html
