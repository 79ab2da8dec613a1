#include <toad/html/tree_builder.h>

#include <algorithm>
#include <initializer_list>

namespace toad::html {

namespace {

bool is_one_of(const std::string& tag, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        if (tag == name) return true;
    }
    return false;
}

bool is_whitespace_only(const std::string& data) {
    return std::all_of(data.begin(), data.end(), [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
    });
}

// Leading whitespace of data, and the remainder.
std::pair<std::string, std::string> split_leading_whitespace(const std::string& data) {
    size_t i = 0;
    while (i < data.size() &&
           (data[i] == ' ' || data[i] == '\t' || data[i] == '\n' || data[i] == '\r' || data[i] == '\f')) {
        ++i;
    }
    return {data.substr(0, i), data.substr(i)};
}

bool is_heading(const std::string& tag) {
    return is_one_of(tag, {"h1", "h2", "h3", "h4", "h5", "h6"});
}

bool is_head_element(const std::string& tag) {
    return is_one_of(tag, {"base", "link", "meta", "noscript", "script", "style", "template", "title"});
}

// Head elements that are complete once inserted: void, or raw text closed by
// their own end tag. Only these are moved back into <head> after </head>.
bool is_self_contained_head_element(const std::string& tag) {
    return is_one_of(tag, {"base", "link", "meta", "script", "style", "title"});
}

// Start tags that implicitly close an open <p>.
bool closes_p(const std::string& tag) {
    return is_one_of(tag, {
        "address", "article", "aside", "blockquote", "center", "details", "dialog",
        "dir", "div", "dl", "fieldset", "figcaption", "figure", "footer", "form",
        "h1", "h2", "h3", "h4", "h5", "h6", "header", "hgroup", "hr", "li", "dd",
        "dt", "main", "menu", "nav", "ol", "p", "pre", "section", "summary",
        "table", "ul"});
}

bool is_special_element(const std::string& tag) {
    return is_one_of(tag, {
        "address", "applet", "area", "article", "aside", "base", "blockquote",
        "body", "br", "button", "caption", "center", "dd", "details", "dir",
        "div", "dl", "dt", "embed", "fieldset", "figcaption", "figure", "footer",
        "form", "h1", "h2", "h3", "h4", "h5", "h6", "head", "header", "hr",
        "html", "iframe", "img", "input", "li", "link", "main", "marquee", "menu",
        "meta", "nav", "object", "ol", "p", "pre", "section", "select", "table",
        "tbody", "td", "textarea", "tfoot", "th", "thead", "tr", "ul"});
}

bool is_scope_boundary(const std::string& tag) {
    return is_one_of(tag, {"applet", "caption", "html", "table", "td", "th",
                           "marquee", "object", "template"});
}

} // namespace

bool is_void_element(std::string_view tag) {
    static constexpr std::string_view kVoid[] = {
        "area", "base", "br", "col", "embed", "hr", "img", "input",
        "link", "meta", "param", "source", "track", "wbr"};
    return std::find(std::begin(kVoid), std::end(kVoid), tag) != std::end(kVoid);
}

TreeBuilder::TreeBuilder(dom::Document& document) : document_(document) {}

void TreeBuilder::warn(std::string message) {
    warnings_.push_back(std::move(message));
}

dom::NodeId TreeBuilder::current_node() const {
    if (open_elements_.empty()) return dom::Document::kRoot;
    return open_elements_.back();
}

const std::string& TreeBuilder::current_tag() const {
    return document_.node(current_node()).tag_name;
}

dom::NodeId TreeBuilder::insert_element(const Token& token) {
    dom::NodeId id = document_.create_element(current_node(), token.name);
    for (const auto& attr : token.attributes) {
        if (!document_.set_attribute(id, attr.name, attr.value)) {
            warn("duplicate attribute '" + attr.name + "' on <" + token.name + "> ignored");
        }
    }
    if (!is_void_element(token.name) && !token.self_closing) {
        open_elements_.push_back(id);
    }
    return id;
}

dom::NodeId TreeBuilder::insert_element(const std::string& tag) {
    dom::NodeId id = document_.create_element(current_node(), tag);
    if (!is_void_element(tag)) open_elements_.push_back(id);
    return id;
}

void TreeBuilder::insert_text(const std::string& data) {
    if (data.empty()) return;
    dom::NodeId parent = current_node();
    const auto& kids = document_.node(parent).children;
    if (!kids.empty() && document_.node(kids.back()).is_text()) {
        document_.node(kids.back()).data += data;
        return;
    }
    document_.create_text(parent, data);
}

void TreeBuilder::insert_comment(const std::string& data) {
    document_.create_comment(current_node(), data);
}

void TreeBuilder::merge_attributes(dom::NodeId element, const Token& token) {
    for (const auto& attr : token.attributes) {
        document_.set_attribute(element, attr.name, attr.value);
    }
}

// script/style/title/textarea bodies arrive as one character run followed
// by the matching end tag.
void TreeBuilder::enter_text_mode_if_raw(const Token& token) {
    if (token.self_closing) return;
    if (!is_one_of(token.name, {"script", "style", "title", "textarea"})) return;
    original_mode_ = mode_;
    mode_ = InsertionMode::Text;
}

void TreeBuilder::generate_implied_end_tags(const std::string& except) {
    while (!open_elements_.empty()) {
        const std::string& tag = current_tag();
        if (tag == except) return;
        if (!is_one_of(tag, {"dd", "dt", "li", "optgroup", "option", "p", "rb", "rp", "rt", "rtc"})) {
            return;
        }
        open_elements_.pop_back();
    }
}

bool TreeBuilder::has_element_in_scope(const std::string& tag) const {
    for (auto it = open_elements_.rbegin(); it != open_elements_.rend(); ++it) {
        const std::string& name = document_.node(*it).tag_name;
        if (name == tag) return true;
        if (is_scope_boundary(name)) return false;
    }
    return false;
}

bool TreeBuilder::has_element_in_button_scope(const std::string& tag) const {
    for (auto it = open_elements_.rbegin(); it != open_elements_.rend(); ++it) {
        const std::string& name = document_.node(*it).tag_name;
        if (name == tag) return true;
        if (is_scope_boundary(name) || name == "button") return false;
    }
    return false;
}

bool TreeBuilder::has_element_in_list_item_scope(const std::string& tag) const {
    for (auto it = open_elements_.rbegin(); it != open_elements_.rend(); ++it) {
        const std::string& name = document_.node(*it).tag_name;
        if (name == tag) return true;
        if (is_scope_boundary(name) || name == "ol" || name == "ul") return false;
    }
    return false;
}

bool TreeBuilder::has_element_in_table_scope(const std::string& tag) const {
    for (auto it = open_elements_.rbegin(); it != open_elements_.rend(); ++it) {
        const std::string& name = document_.node(*it).tag_name;
        if (name == tag) return true;
        if (name == "html" || name == "table" || name == "template") return false;
    }
    return false;
}

void TreeBuilder::pop_until(const std::string& tag) {
    while (!open_elements_.empty()) {
        bool match = current_tag() == tag;
        open_elements_.pop_back();
        if (match) return;
    }
}

void TreeBuilder::close_element(const std::string& tag) {
    generate_implied_end_tags(tag);
    if (current_tag() != tag) {
        warn("<" + current_tag() + "> implicitly closed by </" + tag + ">");
    }
    pop_until(tag);
}

void TreeBuilder::apply_implicit_closures(const std::string& tag) {
    if (tag == "li" && has_element_in_list_item_scope("li")) {
        warn("<li> implicitly closed by a new <li>");
        generate_implied_end_tags("li");
        pop_until("li");
    }

    if (tag == "dd" || tag == "dt") {
        for (auto it = open_elements_.rbegin(); it != open_elements_.rend(); ++it) {
            const std::string name = document_.node(*it).tag_name;
            if (name == "dd" || name == "dt") {
                warn("<" + name + "> implicitly closed by a new <" + tag + ">");
                generate_implied_end_tags(name);
                pop_until(name);
                break;
            }
            if (is_special_element(name) && name != "address" && name != "div" && name != "p") {
                break;
            }
        }
    }

    if (closes_p(tag) && has_element_in_button_scope("p")) {
        warn("<p> implicitly closed by <" + tag + ">");
        close_element("p");
    }

    if (is_heading(tag) && is_heading(current_tag())) {
        warn("<" + current_tag() + "> implicitly closed by <" + tag + ">");
        open_elements_.pop_back();
    }

    if ((tag == "option" || tag == "optgroup") && current_tag() == "option") {
        open_elements_.pop_back();
    }
    if (tag == "optgroup" && current_tag() == "optgroup") {
        open_elements_.pop_back();
    }

    if (tag == "a" && has_element_in_scope("a")) {
        warn("nested <a> closes the open link");
        pop_until("a");
    }

    if (tag == "td" || tag == "th" || tag == "tr") {
        for (const char* cell : {"td", "th"}) {
            if (has_element_in_table_scope(cell)) close_element(cell);
        }
    }
    if (tag == "tr" && has_element_in_table_scope("tr")) {
        close_element("tr");
    }
}

void TreeBuilder::process_token(const Token& token) {
    switch (mode_) {
        case InsertionMode::Initial: handle_initial(token); break;
        case InsertionMode::BeforeHtml: handle_before_html(token); break;
        case InsertionMode::BeforeHead: handle_before_head(token); break;
        case InsertionMode::InHead: handle_in_head(token); break;
        case InsertionMode::AfterHead: handle_after_head(token); break;
        case InsertionMode::InBody: handle_in_body(token); break;
        case InsertionMode::Text: handle_text(token); break;
        case InsertionMode::AfterBody: handle_after_body(token); break;
    }
}

void TreeBuilder::handle_initial(const Token& token) {
    if (token.type == Token::DOCTYPE) {
        mode_ = InsertionMode::BeforeHtml;
        return;
    }
    if (token.type == Token::Character && is_whitespace_only(token.data)) return;
    if (token.type == Token::Comment) {
        insert_comment(token.data);
        return;
    }
    mode_ = InsertionMode::BeforeHtml;
    process_token(token);
}

void TreeBuilder::handle_before_html(const Token& token) {
    if (token.type == Token::DOCTYPE) return;
    if (token.type == Token::Comment) {
        insert_comment(token.data);
        return;
    }
    if (token.type == Token::Character) {
        auto [space, rest] = split_leading_whitespace(token.data);
        if (rest.empty()) return;
        Token remainder = token;
        remainder.data = rest;
        html_ = insert_element("html");
        mode_ = InsertionMode::BeforeHead;
        process_token(remainder);
        return;
    }
    if (token.type == Token::StartTag && token.name == "html") {
        html_ = insert_element(token);
        mode_ = InsertionMode::BeforeHead;
        return;
    }
    if (token.type == Token::EndTag &&
        !is_one_of(token.name, {"head", "body", "html", "br"})) {
        warn("stray </" + token.name + "> before <html> ignored");
        return;
    }
    html_ = insert_element("html");
    mode_ = InsertionMode::BeforeHead;
    process_token(token);
}

void TreeBuilder::handle_before_head(const Token& token) {
    if (token.type == Token::Character) {
        auto [space, rest] = split_leading_whitespace(token.data);
        if (rest.empty()) return;
        Token remainder = token;
        remainder.data = rest;
        head_ = insert_element("head");
        has_head_ = true;
        mode_ = InsertionMode::InHead;
        process_token(remainder);
        return;
    }
    if (token.type == Token::Comment) {
        insert_comment(token.data);
        return;
    }
    if (token.type == Token::DOCTYPE) return;
    if (token.type == Token::StartTag && token.name == "html") {
        merge_attributes(html_, token);
        return;
    }
    if (token.type == Token::StartTag && token.name == "head") {
        head_ = insert_element(token);
        has_head_ = true;
        mode_ = InsertionMode::InHead;
        return;
    }
    if (token.type == Token::EndTag &&
        !is_one_of(token.name, {"head", "body", "html", "br"})) {
        warn("stray </" + token.name + "> before <head> ignored");
        return;
    }
    head_ = insert_element("head");
    has_head_ = true;
    mode_ = InsertionMode::InHead;
    process_token(token);
}

void TreeBuilder::handle_in_head(const Token& token) {
    if (token.type == Token::Character) {
        auto [space, rest] = split_leading_whitespace(token.data);
        insert_text(space);
        if (rest.empty()) return;
        Token remainder = token;
        remainder.data = rest;
        pop_until("head");
        mode_ = InsertionMode::AfterHead;
        process_token(remainder);
        return;
    }
    if (token.type == Token::Comment) {
        insert_comment(token.data);
        return;
    }
    if (token.type == Token::DOCTYPE) return;

    if (token.type == Token::StartTag) {
        if (token.name == "html") {
            merge_attributes(html_, token);
            return;
        }
        if (is_head_element(token.name)) {
            insert_element(token);
            enter_text_mode_if_raw(token);
            return;
        }
        if (token.name == "head") {
            warn("second <head> ignored");
            return;
        }
    }

    if (token.type == Token::EndTag) {
        if (token.name == "head") {
            pop_until("head");
            mode_ = InsertionMode::AfterHead;
            return;
        }
        if (is_head_element(token.name) && current_tag() == token.name) {
            open_elements_.pop_back();
            return;
        }
        if (!is_one_of(token.name, {"body", "html", "br"})) {
            warn("stray </" + token.name + "> in <head> ignored");
            return;
        }
    }

    pop_until("head");
    mode_ = InsertionMode::AfterHead;
    process_token(token);
}

void TreeBuilder::handle_after_head(const Token& token) {
    if (token.type == Token::Character) {
        auto [space, rest] = split_leading_whitespace(token.data);
        insert_text(space);
        if (rest.empty()) return;
        Token remainder = token;
        remainder.data = rest;
        body_ = insert_element("body");
        mode_ = InsertionMode::InBody;
        process_token(remainder);
        return;
    }
    if (token.type == Token::Comment) {
        insert_comment(token.data);
        return;
    }
    if (token.type == Token::DOCTYPE) return;

    if (token.type == Token::StartTag) {
        if (token.name == "html") {
            merge_attributes(html_, token);
            return;
        }
        if (token.name == "body") {
            body_ = insert_element(token);
            mode_ = InsertionMode::InBody;
            return;
        }
        if (is_self_contained_head_element(token.name)) {
            warn("<" + token.name + "> after </head> moved into <head>");
            open_elements_.push_back(head_);
            insert_element(token);
            enter_text_mode_if_raw(token);
            // Void elements never pushed; the text handler pops head for
            // raw-text ones when their end tag arrives.
            if (current_node() == head_) open_elements_.pop_back();
            return;
        }
        if (token.name == "head") {
            warn("second <head> ignored");
            return;
        }
    }
    if (token.type == Token::EndTag &&
        !is_one_of(token.name, {"body", "html", "br"})) {
        warn("stray </" + token.name + "> after <head> ignored");
        return;
    }

    body_ = insert_element("body");
    mode_ = InsertionMode::InBody;
    process_token(token);
}

void TreeBuilder::handle_in_body(const Token& token) {
    switch (token.type) {
        case Token::Character:
            insert_text(token.data);
            return;
        case Token::Comment:
            insert_comment(token.data);
            return;
        case Token::DOCTYPE:
            return;
        case Token::EndOfFile:
            handle_end_of_file();
            return;
        case Token::StartTag:
            break;
        case Token::EndTag: {
            const std::string& tag = token.name;
            if (tag == "body" || tag == "html") {
                if (has_element_in_scope("body")) mode_ = InsertionMode::AfterBody;
                return;
            }
            if (tag == "p" && !has_element_in_button_scope("p")) {
                warn("</p> without an open <p>; inserted an empty paragraph");
                insert_element("p");
                open_elements_.pop_back();
                return;
            }
            if (tag == "br") {
                warn("</br> treated as <br>");
                insert_element("br");
                return;
            }
            if (tag == "li" && !has_element_in_list_item_scope("li")) {
                warn("stray </li> ignored");
                return;
            }
            if (is_heading(tag)) {
                for (auto it = open_elements_.rbegin(); it != open_elements_.rend(); ++it) {
                    const std::string name = document_.node(*it).tag_name;
                    if (is_heading(name)) {
                        close_element(name);
                        return;
                    }
                    if (is_scope_boundary(name)) break;
                }
                warn("stray </" + tag + "> ignored");
                return;
            }
            if (!has_element_in_scope(tag)) {
                warn("stray </" + tag + "> ignored");
                return;
            }
            close_element(tag);
            return;
        }
    }

    const std::string& tag = token.name;
    if (tag == "html") {
        merge_attributes(html_, token);
        return;
    }
    if (tag == "body") {
        warn("second <body> merged into the first");
        merge_attributes(body_, token);
        return;
    }
    if (tag == "head") {
        warn("<head> inside <body> ignored");
        return;
    }

    apply_implicit_closures(tag);
    insert_element(token);
    enter_text_mode_if_raw(token);
}

void TreeBuilder::handle_text(const Token& token) {
    if (token.type == Token::Character) {
        insert_text(token.data);
        return;
    }
    if (token.type == Token::EndOfFile) {
        warn("<" + current_tag() + "> unclosed at end of input");
    }
    if (token.type == Token::EndOfFile || token.type == Token::EndTag) {
        if (!open_elements_.empty()) open_elements_.pop_back();
        mode_ = original_mode_;
        if (mode_ == InsertionMode::AfterHead && current_node() == head_ && has_head_) {
            open_elements_.pop_back();
        }
    }
}

void TreeBuilder::handle_after_body(const Token& token) {
    if (token.type == Token::Character && is_whitespace_only(token.data)) {
        insert_text(token.data);
        return;
    }
    if (token.type == Token::Comment) {
        document_.create_comment(html_, token.data);
        return;
    }
    if (token.type == Token::EndOfFile) {
        handle_end_of_file();
        return;
    }
    if (token.type == Token::EndTag && token.name == "html") return;
    warn("content after </body> moved back into <body>");
    mode_ = InsertionMode::InBody;
    process_token(token);
}

void TreeBuilder::handle_end_of_file() {
    std::string unclosed;
    for (dom::NodeId id : open_elements_) {
        const std::string& tag = document_.node(id).tag_name;
        if (is_one_of(tag, {"html", "body", "p", "li", "dd", "dt", "option", "td", "th", "tr",
                            "tbody", "thead", "tfoot"})) {
            continue;
        }
        if (!unclosed.empty()) unclosed += ' ';
        unclosed += tag;
    }
    if (!unclosed.empty()) warn("unclosed at end of input: " + unclosed);
    open_elements_.clear();
}

dom::Document parse(std::string_view html, std::vector<std::string>* warnings) {
    dom::Document document;
    TreeBuilder builder(document);
    Tokenizer tokenizer(html);

    while (true) {
        Token token = tokenizer.next_token();
        if (token.type == Token::EndOfFile) {
            if (builder.mode() == InsertionMode::Text) builder.process_token(token);
            // Drive the builder through any missing html/head/body first.
            while (builder.mode() != InsertionMode::InBody &&
                   builder.mode() != InsertionMode::AfterBody) {
                Token filler;
                filler.type = Token::StartTag;
                filler.name = "body";
                builder.process_token(filler);
            }
            builder.process_token(token);
            break;
        }
        builder.process_token(token);
    }

    if (warnings) {
        warnings->insert(warnings->end(), builder.warnings().begin(), builder.warnings().end());
    }
    return document;
}

} // namespace toad::html
