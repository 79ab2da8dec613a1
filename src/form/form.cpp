#include <toad/form/form.h>
#include <toad/core/utf8.h>
#include <toad/url/percent_encoding.h>

#include <algorithm>
#include <cctype>

namespace toad::form {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string attr_or(const dom::Node& node, std::string_view name, const std::string& fallback) {
    const std::string* value = node.attribute(name);
    return value ? *value : fallback;
}

int int_attr(const dom::Node& node, std::string_view name, int fallback, int lo, int hi) {
    const std::string* value = node.attribute(name);
    if (!value || value->empty()) return fallback;
    int result = 0;
    for (char c : *value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return fallback;
        result = result * 10 + (c - '0');
        if (result > hi) return hi;
    }
    return std::max(lo, result);
}

// Options of a select, including those inside optgroups.
std::vector<dom::NodeId> options_of(const dom::Document& document, dom::NodeId select) {
    std::vector<dom::NodeId> options;
    for (dom::NodeId child : document.children(select)) {
        const dom::Node& node = document.node(child);
        if (node.is_element("option")) {
            options.push_back(child);
        } else if (node.is_element("optgroup")) {
            for (dom::NodeId grandchild : document.children(child)) {
                if (document.node(grandchild).is_element("option")) options.push_back(grandchild);
            }
        }
    }
    return options;
}

std::string option_value(const dom::Document& document, dom::NodeId option) {
    if (const std::string* value = document.node(option).attribute("value")) return *value;
    return dom::collapse_whitespace(document.text_content(option));
}

std::string option_label(const dom::Document& document, dom::NodeId option) {
    std::string text = dom::collapse_whitespace(document.text_content(option));
    if (text.empty()) {
        if (const std::string* label = document.node(option).attribute("label")) return *label;
    }
    return text;
}

// The option a select shows: the user's choice, the first option marked
// selected, or the first option.
std::optional<dom::NodeId> selected_option(const dom::Document& document, dom::NodeId select,
                                           const FormState* state) {
    auto options = options_of(document, select);
    if (options.empty()) return std::nullopt;
    if (state) {
        if (const std::string* chosen = state->edited_value(select)) {
            for (dom::NodeId option : options) {
                if (option_value(document, option) == *chosen) return option;
            }
        }
    }
    for (dom::NodeId option : options) {
        if (document.node(option).has_attribute("selected")) return option;
    }
    return options.front();
}

std::string pad_to(std::string text, int columns, char fill) {
    text = core::truncate_to_width(text, columns);
    int width = core::display_width(text);
    if (width < columns) text.append(static_cast<size_t>(columns - width), fill);
    return text;
}

bool is_submit_button(const dom::Document& document, dom::NodeId id) {
    ControlType type = control_type(document, id);
    return type == ControlType::Submit;
}

} // namespace

const char* control_type_name(ControlType type) {
    switch (type) {
        case ControlType::Text: return "text";
        case ControlType::Password: return "password";
        case ControlType::Hidden: return "hidden";
        case ControlType::Checkbox: return "checkbox";
        case ControlType::Radio: return "radio";
        case ControlType::Submit: return "submit";
        case ControlType::Reset: return "reset";
        case ControlType::Button: return "button";
        case ControlType::File: return "file";
        case ControlType::Select: return "select";
        case ControlType::TextArea: return "textarea";
    }
    return "text";
}

// ---------------------------------------------------------------------------
// FormState
// ---------------------------------------------------------------------------

void FormState::set_value(dom::NodeId control, std::string value) {
    values_[control] = std::move(value);
}

void FormState::set_checked(dom::NodeId control, bool checked) {
    checked_[control] = checked;
}

const std::string* FormState::edited_value(dom::NodeId control) const {
    auto it = values_.find(control);
    return it == values_.end() ? nullptr : &it->second;
}

std::optional<bool> FormState::edited_checked(dom::NodeId control) const {
    auto it = checked_.find(control);
    if (it == checked_.end()) return std::nullopt;
    return it->second;
}

void FormState::clear() {
    values_.clear();
    checked_.clear();
}

// ---------------------------------------------------------------------------
// Controls
// ---------------------------------------------------------------------------

bool is_form_control(const dom::Document& document, dom::NodeId id) {
    const dom::Node& node = document.node(id);
    return node.is_element("input") || node.is_element("select") ||
           node.is_element("textarea") || node.is_element("button");
}

ControlType control_type(const dom::Document& document, dom::NodeId id) {
    const dom::Node& node = document.node(id);
    if (node.is_element("select")) return ControlType::Select;
    if (node.is_element("textarea")) return ControlType::TextArea;
    if (node.is_element("button")) {
        std::string type = to_lower(attr_or(node, "type", "submit"));
        if (type == "reset") return ControlType::Reset;
        if (type == "button") return ControlType::Button;
        return ControlType::Submit;
    }
    std::string type = to_lower(attr_or(node, "type", "text"));
    if (type == "password") return ControlType::Password;
    if (type == "hidden") return ControlType::Hidden;
    if (type == "checkbox") return ControlType::Checkbox;
    if (type == "radio") return ControlType::Radio;
    if (type == "submit" || type == "image") return ControlType::Submit;
    if (type == "reset") return ControlType::Reset;
    if (type == "button") return ControlType::Button;
    if (type == "file") return ControlType::File;
    // search, email, url, tel, number and unknown types behave as text.
    return ControlType::Text;
}

bool is_text_entry(ControlType type) {
    return type == ControlType::Text || type == ControlType::Password ||
           type == ControlType::TextArea;
}

std::optional<dom::NodeId> owner_form(const dom::Document& document, dom::NodeId control) {
    return document.ancestor(control, "form");
}

std::string current_value(const dom::Document& document, dom::NodeId control,
                          const FormState* state) {
    ControlType type = control_type(document, control);
    if (type == ControlType::Select) {
        auto option = selected_option(document, control, state);
        return option ? option_value(document, *option) : std::string();
    }
    if (state) {
        if (const std::string* edited = state->edited_value(control)) return *edited;
    }
    const dom::Node& node = document.node(control);
    if (type == ControlType::TextArea) {
        std::string text = document.text_content(control);
        // A newline right after <textarea> is not part of the value.
        if (!text.empty() && text.front() == '\n') text.erase(0, 1);
        return text;
    }
    if (type == ControlType::Checkbox || type == ControlType::Radio) {
        return attr_or(node, "value", "on");
    }
    return attr_or(node, "value", "");
}

bool is_checked(const dom::Document& document, dom::NodeId control, const FormState* state) {
    if (state) {
        if (auto edited = state->edited_checked(control)) return *edited;
    }
    return document.node(control).has_attribute("checked");
}

void cycle_select(const dom::Document& document, dom::NodeId select, FormState& state) {
    auto options = options_of(document, select);
    if (options.empty()) return;
    auto current = selected_option(document, select, &state);
    auto it = current ? std::find(options.begin(), options.end(), *current) : options.end();
    dom::NodeId next = (it == options.end() || it + 1 == options.end()) ? options.front() : *(it + 1);
    state.set_value(select, option_value(document, next));
}

void toggle(const dom::Document& document, dom::NodeId control, FormState& state) {
    ControlType type = control_type(document, control);
    if (type == ControlType::Checkbox) {
        state.set_checked(control, !is_checked(document, control, &state));
        return;
    }
    if (type != ControlType::Radio) return;

    const std::string* name = document.node(control).attribute("name");
    auto form = owner_form(document, control);
    if (name && !name->empty()) {
        for (dom::NodeId other : document.find_all("input")) {
            if (other == control || control_type(document, other) != ControlType::Radio) continue;
            const std::string* other_name = document.node(other).attribute("name");
            if (!other_name || *other_name != *name) continue;
            if (owner_form(document, other) != form) continue;
            state.set_checked(other, false);
        }
    }
    state.set_checked(control, true);
}

std::optional<dom::NodeId> default_submitter(const dom::Document& document, dom::NodeId form) {
    for (dom::NodeId id = form + 1; id < document.size(); ++id) {
        const dom::Node& node = document.node(id);
        if (!node.is_element()) continue;
        if (owner_form(document, id) != form) continue;
        if (is_form_control(document, id) && is_submit_button(document, id)) return id;
    }
    return std::nullopt;
}

std::vector<std::string> control_footprint(const dom::Document& document, dom::NodeId control,
                                           const FormState* state) {
    const dom::Node& node = document.node(control);
    ControlType type = control_type(document, control);
    switch (type) {
        case ControlType::Hidden:
            return {};
        case ControlType::Checkbox:
            return {is_checked(document, control, state) ? "[x]" : "[ ]"};
        case ControlType::Radio:
            return {is_checked(document, control, state) ? "(*)" : "( )"};
        case ControlType::Submit:
        case ControlType::Reset:
        case ControlType::Button:
        case ControlType::File: {
            std::string label;
            if (node.is_element("button")) {
                label = dom::collapse_whitespace(document.text_content(control));
            } else {
                label = attr_or(node, "value", "");
            }
            if (label.empty()) {
                if (type == ControlType::Submit) label = "Submit";
                else if (type == ControlType::Reset) label = "Reset";
                else if (type == ControlType::File) label = "Browse...";
                else label = "Button";
            }
            return {"[ " + label + " ]"};
        }
        case ControlType::Select: {
            auto option = selected_option(document, control, state);
            std::string label = option ? option_label(document, *option) : std::string();
            return {"[" + label + " v]"};
        }
        case ControlType::TextArea: {
            int cols = int_attr(node, "cols", 20, 1, 200);
            int rows = int_attr(node, "rows", 2, 1, 50);
            std::string value = current_value(document, control, state);
            std::vector<std::string> lines;
            size_t start = 0;
            while (static_cast<int>(lines.size()) < rows) {
                size_t end = value.find('\n', start);
                std::string line = start <= value.size()
                                       ? value.substr(start, end == std::string::npos
                                                                 ? std::string::npos
                                                                 : end - start)
                                       : std::string();
                lines.push_back("[" + pad_to(line, cols, '_') + "]");
                start = end == std::string::npos ? value.size() + 1 : end + 1;
            }
            return lines;
        }
        case ControlType::Text:
        case ControlType::Password: {
            int size = int_attr(node, "size", 20, 1, 200);
            std::string value = current_value(document, control, state);
            if (type == ControlType::Password) {
                value.assign(static_cast<size_t>(core::display_width(value)), '*');
            }
            if (value.empty()) {
                if (const std::string* placeholder = node.attribute("placeholder")) {
                    value = *placeholder;
                }
            }
            return {"[" + pad_to(value, size, '_') + "]"};
        }
    }
    return {};
}

// ---------------------------------------------------------------------------
// Submission
// ---------------------------------------------------------------------------

std::optional<FormDescriptor> collect_form(const dom::Document& document, dom::NodeId form,
                                           const url::URL& base, const FormState* state,
                                           std::optional<dom::NodeId> submitter) {
    const dom::Node& form_node = document.node(form);
    FormDescriptor descriptor;
    descriptor.method = to_lower(attr_or(form_node, "method", "get")) == "post" ? Method::Post
                                                                              : Method::Get;

    std::string action = attr_or(form_node, "action", "");
    auto action_url = url::parse(action, &base);
    if (!action_url) return std::nullopt;
    descriptor.action = *action_url;

    for (dom::NodeId id = form + 1; id < document.size(); ++id) {
        const dom::Node& node = document.node(id);
        if (!node.is_element() || !is_form_control(document, id)) continue;
        if (owner_form(document, id) != form) continue;
        if (node.has_attribute("disabled")) continue;
        const std::string* name = node.attribute("name");
        if (!name || name->empty()) continue;

        ControlType type = control_type(document, id);
        switch (type) {
            case ControlType::Checkbox:
            case ControlType::Radio:
                if (!is_checked(document, id, state)) continue;
                break;
            case ControlType::Submit:
                if (!submitter || *submitter != id) continue;
                break;
            case ControlType::Reset:
            case ControlType::Button:
            case ControlType::File:
                continue;
            case ControlType::Select:
                if (options_of(document, id).empty()) continue;
                break;
            default:
                break;
        }
        descriptor.fields.push_back({*name, current_value(document, id, state), type});
    }
    return descriptor;
}

std::string encode_urlencoded(const std::vector<FormField>& fields) {
    std::string out;
    for (const auto& field : fields) {
        if (!out.empty()) out += '&';
        out += url::percent_encode(field.name);
        out += '=';
        out += url::percent_encode(field.value);
    }
    return out;
}

SubmissionRequest build_submission(const FormDescriptor& descriptor) {
    SubmissionRequest request;
    request.method = descriptor.method;
    request.url = descriptor.action;
    std::string encoded = encode_urlencoded(descriptor.fields);
    if (descriptor.method == Method::Get) {
        request.url.query = encoded;
    } else {
        request.body = std::move(encoded);
        request.content_type = kUrlEncodedContentType;
    }
    return request;
}

} // namespace toad::form
