#pragma once
#include <toad/dom/document.h>
#include <toad/url/url.h>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace toad::form {

enum class Method { Get, Post };

enum class ControlType {
    Text,
    Password,
    Hidden,
    Checkbox,
    Radio,
    Submit,
    Reset,
    Button,
    File,
    Select,
    TextArea
};

const char* control_type_name(ControlType type);

struct FormField {
    std::string name;
    std::string value;
    ControlType type = ControlType::Text;
};

struct FormDescriptor {
    Method method = Method::Get;
    url::URL action;
    std::vector<FormField> fields;
};

// Outgoing request produced by a form submission.
struct SubmissionRequest {
    Method method = Method::Get;
    url::URL url;
    std::string body;
    std::string content_type;   // empty for GET
};

inline constexpr const char kUrlEncodedContentType[] = "application/x-www-form-urlencoded";

// Values and checked states the user changed on the current page. Controls
// without an entry show their markup defaults.
class FormState {
public:
    void set_value(dom::NodeId control, std::string value);
    void set_checked(dom::NodeId control, bool checked);

    const std::string* edited_value(dom::NodeId control) const;
    std::optional<bool> edited_checked(dom::NodeId control) const;

    bool empty() const { return values_.empty() && checked_.empty(); }
    void clear();

private:
    std::unordered_map<dom::NodeId, std::string> values_;
    std::unordered_map<dom::NodeId, bool> checked_;
};

// input, select, textarea and button elements; hidden inputs included.
bool is_form_control(const dom::Document& document, dom::NodeId id);
ControlType control_type(const dom::Document& document, dom::NodeId id);
bool is_text_entry(ControlType type);

std::optional<dom::NodeId> owner_form(const dom::Document& document, dom::NodeId control);

std::string current_value(const dom::Document& document, dom::NodeId control,
                          const FormState* state);
bool is_checked(const dom::Document& document, dom::NodeId control, const FormState* state);

// Checkboxes flip; a radio becomes checked and unchecks the other radios of
// its group (same name, same form).
void toggle(const dom::Document& document, dom::NodeId control, FormState& state);

// Moves a select to its next option, wrapping after the last one.
void cycle_select(const dom::Document& document, dom::NodeId select, FormState& state);

// The first submit button of form, used for implicit submission.
std::optional<dom::NodeId> default_submitter(const dom::Document& document, dom::NodeId form);

// Rendered footprint of a control, one string per row:
// [value____], [ label ], [x], ( ), [choice v].
std::vector<std::string> control_footprint(const dom::Document& document, dom::NodeId control,
                                           const FormState* state);

// Named, successful controls below form in document order. Returns nullopt
// when the action does not resolve against base.
std::optional<FormDescriptor> collect_form(const dom::Document& document, dom::NodeId form,
                                           const url::URL& base, const FormState* state,
                                           std::optional<dom::NodeId> submitter = std::nullopt);

// name=value pairs joined by '&', percent-encoded (space becomes %20).
std::string encode_urlencoded(const std::vector<FormField>& fields);

SubmissionRequest build_submission(const FormDescriptor& descriptor);

} // namespace toad::form
