#include <gtest/gtest.h>
#include <toad/form/form.h>
#include <toad/html/tree_builder.h>

#include <string>
#include <vector>

using namespace toad;
using namespace toad::form;

namespace {

dom::NodeId by_id(const dom::Document& doc, const std::string& id) {
    for (dom::NodeId n = 0; n < doc.size(); ++n) {
        const std::string* value = doc.node(n).attribute("id");
        if (value && *value == id) return n;
    }
    ADD_FAILURE() << "no element with id " << id;
    return dom::Document::kRoot;
}

url::URL base_url() {
    return *url::parse("http://example.com/dir/page.html");
}

} // namespace

// =============================================================================
// Control classification
// =============================================================================
TEST(FormControlTest, TypesFromMarkup) {
    auto doc = html::parse(
        "<input id=a><input id=b type=PASSWORD><input id=c type=checkbox>"
        "<input id=d type=email><button id=e>Go</button><button id=f type=reset>R</button>"
        "<select id=g></select><textarea id=h></textarea><input id=i type=image>");
    EXPECT_EQ(control_type(doc, by_id(doc, "a")), ControlType::Text);
    EXPECT_EQ(control_type(doc, by_id(doc, "b")), ControlType::Password);
    EXPECT_EQ(control_type(doc, by_id(doc, "c")), ControlType::Checkbox);
    EXPECT_EQ(control_type(doc, by_id(doc, "d")), ControlType::Text);
    EXPECT_EQ(control_type(doc, by_id(doc, "e")), ControlType::Submit);
    EXPECT_EQ(control_type(doc, by_id(doc, "f")), ControlType::Reset);
    EXPECT_EQ(control_type(doc, by_id(doc, "g")), ControlType::Select);
    EXPECT_EQ(control_type(doc, by_id(doc, "h")), ControlType::TextArea);
    EXPECT_EQ(control_type(doc, by_id(doc, "i")), ControlType::Submit);
    EXPECT_TRUE(is_text_entry(ControlType::Password));
    EXPECT_FALSE(is_text_entry(ControlType::Checkbox));
    EXPECT_STREQ(control_type_name(ControlType::TextArea), "textarea");
}

TEST(FormControlTest, CurrentValuePrefersEdits) {
    auto doc = html::parse("<input id=q value=start><textarea id=t>\nline</textarea>");
    dom::NodeId q = by_id(doc, "q");
    dom::NodeId t = by_id(doc, "t");
    EXPECT_EQ(current_value(doc, q, nullptr), "start");
    EXPECT_EQ(current_value(doc, t, nullptr), "line");

    FormState state;
    EXPECT_TRUE(state.empty());
    state.set_value(q, "edited");
    EXPECT_EQ(current_value(doc, q, &state), "edited");
    EXPECT_FALSE(state.empty());
    state.clear();
    EXPECT_EQ(current_value(doc, q, &state), "start");
}

// =============================================================================
// Footprints
// =============================================================================
TEST(FormFootprintTest, TextInputPadsToSize) {
    auto doc = html::parse("<input id=a size=5 value=ab><input id=b>");
    auto a = control_footprint(doc, by_id(doc, "a"), nullptr);
    ASSERT_EQ(a.size(), 1u);
    EXPECT_EQ(a[0], "[ab___]");
    auto b = control_footprint(doc, by_id(doc, "b"), nullptr);
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(b[0], "[" + std::string(20, '_') + "]");
}

TEST(FormFootprintTest, PasswordMasked) {
    auto doc = html::parse("<input id=p type=password size=6 value=abc>");
    EXPECT_EQ(control_footprint(doc, by_id(doc, "p"), nullptr)[0], "[***___]");
}

TEST(FormFootprintTest, LongValueTruncated) {
    auto doc = html::parse("<input id=a size=3 value=abcdef>");
    EXPECT_EQ(control_footprint(doc, by_id(doc, "a"), nullptr)[0], "[abc]");
}

TEST(FormFootprintTest, CheckboxAndRadio) {
    auto doc = html::parse("<input id=c type=checkbox checked><input id=r type=radio>");
    EXPECT_EQ(control_footprint(doc, by_id(doc, "c"), nullptr)[0], "[x]");
    EXPECT_EQ(control_footprint(doc, by_id(doc, "r"), nullptr)[0], "( )");
}

TEST(FormFootprintTest, ButtonsUseLabelOrDefault) {
    auto doc = html::parse(
        "<input id=a type=submit><input id=b type=submit value=Search>"
        "<button id=c> Send  it </button><input id=d type=reset><input id=e type=file>");
    EXPECT_EQ(control_footprint(doc, by_id(doc, "a"), nullptr)[0], "[ Submit ]");
    EXPECT_EQ(control_footprint(doc, by_id(doc, "b"), nullptr)[0], "[ Search ]");
    EXPECT_EQ(control_footprint(doc, by_id(doc, "c"), nullptr)[0], "[ Send it ]");
    EXPECT_EQ(control_footprint(doc, by_id(doc, "d"), nullptr)[0], "[ Reset ]");
    EXPECT_EQ(control_footprint(doc, by_id(doc, "e"), nullptr)[0], "[ Browse... ]");
}

TEST(FormFootprintTest, SelectShowsSelectedOption) {
    auto doc = html::parse(
        "<select id=s><option>One<option selected>Two<option>Three</select>");
    EXPECT_EQ(control_footprint(doc, by_id(doc, "s"), nullptr)[0], "[Two v]");
}

TEST(FormFootprintTest, TextAreaRows) {
    auto doc = html::parse("<textarea id=t cols=4 rows=3>ab\ncd</textarea>");
    auto rows = control_footprint(doc, by_id(doc, "t"), nullptr);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0], "[ab__]");
    EXPECT_EQ(rows[1], "[cd__]");
    EXPECT_EQ(rows[2], "[____]");
}

TEST(FormFootprintTest, HiddenHasNoFootprint) {
    auto doc = html::parse("<input id=h type=hidden name=x value=1>");
    EXPECT_TRUE(control_footprint(doc, by_id(doc, "h"), nullptr).empty());
}

// =============================================================================
// Interaction
// =============================================================================
TEST(FormInteractionTest, CheckboxToggles) {
    auto doc = html::parse("<input id=c type=checkbox>");
    dom::NodeId c = by_id(doc, "c");
    FormState state;
    EXPECT_FALSE(is_checked(doc, c, &state));
    toggle(doc, c, state);
    EXPECT_TRUE(is_checked(doc, c, &state));
    toggle(doc, c, state);
    EXPECT_FALSE(is_checked(doc, c, &state));
}

TEST(FormInteractionTest, RadioGroupExclusive) {
    auto doc = html::parse(
        "<form><input id=a type=radio name=g checked><input id=b type=radio name=g>"
        "<input id=c type=radio name=other checked></form>"
        "<form><input id=d type=radio name=g checked></form>");
    FormState state;
    toggle(doc, by_id(doc, "b"), state);
    EXPECT_FALSE(is_checked(doc, by_id(doc, "a"), &state));
    EXPECT_TRUE(is_checked(doc, by_id(doc, "b"), &state));
    EXPECT_TRUE(is_checked(doc, by_id(doc, "c"), &state));
    EXPECT_TRUE(is_checked(doc, by_id(doc, "d"), &state));

    // Selecting a checked radio again keeps it checked.
    toggle(doc, by_id(doc, "b"), state);
    EXPECT_TRUE(is_checked(doc, by_id(doc, "b"), &state));
}

TEST(FormInteractionTest, SelectCyclesAndWraps) {
    auto doc = html::parse(
        "<select id=s><option value=1>One<optgroup><option value=2>Two</optgroup>"
        "<option value=3>Three</select>");
    dom::NodeId s = by_id(doc, "s");
    FormState state;
    EXPECT_EQ(current_value(doc, s, &state), "1");
    cycle_select(doc, s, state);
    EXPECT_EQ(current_value(doc, s, &state), "2");
    cycle_select(doc, s, state);
    EXPECT_EQ(current_value(doc, s, &state), "3");
    cycle_select(doc, s, state);
    EXPECT_EQ(current_value(doc, s, &state), "1");
}

TEST(FormInteractionTest, DefaultSubmitterIsFirstSubmit) {
    auto doc = html::parse(
        "<form id=f><input name=q><button id=x type=button>B</button>"
        "<input id=s1 type=submit><input id=s2 type=submit></form>"
        "<form id=g><input name=q></form>");
    EXPECT_EQ(default_submitter(doc, by_id(doc, "f")), by_id(doc, "s1"));
    EXPECT_FALSE(default_submitter(doc, by_id(doc, "g")).has_value());
}

// =============================================================================
// Submission
// =============================================================================
TEST(FormSubmissionTest, GetEncodesIntoQuery) {
    auto doc = html::parse("<form id=f action=/search><input name=q value='hello world'></form>");
    url::URL base = base_url();
    auto descriptor = collect_form(doc, by_id(doc, "f"), base, nullptr);
    ASSERT_TRUE(descriptor.has_value());
    EXPECT_EQ(descriptor->method, Method::Get);
    ASSERT_EQ(descriptor->fields.size(), 1u);
    EXPECT_EQ(descriptor->fields[0].name, "q");
    EXPECT_EQ(descriptor->fields[0].value, "hello world");

    SubmissionRequest request = build_submission(*descriptor);
    EXPECT_EQ(request.method, Method::Get);
    EXPECT_EQ(request.url.serialize(), "http://example.com/search?q=hello%20world");
    EXPECT_TRUE(request.body.empty());
    EXPECT_TRUE(request.content_type.empty());
}

TEST(FormSubmissionTest, GetReplacesExistingQuery) {
    auto doc = html::parse("<form id=f action='/s?old=1'><input name=a value=b></form>");
    auto descriptor = collect_form(doc, by_id(doc, "f"), base_url(), nullptr);
    ASSERT_TRUE(descriptor.has_value());
    EXPECT_EQ(build_submission(*descriptor).url.query, "a=b");
}

TEST(FormSubmissionTest, PostEncodesIntoBody) {
    auto doc = html::parse(
        "<form id=f method=POST action=login><input name=user value=me>"
        "<input type=password name=pw value='a&b=c'></form>");
    auto descriptor = collect_form(doc, by_id(doc, "f"), base_url(), nullptr);
    ASSERT_TRUE(descriptor.has_value());
    SubmissionRequest request = build_submission(*descriptor);
    EXPECT_EQ(request.method, Method::Post);
    EXPECT_EQ(request.url.serialize(), "http://example.com/dir/login");
    EXPECT_EQ(request.body, "user=me&pw=a%26b%3Dc");
    EXPECT_EQ(request.content_type, kUrlEncodedContentType);
}

TEST(FormSubmissionTest, EmptyActionUsesBase) {
    auto doc = html::parse("<form id=f><input name=x value=1></form>");
    auto descriptor = collect_form(doc, by_id(doc, "f"), base_url(), nullptr);
    ASSERT_TRUE(descriptor.has_value());
    EXPECT_EQ(descriptor->action.path, "/dir/page.html");
}

TEST(FormSubmissionTest, OnlySuccessfulControls) {
    auto doc = html::parse(
        "<form id=f>"
        "<input name=text value=t>"
        "<input value=unnamed>"
        "<input name=off disabled value=d>"
        "<input type=checkbox name=c1 checked>"
        "<input type=checkbox name=c2 value=no>"
        "<input type=radio name=r value=x><input type=radio name=r value=y checked>"
        "<input type=hidden name=h value=secret>"
        "<input type=reset name=rs><input type=button name=bt value=b>"
        "<input type=file name=fl>"
        "<select name=s><option value=v1>1<option value=v2 selected>2</select>"
        "<textarea name=ta>body</textarea>"
        "<input id=go type=submit name=go value=Go><input type=submit name=other value=O>"
        "</form>");
    dom::NodeId form = by_id(doc, "f");
    auto descriptor = collect_form(doc, form, base_url(), nullptr, by_id(doc, "go"));
    ASSERT_TRUE(descriptor.has_value());
    EXPECT_EQ(encode_urlencoded(descriptor->fields),
              "text=t&c1=on&r=y&h=secret&s=v2&ta=body&go=Go");
}

TEST(FormSubmissionTest, EditedStateIsSubmitted) {
    auto doc = html::parse(
        "<form id=f><input id=q name=q><input id=c type=checkbox name=c></form>");
    FormState state;
    state.set_value(by_id(doc, "q"), "typed text");
    toggle(doc, by_id(doc, "c"), state);
    auto descriptor = collect_form(doc, by_id(doc, "f"), base_url(), &state);
    ASSERT_TRUE(descriptor.has_value());
    EXPECT_EQ(encode_urlencoded(descriptor->fields), "q=typed%20text&c=on");
}

TEST(FormSubmissionTest, ControlsOfOtherFormsExcluded) {
    auto doc = html::parse(
        "<form id=a><input name=x value=1></form><form id=b><input name=y value=2></form>");
    auto descriptor = collect_form(doc, by_id(doc, "b"), base_url(), nullptr);
    ASSERT_TRUE(descriptor.has_value());
    ASSERT_EQ(descriptor->fields.size(), 1u);
    EXPECT_EQ(descriptor->fields[0].name, "y");
}

TEST(FormSubmissionTest, UrlEncodingOfUnicode) {
    std::vector<FormField> fields{{"n", "\xC3\xA9", ControlType::Text}, {"e", "", ControlType::Text}};
    EXPECT_EQ(encode_urlencoded(fields), "n=%C3%A9&e=");
    EXPECT_EQ(encode_urlencoded({}), "");
}
