#include <gtest/gtest.h>
#include <toad/css/parser/stylesheet.h>
#include <toad/css/style/computed_style.h>
#include <toad/css/style/selector_matcher.h>
#include <toad/css/style/style_resolver.h>
#include <toad/css/style/user_agent.h>
#include <toad/html/tree_builder.h>

#include <string>

using namespace toad;
using namespace toad::css;

namespace {

// Resolves styles for html with the default sheet plus author css.
StyleMap resolve(const dom::Document& doc, const std::string& author_css,
                 SystemColors colors = {}) {
    StyleResolver resolver(default_user_agent_stylesheet(), colors);
    if (!author_css.empty()) resolver.add_author_sheet(parse_stylesheet(author_css));
    return resolver.resolve_document(doc);
}

dom::NodeId by_id(const dom::Document& doc, const std::string& id) {
    for (dom::NodeId n = 0; n < doc.size(); ++n) {
        const std::string* value = doc.node(n).attribute("id");
        if (value && *value == id) return n;
    }
    ADD_FAILURE() << "no element with id " << id;
    return dom::Document::kRoot;
}

const Color kRed{255, 0, 0, 255};
const Color kBlue{0, 0, 255, 255};
const Color kGreen{0, 128, 0, 255};
const Color kPurple{128, 0, 128, 255};

} // namespace

// =============================================================================
// Values
// =============================================================================
TEST(CSSValues, ParseColorForms) {
    EXPECT_EQ(parse_color("red"), kRed);
    EXPECT_EQ(parse_color("  RED "), kRed);
    EXPECT_EQ(parse_color("#f00"), kRed);
    EXPECT_EQ(parse_color("#0000ff"), kBlue);
    EXPECT_EQ(parse_color("rgb(0, 128, 0)"), kGreen);
    EXPECT_EQ(parse_color("rgba(255 0 0 / 50%)")->a, 128);
    EXPECT_EQ(parse_color("transparent"), Color::transparent());
    EXPECT_FALSE(parse_color("#12").has_value());
    EXPECT_FALSE(parse_color("notacolor").has_value());
    EXPECT_FALSE(parse_color("rgb(1, 2)").has_value());
}

TEST(CSSValues, ParseLengthUnits) {
    EXPECT_EQ(parse_length("16px"), Length::px(16));
    EXPECT_EQ(parse_length("2em"), Length::em(2));
    EXPECT_EQ(parse_length("50%"), Length::percent(50));
    EXPECT_EQ(parse_length("0"), Length::zero());
    EXPECT_TRUE(parse_length("auto")->is_auto());
    EXPECT_FALSE(parse_length("12").has_value());
    EXPECT_FALSE(parse_length("3furlongs").has_value());
}

TEST(CSSValues, LengthsResolveToCells) {
    EXPECT_EQ(Length::px(16).to_columns(80), 2);
    EXPECT_EQ(Length::em(3).to_columns(80), 3);
    EXPECT_EQ(parse_length("1ch")->to_columns(80), 1);
    EXPECT_EQ(Length::percent(50).to_columns(40), 20);
    EXPECT_EQ(Length::auto_val().to_columns(40), 0);
    EXPECT_EQ(parse_length("1lh")->to_rows(), 1);
    EXPECT_EQ(Length::px(32).to_rows(), 2);
    EXPECT_EQ(Length::percent(50).to_rows(), 0);
}

TEST(CSSValues, PropertyTable) {
    ASSERT_NE(find_property("color"), nullptr);
    EXPECT_TRUE(find_property("color")->inherited);
    ASSERT_NE(find_property("margin-top"), nullptr);
    EXPECT_FALSE(find_property("margin-top")->inherited);
    EXPECT_EQ(find_property("transform"), nullptr);
    EXPECT_TRUE(is_shorthand_property("margin"));
    EXPECT_FALSE(is_shorthand_property("margin-top"));
}

TEST(CSSValues, InheritedStyleCopiesOnlyInheritedProperties) {
    ComputedStyle parent;
    parent.color = kRed;
    parent.font_weight = FontWeight::Bold;
    parent.background_color = kBlue;
    parent.margin[kTop] = Length::px(16);
    ComputedStyle child = inherited_style(parent);
    EXPECT_EQ(child.color, kRed);
    EXPECT_TRUE(child.is_bold());
    EXPECT_TRUE(child.background_color.is_transparent());
    EXPECT_EQ(child.margin[kTop], Length::zero());
}

// =============================================================================
// Selector matching
// =============================================================================
TEST(CSSSelectorMatching, DescendantAndChild) {
    auto doc = html::parse("<div id=outer><section><p id=inner>x</p></section></div>");
    SelectorMatcher matcher(doc);
    dom::NodeId p = by_id(doc, "inner");
    EXPECT_TRUE(matcher.matches(p, parse_selector_list("div p")[0]));
    EXPECT_FALSE(matcher.matches(p, parse_selector_list("div > p")[0]));
    EXPECT_TRUE(matcher.matches(p, parse_selector_list("section > p")[0]));
    EXPECT_TRUE(matcher.matches(p, parse_selector_list("#outer p#inner")[0]));
    EXPECT_FALSE(matcher.matches(p, parse_selector_list("ul p")[0]));
}

TEST(CSSSelectorMatching, LongDescendantChainOnDeepTree) {
    std::string html;
    for (int i = 0; i < 200; ++i) html += "<div>";
    html += "<span id=leaf>x</span>";
    auto doc = html::parse(html);
    SelectorMatcher matcher(doc);
    dom::NodeId leaf = by_id(doc, "leaf");
    EXPECT_FALSE(matcher.matches(leaf, parse_selector_list("section div div div div div div span")[0]));
    EXPECT_FALSE(matcher.matches(leaf, parse_selector_list("div div div div div div p span")[0]));
    EXPECT_TRUE(matcher.matches(leaf, parse_selector_list("body div div div div div div span")[0]));
    EXPECT_TRUE(matcher.matches(leaf, parse_selector_list("div > div div > div div span#leaf")[0]));
}

TEST(CSSSelectorMatching, ClassesAndAttributes) {
    auto doc = html::parse("<a id=l class='btn primary' href='https://x.org/a.pdf' lang=en-US>x</a>");
    SelectorMatcher matcher(doc);
    dom::NodeId a = by_id(doc, "l");
    EXPECT_TRUE(matcher.matches(a, parse_selector_list(".btn.primary")[0]));
    EXPECT_FALSE(matcher.matches(a, parse_selector_list(".secondary")[0]));
    EXPECT_TRUE(matcher.matches(a, parse_selector_list("[href]")[0]));
    EXPECT_TRUE(matcher.matches(a, parse_selector_list("[href^=https]")[0]));
    EXPECT_TRUE(matcher.matches(a, parse_selector_list("[href$='.pdf']")[0]));
    EXPECT_TRUE(matcher.matches(a, parse_selector_list("[href*=x]")[0]));
    EXPECT_TRUE(matcher.matches(a, parse_selector_list("[class~=primary]")[0]));
    EXPECT_TRUE(matcher.matches(a, parse_selector_list("[lang|=en]")[0]));
    EXPECT_FALSE(matcher.matches(a, parse_selector_list("[title]")[0]));
}

TEST(CSSSelectorMatching, StructuralPseudoClasses) {
    auto doc = html::parse("<ul><li id=a>1</li><li id=b>2</li><li id=c>3</li></ul>");
    SelectorMatcher matcher(doc);
    auto first = parse_selector_list("li:first-child")[0];
    auto last = parse_selector_list("li:last-child")[0];
    EXPECT_TRUE(matcher.matches(by_id(doc, "a"), first));
    EXPECT_FALSE(matcher.matches(by_id(doc, "b"), first));
    EXPECT_TRUE(matcher.matches(by_id(doc, "c"), last));
    EXPECT_TRUE(matcher.matches(*doc.find_first("html"), parse_selector_list(":root")[0]));
}

TEST(CSSSelectorMatching, LinkNeedsHref) {
    auto doc = html::parse("<a id=with href=x>1</a><a id=without>2</a>");
    SelectorMatcher matcher(doc);
    auto link = parse_selector_list("a:link")[0];
    EXPECT_TRUE(matcher.matches(by_id(doc, "with"), link));
    EXPECT_FALSE(matcher.matches(by_id(doc, "without"), link));
    EXPECT_FALSE(matcher.matches(by_id(doc, "with"), parse_selector_list("a:hover")[0]));
}

// =============================================================================
// Cascade
// =============================================================================
TEST(CSSCascade, LaterRuleWinsAtEqualSpecificity) {
    auto doc = html::parse("<p id=t class=a>x</p>");
    auto styles = resolve(doc, ".a{color:red} .a{color:blue}");
    EXPECT_EQ(styles[by_id(doc, "t")].color, kBlue);
}

TEST(CSSCascade, IdBeatsClassRegardlessOfOrder) {
    auto doc = html::parse("<p id=t class=a>x</p>");
    auto styles = resolve(doc, "#t{color:green} .a{color:red}");
    EXPECT_EQ(styles[by_id(doc, "t")].color, kGreen);
    auto reversed = resolve(doc, ".a{color:red} #t{color:green}");
    EXPECT_EQ(reversed[by_id(doc, "t")].color, kGreen);
}

TEST(CSSCascade, ColorInheritsFromAncestor) {
    auto doc = html::parse("<div style='color: purple'><section><span id=t>x</span></section></div>");
    auto styles = resolve(doc, "");
    EXPECT_EQ(styles[by_id(doc, "t")].color, kPurple);
}

TEST(CSSCascade, MarginDoesNotInherit) {
    auto doc = html::parse("<div id=d style='margin-left: 4ch'><span id=t>x</span></div>");
    auto styles = resolve(doc, "");
    EXPECT_EQ(styles[by_id(doc, "d")].margin[kLeft].to_columns(80), 4);
    EXPECT_EQ(styles[by_id(doc, "t")].margin[kLeft], Length::zero());
}

TEST(CSSCascade, InlineStyleBeatsAuthorRules) {
    auto doc = html::parse("<p id=t style='color: blue'>x</p>");
    auto styles = resolve(doc, "#t { color: red }");
    EXPECT_EQ(styles[by_id(doc, "t")].color, kBlue);
}

TEST(CSSCascade, AuthorBeatsUserAgent) {
    auto doc = html::parse("<h1 id=t>x</h1>");
    auto ua_only = resolve(doc, "");
    EXPECT_EQ(ua_only[by_id(doc, "t")].color, (Color{0xcc, 0, 0, 255}));
    auto styles = resolve(doc, "h1 { color: blue; font-weight: normal }");
    EXPECT_EQ(styles[by_id(doc, "t")].color, kBlue);
    EXPECT_FALSE(styles[by_id(doc, "t")].is_bold());
}

TEST(CSSCascade, ImportantBeatsSpecificityWithinOrigin) {
    auto doc = html::parse("<p id=t class=a>x</p>");
    auto styles = resolve(doc, ".a { color: red !important } #t { color: blue }");
    EXPECT_EQ(styles[by_id(doc, "t")].color, kRed);
}

TEST(CSSCascade, UnsupportedDeclarationsIgnored) {
    auto doc = html::parse("<p id=t>x</p>");
    auto styles = resolve(doc, "p { color: green; color: sparkly; transform: rotate(1deg) }");
    EXPECT_EQ(styles[by_id(doc, "t")].color, kGreen);
}

TEST(CSSCascade, ShorthandsExpand) {
    auto doc = html::parse("<div id=t>x</div>");
    auto styles = resolve(doc, "#t { margin: 16px 2ch; padding: 0 1ch 1lh; border: 1px solid red }");
    const ComputedStyle& s = styles[by_id(doc, "t")];
    EXPECT_EQ(s.margin[kTop].to_rows(), 1);
    EXPECT_EQ(s.margin[kRight].to_columns(80), 2);
    EXPECT_EQ(s.margin[kBottom].to_rows(), 1);
    EXPECT_EQ(s.margin[kLeft].to_columns(80), 2);
    EXPECT_EQ(s.padding[kRight].to_columns(80), 1);
    EXPECT_EQ(s.padding[kBottom].to_rows(), 1);
    EXPECT_EQ(s.padding[kLeft].to_columns(80), 1);
    EXPECT_TRUE(s.has_border(kTop));
    EXPECT_TRUE(s.has_border(kLeft));
    EXPECT_EQ(s.resolved_border_color(kTop), kRed);
}

TEST(CSSCascade, InheritKeyword) {
    auto doc = html::parse("<div style='background-color: red'><p id=t style='background-color: inherit'>x</p></div>");
    auto styles = resolve(doc, "");
    EXPECT_EQ(styles[by_id(doc, "t")].background_color, kRed);
}

TEST(CSSCascade, DisplayNoneFromUserAgent) {
    auto doc = html::parse("<head><title>x</title></head><body><p id=t hidden>y</p></body>");
    auto styles = resolve(doc, "");
    EXPECT_EQ(styles[*doc.find_first("head")].display, Display::None);
    EXPECT_EQ(styles[by_id(doc, "t")].display, Display::None);
    EXPECT_EQ(styles[*doc.find_first("body")].display, Display::Block);
}

TEST(CSSCascade, LinkTextSystemColor) {
    auto doc = html::parse("<a id=t href=x>link</a>");
    SystemColors colors;
    colors.link_text = {1, 2, 3, 255};
    auto styles = resolve(doc, "", colors);
    EXPECT_EQ(styles[by_id(doc, "t")].color, (Color{1, 2, 3, 255}));
    EXPECT_EQ(styles[by_id(doc, "t")].text_decoration, TextDecoration::Underline);
}

TEST(CSSCascade, RootUsesCanvasText) {
    auto doc = html::parse("<p id=t>x</p>");
    SystemColors colors;
    colors.canvas_text = {200, 200, 200, 255};
    auto styles = resolve(doc, "", colors);
    EXPECT_EQ(styles[by_id(doc, "t")].color, (Color{200, 200, 200, 255}));
}

TEST(CSSCascade, TextNodesCarryParentStyle) {
    auto doc = html::parse("<p id=t style='color: red'>x</p>");
    auto styles = resolve(doc, "");
    dom::NodeId p = by_id(doc, "t");
    dom::NodeId text = doc.children(p)[0];
    EXPECT_EQ(styles[text], styles[p]);
}

TEST(CSSCascade, DeterministicAcrossRuns) {
    auto doc = html::parse(
        "<div class=a><p class=b id=c style='margin: 1ch'>x <em>y</em></p><ul><li>z</ul></div>");
    const std::string css = ".a p { color: red } #c { color: blue } .b { padding: 1ch } em { color: inherit }";
    auto first = resolve(doc, css);
    auto second = resolve(doc, css);
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) EXPECT_EQ(first[i], second[i]) << "node " << i;
}

TEST(CSSCascade, CascadeOrderComparator) {
    Declaration d1{"color", "red", false};
    Declaration d2{"color", "blue", false};
    MatchedDeclaration ua{&d1, Origin::UserAgent, {1, 0, 0}, 0, 5, 0};
    MatchedDeclaration author{&d2, Origin::Author, {0, 0, 1}, 1, 0, 0};
    EXPECT_TRUE(cascade_less(ua, author));
    EXPECT_FALSE(cascade_less(author, ua));
}
