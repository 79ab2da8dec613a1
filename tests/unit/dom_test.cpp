#include <gtest/gtest.h>
#include <toad/dom/document.h>

#include <string>

using namespace toad::dom;

TEST(DomDocument, RootIsDocumentNode) {
    Document doc;
    EXPECT_EQ(doc.size(), 1u);
    EXPECT_EQ(doc.node(Document::kRoot).type, NodeType::Document);
    EXPECT_FALSE(doc.parent(Document::kRoot).has_value());
}

TEST(DomDocument, CreateElementAppendsChild) {
    Document doc;
    NodeId html = doc.create_element(Document::kRoot, "html");
    NodeId body = doc.create_element(html, "body");
    NodeId text = doc.create_text(body, "hello");

    ASSERT_EQ(doc.children(Document::kRoot).size(), 1u);
    EXPECT_EQ(doc.children(Document::kRoot)[0], html);
    EXPECT_EQ(doc.parent(body), html);
    EXPECT_EQ(doc.parent(text), body);
    EXPECT_TRUE(doc.node(body).is_element("body"));
    EXPECT_TRUE(doc.node(text).is_text());
    EXPECT_EQ(doc.node(text).data, "hello");
}

TEST(DomDocument, ChildrenKeepInsertionOrder) {
    Document doc;
    NodeId ul = doc.create_element(Document::kRoot, "ul");
    NodeId a = doc.create_element(ul, "li");
    NodeId b = doc.create_element(ul, "li");
    NodeId c = doc.create_element(ul, "li");
    ASSERT_EQ(doc.children(ul).size(), 3u);
    EXPECT_EQ(doc.children(ul)[0], a);
    EXPECT_EQ(doc.children(ul)[1], b);
    EXPECT_EQ(doc.children(ul)[2], c);
}

TEST(DomDocument, DuplicateAttributeIgnored) {
    Document doc;
    NodeId a = doc.create_element(Document::kRoot, "a");
    EXPECT_TRUE(doc.set_attribute(a, "href", "/first"));
    EXPECT_FALSE(doc.set_attribute(a, "href", "/second"));
    ASSERT_NE(doc.node(a).attribute("href"), nullptr);
    EXPECT_EQ(*doc.node(a).attribute("href"), "/first");
    EXPECT_EQ(doc.node(a).attributes.size(), 1u);
    EXPECT_TRUE(doc.node(a).has_attribute("href"));
    EXPECT_FALSE(doc.node(a).has_attribute("title"));
}

TEST(DomDocument, FindFirstAndAll) {
    Document doc;
    NodeId body = doc.create_element(Document::kRoot, "body");
    NodeId p1 = doc.create_element(body, "p");
    NodeId div = doc.create_element(body, "div");
    NodeId p2 = doc.create_element(div, "p");

    EXPECT_EQ(doc.find_first("p"), p1);
    auto all = doc.find_all("p");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0], p1);
    EXPECT_EQ(all[1], p2);
    EXPECT_EQ(doc.find_first("p", div), p2);
    EXPECT_FALSE(doc.find_first("table").has_value());
}

TEST(DomDocument, AncestorLookup) {
    Document doc;
    NodeId form = doc.create_element(Document::kRoot, "form");
    NodeId div = doc.create_element(form, "div");
    NodeId input = doc.create_element(div, "input");
    EXPECT_EQ(doc.ancestor(input, "form"), form);
    EXPECT_FALSE(doc.ancestor(input, "table").has_value());
    EXPECT_FALSE(doc.ancestor(form, "form").has_value());
}

TEST(DomDocument, TextContentSkipsComments) {
    Document doc;
    NodeId p = doc.create_element(Document::kRoot, "p");
    doc.create_text(p, "a");
    doc.create_comment(p, "hidden");
    NodeId b = doc.create_element(p, "b");
    doc.create_text(b, "c");
    EXPECT_EQ(doc.text_content(p), "ac");
}

TEST(DomDocument, TitleCollapsesWhitespace) {
    Document doc;
    NodeId head = doc.create_element(Document::kRoot, "head");
    NodeId title = doc.create_element(head, "title");
    doc.create_text(title, "  My \n  Page  ");
    EXPECT_EQ(doc.title(), "My Page");
}

TEST(DomDocument, TitleEmptyWithoutElement) {
    Document doc;
    doc.create_element(Document::kRoot, "body");
    EXPECT_EQ(doc.title(), "");
}

TEST(DomDocument, DepthCountsLongestPath) {
    Document doc;
    NodeId html = doc.create_element(Document::kRoot, "html");
    doc.create_element(html, "head");
    NodeId body = doc.create_element(html, "body");
    NodeId p = doc.create_element(body, "p");
    doc.create_text(p, "x");
    EXPECT_EQ(doc.depth(html), 4);
    EXPECT_EQ(doc.depth(Document::kRoot), 5);
}

TEST(DomDocument, DumpIndentsChildren) {
    Document doc;
    NodeId p = doc.create_element(Document::kRoot, "p");
    doc.set_attribute(p, "class", "x");
    doc.create_text(p, "hi");
    EXPECT_EQ(doc.dump(), "#document\n  <p class=\"x\">\n    \"hi\"\n");
}

TEST(CollapseWhitespace, TrimsAndCollapses) {
    EXPECT_EQ(collapse_whitespace("  a \t\n b  "), "a b");
    EXPECT_EQ(collapse_whitespace("   "), "");
    EXPECT_EQ(collapse_whitespace("single"), "single");
}
