#include <gtest/gtest.h>
#include <toad/core/diagnostics.h>
#include <toad/core/utf8.h>
#include <toad/engine/session.h>

#include "fake_transport.h"

#include <string>

using namespace toad;
using namespace toad::engine;
using toad::test_support::FakeTransport;

namespace {

url::URL make_url(const std::string& s) {
    auto parsed = url::parse(s);
    EXPECT_TRUE(parsed.has_value()) << s;
    return parsed.value_or(url::URL{});
}

std::string long_page() {
    std::string html = "<title>Long</title><p id=top>start</p>";
    for (int i = 0; i < 40; ++i) html += "<p>paragraph " + std::to_string(i) + "</p>";
    html += "<h2 id=target>Target</h2><p>end</p>";
    return html;
}

class SessionTest : public ::testing::Test {
protected:
    SessionTest() : session(&transport, diagnostics, core::Settings{}, 40, 10) {
        transport.serve_html("http://example.com/a",
                             "<title>Page A</title><p>Alpha page</p><a href=/b>to b</a>");
        transport.serve_html("http://example.com/b", "<title>Page B</title><p>Beta page</p>");
        transport.serve_html("http://example.com/c", "<title>Page C</title><p>Gamma page</p>");
        transport.serve_html("http://example.com/long", long_page());
    }

    size_t fetches() const { return transport.requests.size(); }

    FakeTransport transport;
    core::DiagnosticEmitter diagnostics;
    Session session;
};

} // namespace

// =============================================================================
// Navigation
// =============================================================================
TEST_F(SessionTest, OpensAndRendersPage) {
    NavigationResult result = session.open("http://example.com/a");
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_TRUE(session.has_shown_page());
    EXPECT_EQ(session.active_tab().title(), "Page A");
    EXPECT_EQ(session.active_tab().address(), "http://example.com/a");

    paint::CellGrid grid = session.render();
    EXPECT_EQ(grid.columns(), session.page_columns());
    EXPECT_EQ(grid.rows(), 10);
    EXPECT_NE(grid.to_text().find("Alpha page"), std::string::npos);
    EXPECT_TRUE(session.error().empty());
}

TEST_F(SessionTest, RenderingTwiceGivesSameGrid) {
    ASSERT_TRUE(session.open("http://example.com/a").ok);
    EXPECT_EQ(session.render(), session.render());
}

TEST_F(SessionTest, FailedNavigationKeepsPage) {
    ASSERT_TRUE(session.open("http://example.com/a").ok);
    paint::CellGrid before = session.render();

    NavigationResult result = session.open("http://unreachable.example/");
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(session.error().empty());
    EXPECT_EQ(session.status_line(), session.error());
    EXPECT_EQ(session.render(), before);
    EXPECT_EQ(session.active_tab().address(), "http://example.com/a");
    EXPECT_EQ(session.active_tab().history_size(), 1u);
    EXPECT_FALSE(diagnostics.events_by_severity(core::Severity::Error).empty());

    ASSERT_TRUE(session.open("http://example.com/b").ok);
    EXPECT_TRUE(session.error().empty());
}

TEST_F(SessionTest, UnresolvableInputFails) {
    NavigationResult result = session.open("not a place");
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(session.has_shown_page());
    EXPECT_EQ(fetches(), 0u);
}

TEST_F(SessionTest, UnsupportedContentTypeFails) {
    transport.serve("http://example.com/zip",
                    "HTTP/1.1 200 OK\r\nContent-Type: application/zip\r\nContent-Length: 2\r\n\r\nPK");
    NavigationResult result = session.open("http://example.com/zip");
    EXPECT_FALSE(result.ok);
    EXPECT_NE(session.error().find("application/zip"), std::string::npos);
}

TEST_F(SessionTest, PlainTextShownPreformatted) {
    transport.serve("http://example.com/notes.txt",
                    "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 9\r\n\r\na  b\n<c>\n");
    ASSERT_TRUE(session.open("http://example.com/notes.txt").ok);
    std::string text = session.render().to_text();
    EXPECT_NE(text.find("a  b"), std::string::npos);
    EXPECT_NE(text.find("<c>"), std::string::npos);
}

TEST_F(SessionTest, ErrorStatusShownInStatusLine) {
    transport.serve_html("http://example.com/gone", "<p>Gone</p>", 404);
    ASSERT_TRUE(session.open("http://example.com/gone").ok);
    EXPECT_EQ(session.status_line(), "HTTP 404");
    EXPECT_NE(session.render().to_text().find("Gone"), std::string::npos);
}

TEST_F(SessionTest, LifecycleTraceRecorded) {
    ASSERT_TRUE(session.open("http://example.com/a").ok);
    const auto& entries = session.trace().entries;
    ASSERT_FALSE(entries.empty());
    EXPECT_EQ(entries.front().stage, core::LifecycleStage::Idle);
    EXPECT_EQ(entries.back().stage, core::LifecycleStage::Complete);
    bool fetched = false;
    for (const auto& e : entries) fetched = fetched || e.stage == core::LifecycleStage::Fetching;
    EXPECT_TRUE(fetched);
}

TEST_F(SessionTest, MetaRefreshFollowed) {
    transport.serve_html("http://example.com/r",
                         "<meta http-equiv=refresh content='0; url=/b'><p>redirecting</p>");
    ASSERT_TRUE(session.open("http://example.com/r").ok);
    EXPECT_EQ(session.active_tab().address(), "http://example.com/b");
    EXPECT_EQ(session.active_tab().history_size(), 1u);
}

TEST_F(SessionTest, MetaRefreshLoopBounded) {
    transport.serve_html("http://example.com/x", "<meta http-equiv=refresh content='0;url=/y'>");
    transport.serve_html("http://example.com/y", "<meta http-equiv=refresh content='0;url=/x'>");
    ASSERT_TRUE(session.open("http://example.com/x").ok);
    EXPECT_EQ(fetches(), 1u + static_cast<size_t>(core::config::kMaxMetaRefreshHops));
}

// =============================================================================
// History
// =============================================================================
TEST_F(SessionTest, BackAndForwardWithoutRefetch) {
    ASSERT_TRUE(session.open("http://example.com/a").ok);
    ASSERT_TRUE(session.open("http://example.com/b").ok);
    size_t before = fetches();

    EXPECT_TRUE(session.back());
    EXPECT_EQ(session.active_tab().address(), "http://example.com/a");
    EXPECT_NE(session.render().to_text().find("Alpha page"), std::string::npos);
    EXPECT_FALSE(session.back());
    EXPECT_TRUE(session.active_tab().can_go_forward());

    EXPECT_TRUE(session.forward());
    EXPECT_EQ(session.active_tab().address(), "http://example.com/b");
    EXPECT_FALSE(session.forward());
    EXPECT_EQ(fetches(), before);
}

TEST_F(SessionTest, NavigatingAfterBackDropsForwardEntries) {
    ASSERT_TRUE(session.open("http://example.com/a").ok);
    ASSERT_TRUE(session.open("http://example.com/b").ok);
    ASSERT_TRUE(session.back());
    ASSERT_TRUE(session.open("http://example.com/c").ok);
    EXPECT_EQ(session.active_tab().history_size(), 2u);
    EXPECT_FALSE(session.active_tab().can_go_forward());
    ASSERT_TRUE(session.back());
    EXPECT_EQ(session.active_tab().address(), "http://example.com/a");
}

TEST_F(SessionTest, ReloadRefetchesInPlace) {
    ASSERT_TRUE(session.open("http://example.com/a").ok);
    size_t before = fetches();
    ASSERT_TRUE(session.reload().ok);
    EXPECT_EQ(fetches(), before + 1);
    EXPECT_EQ(session.active_tab().history_size(), 1u);
    EXPECT_FALSE(session.active_tab().can_go_back());
}

TEST_F(SessionTest, ReloadWithoutPage) {
    EXPECT_FALSE(session.reload().ok);
}

// =============================================================================
// Scrolling and fragments
// =============================================================================
TEST_F(SessionTest, ScrollClamped) {
    ASSERT_TRUE(session.open("http://example.com/long").ok);
    EXPECT_GT(session.max_scroll_row(), 0);
    session.scroll_by(-5);
    EXPECT_EQ(session.scroll_row(), 0);
    session.page_down();
    EXPECT_EQ(session.scroll_row(), 10);
    session.scroll_by(100000);
    EXPECT_EQ(session.scroll_row(), session.max_scroll_row());
    session.page_up();
    EXPECT_EQ(session.scroll_row(), session.max_scroll_row() - 10);
}

TEST_F(SessionTest, FragmentScrollsToAnchor) {
    ASSERT_TRUE(session.open("http://example.com/long#target").ok);
    EXPECT_GT(session.scroll_row(), 0);
    EXPECT_NE(session.render().to_text().find("Target"), std::string::npos);
}

TEST_F(SessionTest, SameDocumentFragmentDoesNotFetch) {
    ASSERT_TRUE(session.open("http://example.com/long").ok);
    size_t before = fetches();
    ASSERT_TRUE(session.navigate(make_url("http://example.com/long#target")).ok);
    EXPECT_EQ(fetches(), before);
    EXPECT_GT(session.scroll_row(), 0);
    ASSERT_TRUE(session.navigate(make_url("http://example.com/long#top")).ok);
    EXPECT_EQ(session.scroll_row(), 0);
    EXPECT_EQ(session.active_tab().address(), "http://example.com/long#top");
}

TEST_F(SessionTest, UnknownFragmentLeavesScroll) {
    ASSERT_TRUE(session.open("http://example.com/long#nowhere").ok);
    EXPECT_EQ(session.scroll_row(), 0);
}

// =============================================================================
// Focus and activation
// =============================================================================
TEST_F(SessionTest, FocusLinkAndFollow) {
    ASSERT_TRUE(session.open("http://example.com/a").ok);
    EXPECT_FALSE(session.focused().has_value());
    session.focus_next();
    ASSERT_TRUE(session.focused().has_value());
    EXPECT_EQ(session.focused()->kind, layout::FocusTarget::Kind::Link);
    EXPECT_EQ(session.status_line(), "http://example.com/b");

    Activation activation = session.activate();
    EXPECT_EQ(activation.kind, Activation::Kind::Navigated);
    EXPECT_TRUE(activation.navigation.ok);
    EXPECT_EQ(session.active_tab().address(), "http://example.com/b");
    EXPECT_FALSE(session.focused().has_value());
}

TEST_F(SessionTest, FocusedLinkPaintedReversed) {
    ASSERT_TRUE(session.open("http://example.com/a").ok);
    session.focus_next();
    paint::CellGrid grid = session.render();
    bool reversed = false;
    for (int r = 0; r < grid.rows(); ++r) {
        for (int c = 0; c < grid.columns(); ++c) {
            reversed = reversed || grid.at(r, c).attributes.reverse;
        }
    }
    EXPECT_TRUE(reversed);
}

TEST_F(SessionTest, FocusStopsAtEnds) {
    transport.serve_html("http://example.com/links", "<a href=1>one</a> <a href=2>two</a>");
    ASSERT_TRUE(session.open("http://example.com/links").ok);
    session.focus_previous();
    EXPECT_EQ(session.status_line(), "http://example.com/1");
    session.focus_next();
    session.focus_next();
    session.focus_next();
    EXPECT_EQ(session.status_line(), "http://example.com/2");
}

TEST_F(SessionTest, FocusScrollsIntoView) {
    std::string html;
    for (int i = 0; i < 30; ++i) html += "<p>filler</p>";
    html += "<a href=/far>far link</a>";
    transport.serve_html("http://example.com/far", html);
    ASSERT_TRUE(session.open("http://example.com/far").ok);
    session.focus_next();
    ASSERT_TRUE(session.focused().has_value());
    int row = session.focused()->row;
    EXPECT_GE(row, session.scroll_row());
    EXPECT_LT(row, session.scroll_row() + session.rows());
}

TEST_F(SessionTest, SubmitFormWithEditedText) {
    transport.serve_html("http://example.com/form",
                         "<form action=/search><input name=q><input type=submit value=Go></form>");
    transport.serve_html("http://example.com/search?q=hello%20world", "<p>Results</p>");
    ASSERT_TRUE(session.open("http://example.com/form").ok);

    session.focus_next();
    Activation edit = session.activate();
    ASSERT_EQ(edit.kind, Activation::Kind::EditText);
    EXPECT_EQ(edit.text, "");
    EXPECT_EQ(session.status_line(), "text q");
    session.commit_text(edit.control, "hello world");
    EXPECT_NE(session.render().to_text().find("[hello world"), std::string::npos);

    session.focus_next();
    Activation submit = session.activate();
    EXPECT_EQ(submit.kind, Activation::Kind::Navigated);
    ASSERT_TRUE(submit.navigation.ok) << submit.navigation.message;
    EXPECT_EQ(session.active_tab().address(), "http://example.com/search?q=hello%20world");
    EXPECT_EQ(transport.requests.back().method, net::Method::Get);
}

TEST_F(SessionTest, PostFormSendsBody) {
    transport.serve_html("http://example.com/login",
                         "<form method=post action=/session><input type=hidden name=t value=1>"
                         "<button>Sign in</button></form>");
    transport.serve_html("http://example.com/session", "<p>Welcome</p>");
    ASSERT_TRUE(session.open("http://example.com/login").ok);
    session.focus_next();
    Activation submit = session.activate();
    ASSERT_EQ(submit.kind, Activation::Kind::Navigated);
    const net::Request& sent = transport.requests.back();
    EXPECT_EQ(sent.method, net::Method::Post);
    EXPECT_EQ(std::string(sent.body.begin(), sent.body.end()), "t=1");
    EXPECT_EQ(sent.headers.get("Content-Type"), form::kUrlEncodedContentType);
}

TEST_F(SessionTest, CheckboxToggledInPlace) {
    transport.serve_html("http://example.com/prefs",
                         "<form><input type=checkbox name=c> Remember <input type=reset></form>");
    ASSERT_TRUE(session.open("http://example.com/prefs").ok);
    size_t before = fetches();
    EXPECT_NE(session.render().to_text().find("[ ]"), std::string::npos);

    session.focus_next();
    EXPECT_EQ(session.activate().kind, Activation::Kind::Updated);
    EXPECT_NE(session.render().to_text().find("[x]"), std::string::npos);

    session.focus_next();
    EXPECT_EQ(session.activate().kind, Activation::Kind::Updated);
    EXPECT_NE(session.render().to_text().find("[ ]"), std::string::npos);
    EXPECT_EQ(fetches(), before);
}

TEST_F(SessionTest, ActivateWithoutFocusDoesNothing) {
    ASSERT_TRUE(session.open("http://example.com/a").ok);
    EXPECT_EQ(session.activate().kind, Activation::Kind::None);
}

// =============================================================================
// Tabs, settings and viewport
// =============================================================================
TEST_F(SessionTest, TabsKeepIndependentHistory) {
    ASSERT_TRUE(session.open("http://example.com/a").ok);
    session.new_tab();
    EXPECT_EQ(session.tab_count(), 2u);
    EXPECT_EQ(session.active_index(), 1u);
    EXPECT_EQ(session.active_tab().title(), "New Tab");
    EXPECT_EQ(session.render().to_text(), "");

    ASSERT_TRUE(session.open("http://example.com/b").ok);
    session.next_tab();
    EXPECT_EQ(session.active_tab().address(), "http://example.com/a");
    session.next_tab();
    EXPECT_EQ(session.active_tab().address(), "http://example.com/b");

    EXPECT_TRUE(session.close_tab());
    EXPECT_EQ(session.tab_count(), 1u);
    EXPECT_EQ(session.active_tab().address(), "http://example.com/a");
    EXPECT_FALSE(session.close_tab());
}

TEST_F(SessionTest, ThemeToggleRestyles) {
    ASSERT_TRUE(session.open("http://example.com/a").ok);
    paint::CellGrid light = session.render();
    session.toggle_theme();
    EXPECT_EQ(session.settings().theme_index, 1);
    paint::CellGrid dark = session.render();
    EXPECT_NE(light.at(0, 0).background, dark.at(0, 0).background);
    EXPECT_EQ(light.to_text(), dark.to_text());
    session.toggle_theme();
    EXPECT_EQ(session.render(), light);
}

TEST_F(SessionTest, ImagesToggle) {
    transport.serve_html("http://example.com/img", "<img src=/pic.bmp alt=Picture>");
    std::string bmp = std::string("BM:\0\0\0\0\0\0\0\x36\0\0\0", 14) +
                      std::string("\x28\0\0\0\x01\0\0\0\x01\0\0\0\x01\0\x18\0\0\0\0\0\x04\0\0\0"
                                  "\0\0\0\0\0\0\0\0\0\0\0\0\0\0\0\0",
                                  40) +
                      std::string("\0\0\xff\0", 4);
    transport.serve("http://example.com/pic.bmp",
                    "HTTP/1.1 200 OK\r\nContent-Type: image/bmp\r\nContent-Length: " +
                        std::to_string(bmp.size()) + "\r\n\r\n" + bmp);
    ASSERT_TRUE(session.open("http://example.com/img").ok);
    EXPECT_EQ(session.render().to_text().find("[Picture]"), std::string::npos);

    session.toggle_images();
    EXPECT_FALSE(session.settings().images_enabled);
    EXPECT_NE(session.render().to_text().find("[Picture]"), std::string::npos);
}

TEST_F(SessionTest, ResizeRelaysOut) {
    transport.serve_html("http://example.com/wide",
                         "<p>one two three four five six seven eight nine ten</p>");
    ASSERT_TRUE(session.open("http://example.com/wide").ok);
    session.resize(20, 6);
    paint::CellGrid grid = session.render();
    EXPECT_EQ(grid.columns(), 19);
    EXPECT_EQ(grid.rows(), 6);
    for (int r = 0; r < grid.rows(); ++r) {
        EXPECT_LE(core::display_width(grid.row_text(r)), 19);
    }
    EXPECT_NE(grid.to_text().find("one two"), std::string::npos);
}
