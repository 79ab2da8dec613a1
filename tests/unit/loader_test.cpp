#include <gtest/gtest.h>
#include <toad/core/diagnostics.h>
#include <toad/engine/navigation.h>
#include <toad/engine/resource_loader.h>

#include "fake_transport.h"

#include <filesystem>
#include <fstream>
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

std::filesystem::path write_temp_file(const std::string& name, const std::string& contents) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::binary);
    out << contents;
    return path;
}

} // namespace

// =============================================================================
// Address input
// =============================================================================
TEST(NavigationInputTest, BareHostBecomesHttps) {
    NavigationInput input;
    std::string err;
    ASSERT_TRUE(normalize_input("example.com", input, err)) << err;
    EXPECT_EQ(input.input_type, InputType::BareHost);
    EXPECT_EQ(input.url.serialize(), "https://example.com/");
}

TEST(NavigationInputTest, LocalhostWithPort) {
    NavigationInput input;
    std::string err;
    ASSERT_TRUE(normalize_input("localhost:8080/docs", input, err)) << err;
    EXPECT_EQ(input.url.serialize(), "https://localhost:8080/docs");
}

TEST(NavigationInputTest, HttpUrlNormalized) {
    NavigationInput input;
    std::string err;
    ASSERT_TRUE(normalize_input("  HTTP://Example.COM/a/../b  ", input, err)) << err;
    EXPECT_EQ(input.input_type, InputType::HttpUrl);
    EXPECT_EQ(input.url.serialize(), "http://example.com/b");
    EXPECT_STREQ(input_type_name(input.input_type), "http_url");
}

TEST(NavigationInputTest, AboutBlankOnly) {
    NavigationInput input;
    std::string err;
    EXPECT_TRUE(normalize_input("about:blank", input, err));
    EXPECT_EQ(input.input_type, InputType::AboutUrl);
    EXPECT_FALSE(normalize_input("about:config", input, err));
    EXPECT_NE(err.find("about:config"), std::string::npos);
}

TEST(NavigationInputTest, DataUrl) {
    NavigationInput input;
    std::string err;
    ASSERT_TRUE(normalize_input("data:text/html,<p>hi</p>", input, err)) << err;
    EXPECT_EQ(input.input_type, InputType::DataUrl);
    EXPECT_EQ(input.url.scheme, "data");
}

TEST(NavigationInputTest, ExistingPathBecomesFileUrl) {
    auto path = write_temp_file("toad_navigation_input.html", "<p>x</p>");
    NavigationInput input;
    std::string err;
    ASSERT_TRUE(normalize_input(path.string(), input, err)) << err;
    EXPECT_EQ(input.input_type, InputType::LocalPath);
    EXPECT_EQ(input.url.scheme, "file");
    EXPECT_NE(input.url.path.find("toad_navigation_input.html"), std::string::npos);
    std::filesystem::remove(path);
}

TEST(NavigationInputTest, UnresolvableInput) {
    NavigationInput input;
    std::string err;
    EXPECT_FALSE(normalize_input("just some words", input, err));
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(classify_input(""), InputType::Unknown);
    EXPECT_EQ(classify_input("nodots"), InputType::Unknown);
}

// =============================================================================
// Media types
// =============================================================================
TEST(MediaTypeTest, FromPath) {
    EXPECT_EQ(media_type_for_path("/a/index.HTML"), "text/html");
    EXPECT_EQ(media_type_for_path("/a/style.css"), "text/css");
    EXPECT_EQ(media_type_for_path("/a/pic.jpeg"), "image/jpeg");
    EXPECT_EQ(media_type_for_path("/a.dir/file"), "");
    EXPECT_EQ(media_type_for_path("/a/archive.tar"), "");
}

TEST(MediaTypeTest, Sniffing) {
    auto b = [](const std::string& s) { return std::vector<uint8_t>(s.begin(), s.end()); };
    EXPECT_EQ(sniff_media_type(b("\x89PNG\r\n\x1a\nrest")), "image/png");
    EXPECT_EQ(sniff_media_type(b("GIF89a....")), "image/gif");
    EXPECT_EQ(sniff_media_type(b("\xff\xd8\xff\xe0")), "image/jpeg");
    EXPECT_EQ(sniff_media_type(b("\xef\xbb\xbf  \n<!doctype html>")), "text/html");
    EXPECT_EQ(sniff_media_type(b("plain words")), "text/plain");
    EXPECT_EQ(sniff_media_type({}), "text/plain");
}

// =============================================================================
// Resource loading
// =============================================================================
TEST(ResourceLoaderTest, DataUrlLoadsLocally) {
    FakeTransport transport;
    core::DiagnosticEmitter diagnostics;
    ResourceLoader loader(&transport, &diagnostics);
    LoadResult result = loader.load(make_url("data:text/html,%3Cp%3Ehi"));
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.resource.media_type, "text/html");
    EXPECT_EQ(result.resource.text(), "<p>hi");
    EXPECT_TRUE(transport.requests.empty());
}

TEST(ResourceLoaderTest, FileUrlUsesExtension) {
    auto path = write_temp_file("toad_loader_test.html", "<h1>Local</h1>");
    ResourceLoader loader(nullptr, nullptr);
    LoadResult result = loader.load(make_url("file://" + path.generic_string()));
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.resource.media_type, "text/html");
    EXPECT_EQ(result.resource.text(), "<h1>Local</h1>");
    std::filesystem::remove(path);
}

TEST(ResourceLoaderTest, MissingFileFails) {
    core::DiagnosticEmitter diagnostics;
    ResourceLoader loader(nullptr, &diagnostics);
    LoadResult result = loader.load(make_url("file:///definitely/not/here.html"));
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("Cannot open file"), std::string::npos);
    EXPECT_FALSE(diagnostics.events_by_severity(core::Severity::Warning).empty());
}

TEST(ResourceLoaderTest, HttpThroughTransport) {
    FakeTransport transport;
    transport.serve("http://example.com/page",
                    "HTTP/1.1 200 OK\r\nContent-Type: Text/HTML; charset=utf-8\r\n"
                    "Content-Length: 4\r\n\r\n<p>x");
    core::DiagnosticEmitter diagnostics;
    ResourceLoader loader(&transport, &diagnostics);
    LoadResult result = loader.load(make_url("http://example.com/page"));
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.resource.status, 200);
    EXPECT_EQ(result.resource.media_type, "text/html");
    ASSERT_EQ(transport.requests.size(), 1u);
    EXPECT_EQ(transport.requests[0].method, net::Method::Get);
    EXPECT_FALSE(diagnostics.events_by_module("net").empty());
}

TEST(ResourceLoaderTest, ErrorStatusStillLoads) {
    FakeTransport transport;
    transport.serve_html("http://example.com/missing", "<h1>Not here</h1>", 404);
    ResourceLoader loader(&transport, nullptr);
    LoadResult result = loader.load(make_url("http://example.com/missing"));
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.resource.status, 404);
}

TEST(ResourceLoaderTest, MissingContentTypeSniffed) {
    FakeTransport transport;
    transport.serve("http://example.com/x", "HTTP/1.1 200 OK\r\nContent-Length: 6\r\n\r\n  <p>x");
    ResourceLoader loader(&transport, nullptr);
    LoadResult result = loader.load(make_url("http://example.com/x"));
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.resource.media_type, "text/html");
}

TEST(ResourceLoaderTest, FollowsRedirects) {
    FakeTransport transport;
    transport.redirect("http://example.com/old", "/middle", 301);
    transport.redirect("http://example.com/middle", "https://secure.example.com/new");
    transport.serve_html("https://secure.example.com/new", "<p>new</p>");
    ResourceLoader loader(&transport, nullptr);
    LoadResult result = loader.load(make_url("http://example.com/old#section"));
    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.resource.url.serialize(), "https://secure.example.com/new#section");
    EXPECT_EQ(transport.requests.size(), 3u);
}

TEST(ResourceLoaderTest, SeeOtherTurnsPostIntoGet) {
    FakeTransport transport;
    transport.redirect("http://example.com/login", "/home", 303);
    transport.serve_html("http://example.com/home", "<p>home</p>");
    ResourceLoader loader(&transport, nullptr);
    LoadRequest request;
    request.method = net::Method::Post;
    request.url = make_url("http://example.com/login");
    request.body = "user=me";
    request.content_type = "application/x-www-form-urlencoded";
    LoadResult result = loader.load(request);
    ASSERT_TRUE(result.ok) << result.error;
    ASSERT_EQ(transport.requests.size(), 2u);
    EXPECT_EQ(transport.requests[0].method, net::Method::Post);
    EXPECT_EQ(std::string(transport.requests[0].body.begin(), transport.requests[0].body.end()),
              "user=me");
    EXPECT_EQ(transport.requests[1].method, net::Method::Get);
    EXPECT_TRUE(transport.requests[1].body.empty());
}

TEST(ResourceLoaderTest, TemporaryRedirectKeepsPost) {
    FakeTransport transport;
    transport.redirect("http://example.com/a", "/b", 307);
    transport.serve_html("http://example.com/b", "ok");
    ResourceLoader loader(&transport, nullptr);
    LoadRequest request;
    request.method = net::Method::Post;
    request.url = make_url("http://example.com/a");
    request.body = "k=v";
    ASSERT_TRUE(loader.load(request).ok);
    ASSERT_EQ(transport.requests.size(), 2u);
    EXPECT_EQ(transport.requests[1].method, net::Method::Post);
}

TEST(ResourceLoaderTest, RedirectLoopStops) {
    FakeTransport transport;
    transport.redirect("http://example.com/a", "/b");
    transport.redirect("http://example.com/b", "/a");
    ResourceLoader loader(&transport, nullptr);
    LoadResult result = loader.load(make_url("http://example.com/a"));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "Too many redirects");
    EXPECT_EQ(transport.requests.size(), static_cast<size_t>(core::config::kMaxRedirects + 1));
}

TEST(ResourceLoaderTest, TransportFailureReported) {
    FakeTransport transport;
    core::DiagnosticEmitter diagnostics;
    ResourceLoader loader(&transport, &diagnostics);
    LoadResult result = loader.load(make_url("http://unreachable.example/"));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "Connection refused");
    EXPECT_FALSE(diagnostics.events_by_severity(core::Severity::Error).empty());
}

TEST(ResourceLoaderTest, UnsupportedSchemeAndNoTransport) {
    ResourceLoader loader(nullptr, nullptr);
    LoadResult http = loader.load(make_url("http://example.com/"));
    EXPECT_FALSE(http.ok);
    EXPECT_FALSE(http.error.empty());
    LoadResult ftp = loader.load(make_url("ftp://example.com/file"));
    EXPECT_FALSE(ftp.ok);
    EXPECT_NE(ftp.error.find("ftp"), std::string::npos);
    EXPECT_EQ(loader.fetch_count(), 2u);
}
