#include <gtest/gtest.h>
#include <toad/core/config.h>
#include <toad/net/header_map.h>
#include <toad/net/request.h>
#include <toad/net/response.h>

#include <zlib.h>

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

using namespace toad;
using namespace toad::net;

namespace {

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

std::string text(const std::vector<uint8_t>& v) {
    return std::string(v.begin(), v.end());
}

// Compresses input with zlib; window_bits 31 produces a gzip wrapper.
std::vector<uint8_t> compress(const std::string& input, int window_bits) {
    z_stream strm{};
    EXPECT_EQ(deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits, 8,
                           Z_DEFAULT_STRATEGY),
              Z_OK);
    std::vector<uint8_t> out(deflateBound(&strm, static_cast<uLong>(input.size())) + 32);
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    strm.avail_in = static_cast<uInt>(input.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());
    EXPECT_EQ(deflate(&strm, Z_FINISH), Z_STREAM_END);
    out.resize(strm.total_out);
    deflateEnd(&strm);
    return out;
}

url::URL make_url(const std::string& s) {
    auto parsed = url::parse(s);
    EXPECT_TRUE(parsed.has_value()) << s;
    return parsed.value_or(url::URL{});
}

} // namespace

// =============================================================================
// HeaderMap
// =============================================================================
TEST(HeaderMapTest, CaseInsensitive) {
    HeaderMap headers;
    headers.set("Content-Type", "text/html");
    EXPECT_TRUE(headers.has("content-type"));
    EXPECT_EQ(headers.get("CONTENT-TYPE"), "text/html");
    EXPECT_FALSE(headers.get("Location").has_value());
}

TEST(HeaderMapTest, SetReplacesAppendKeeps) {
    HeaderMap headers;
    headers.append("Set-Cookie", "a=1");
    headers.append("set-cookie", "b=2");
    EXPECT_EQ(headers.get_all("Set-Cookie").size(), 2u);
    EXPECT_EQ(headers.get("Set-Cookie"), "a=1");
    headers.set("Set-Cookie", "c=3");
    ASSERT_EQ(headers.get_all("Set-Cookie").size(), 1u);
    EXPECT_EQ(headers.get("Set-Cookie"), "c=3");
    headers.remove("SET-COOKIE");
    EXPECT_TRUE(headers.empty());
}

TEST(HeaderMapTest, InsertionOrder) {
    HeaderMap headers;
    headers.set("B", "2");
    headers.set("A", "1");
    auto it = headers.begin();
    EXPECT_EQ(it->first, "b");
    ++it;
    EXPECT_EQ(it->first, "a");
    EXPECT_EQ(headers.size(), 2u);
}

// =============================================================================
// Request
// =============================================================================
TEST(RequestTest, GetSerialization) {
    Request request = make_get_request(make_url("http://example.com:8080/a/b?x=1#frag"));
    std::string wire = text(request.serialize());
    EXPECT_EQ(wire.rfind("GET /a/b?x=1 HTTP/1.1\r\nHost: example.com:8080\r\n", 0), 0u);
    EXPECT_NE(wire.find("user-agent: " + std::string(core::config::kDefaultUserAgent) + "\r\n"),
              std::string::npos);
    EXPECT_NE(wire.find("connection: close\r\n"), std::string::npos);
    EXPECT_NE(wire.find("accept-encoding: gzip, deflate\r\n"), std::string::npos);
    EXPECT_EQ(wire.find("frag"), std::string::npos);
    EXPECT_EQ(wire.find("content-length"), std::string::npos);
    EXPECT_EQ(wire.substr(wire.size() - 4), "\r\n\r\n");
}

TEST(RequestTest, DefaultPortOmittedFromHost) {
    std::string wire = text(make_get_request(make_url("https://example.com/")).serialize());
    EXPECT_NE(wire.find("Host: example.com\r\n"), std::string::npos);
}

TEST(RequestTest, PostCarriesBody) {
    Request request = make_post_request(make_url("http://example.com/login"), "a=1&b=2",
                                        "application/x-www-form-urlencoded");
    std::string wire = text(request.serialize());
    EXPECT_EQ(wire.rfind("POST /login HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(wire.find("content-type: application/x-www-form-urlencoded\r\n"), std::string::npos);
    EXPECT_NE(wire.find("content-length: 7\r\n"), std::string::npos);
    EXPECT_EQ(wire.substr(wire.size() - 11), "\r\n\r\na=1&b=2");
}

TEST(RequestTest, CallerHeadersWin) {
    Request request = make_get_request(make_url("http://example.com/"));
    request.headers.set("User-Agent", "custom");
    std::string wire = text(request.serialize());
    EXPECT_NE(wire.find("user-agent: custom\r\n"), std::string::npos);
    EXPECT_EQ(wire.find(core::config::kDefaultUserAgent), std::string::npos);
    EXPECT_STREQ(method_to_string(Method::Post), "POST");
}

// =============================================================================
// Response
// =============================================================================
TEST(ResponseTest, ParsesContentLength) {
    auto resp = Response::parse(bytes(
        "HTTP/1.1 200 OK\r\nContent-Type: text/html; charset=UTF-8\r\nContent-Length: 5\r\n\r\nhello"));
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->status, 200);
    EXPECT_EQ(resp->status_text, "OK");
    EXPECT_EQ(resp->body_as_string(), "hello");
    EXPECT_EQ(resp->media_type(), "text/html");
    EXPECT_TRUE(resp->is_success());
    EXPECT_FALSE(resp->is_redirect());
}

TEST(ResponseTest, BodyUntilEndWithoutLength) {
    auto resp = Response::parse(bytes("HTTP/1.0 404 Not Found\r\n\r\nmissing page"));
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->status, 404);
    EXPECT_EQ(resp->status_text, "Not Found");
    EXPECT_EQ(resp->body_as_string(), "missing page");
    EXPECT_FALSE(resp->is_success());
}

TEST(ResponseTest, ChunkedBody) {
    auto resp = Response::parse(bytes(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "5\r\nhello\r\n7;ext=1\r\n, world\r\n0\r\n\r\n"));
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->body_as_string(), "hello, world");
}

TEST(ResponseTest, TruncatedChunkRejected) {
    auto resp = Response::parse(bytes(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nff\r\nshort"));
    EXPECT_FALSE(resp.has_value());
}

TEST(ResponseTest, GzipBodyInflated) {
    std::string page = "<html><body>compressed page</body></html>";
    auto gz = compress(page, 31);
    std::string head = "HTTP/1.1 200 OK\r\nContent-Encoding: gzip\r\nContent-Length: " +
                       std::to_string(gz.size()) + "\r\n\r\n";
    auto data = bytes(head);
    data.insert(data.end(), gz.begin(), gz.end());
    auto resp = Response::parse(data);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->body_as_string(), page);
}

TEST(ResponseTest, DeflateVariants) {
    std::string page = "deflated text deflated text";
    auto zlib_wrapped = inflate_body(compress(page, 15));
    ASSERT_TRUE(zlib_wrapped.has_value());
    EXPECT_EQ(text(*zlib_wrapped), page);
    auto raw = inflate_body(compress(page, -15));
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(text(*raw), page);
    EXPECT_FALSE(inflate_body(bytes("not compressed at all")).has_value());
    EXPECT_TRUE(inflate_body({})->empty());
}

TEST(ResponseTest, MalformedStatusLine) {
    EXPECT_FALSE(Response::parse(bytes("FTP/1.0 200 OK\r\n\r\n")).has_value());
    EXPECT_FALSE(Response::parse(bytes("HTTP/1.1 abc OK\r\n\r\n")).has_value());
    EXPECT_FALSE(Response::parse(bytes("HTTP/1.1 200 OK\r\nno end")).has_value());
    EXPECT_FALSE(Response::parse(bytes(
        "HTTP/1.1 200 OK\r\nContent-Length: 50\r\n\r\nshort")).has_value());
}

TEST(ResponseTest, RedirectNeedsLocation) {
    auto with = Response::parse(bytes("HTTP/1.1 302 Found\r\nLocation: /next\r\n\r\n"));
    ASSERT_TRUE(with.has_value());
    EXPECT_TRUE(with->is_redirect());
    auto without = Response::parse(bytes("HTTP/1.1 301 Moved\r\n\r\n"));
    ASSERT_TRUE(without.has_value());
    EXPECT_FALSE(without->is_redirect());
    auto not_modified = Response::parse(bytes("HTTP/1.1 304 Not Modified\r\nLocation: /x\r\n\r\n"));
    ASSERT_TRUE(not_modified.has_value());
    EXPECT_FALSE(not_modified->is_redirect());
}

TEST(ResponseTest, CompleteMessageDetection) {
    EXPECT_FALSE(is_complete_message(bytes("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n")));
    EXPECT_FALSE(is_complete_message(bytes("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhel")));
    EXPECT_TRUE(is_complete_message(bytes("HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nhello")));
    EXPECT_TRUE(is_complete_message(bytes("HTTP/1.1 204 No Content\r\n\r\n")));
    EXPECT_FALSE(is_complete_message(bytes(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n")));
    EXPECT_TRUE(is_complete_message(bytes(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n3\r\nabc\r\n0\r\n\r\n")));
    EXPECT_FALSE(is_complete_message(bytes("HTTP/1.1 200 OK\r\n\r\nuntil close")));
}

TEST(ResponseTest, DecodeChunkedDirect) {
    std::string chunked = "4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n";
    auto decoded = decode_chunked(reinterpret_cast<const uint8_t*>(chunked.data()), chunked.size());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(text(*decoded), "Wikipedia");
    std::string bad = "zz\r\nabc\r\n";
    EXPECT_FALSE(decode_chunked(reinterpret_cast<const uint8_t*>(bad.data()), bad.size()).has_value());
}

TEST(ResponseTest, ScannerCompletesAtFinalChunkLine) {
    std::string message =
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "4;ext=1\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n";
    MessageScanner scanner;
    std::vector<uint8_t> data;
    for (size_t i = 0; i < message.size(); ++i) {
        data.push_back(static_cast<uint8_t>(message[i]));
        // The "0\r\n" line ends two bytes before the message does.
        const bool done = scanner.update(data);
        EXPECT_EQ(done, data.size() >= message.size() - 2) << "at byte " << i;
        EXPECT_EQ(done, is_complete_message(data)) << "at byte " << i;
    }
    EXPECT_TRUE(scanner.complete());
}

TEST(ResponseTest, ScannerHandlesManySmallChunks) {
    std::string message = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n";
    const size_t chunks = 20000;
    for (size_t i = 0; i < chunks; ++i) message += "1\r\nx\r\n";
    message += "0\r\n\r\n";

    MessageScanner scanner;
    std::vector<uint8_t> data;
    const size_t slice = 4096;
    for (size_t pos = 0; pos < message.size(); pos += slice) {
        const size_t end = std::min(message.size(), pos + slice);
        data.insert(data.end(), message.begin() + static_cast<std::ptrdiff_t>(pos),
                    message.begin() + static_cast<std::ptrdiff_t>(end));
        EXPECT_EQ(scanner.update(data), end == message.size());
    }

    auto resp = Response::parse(data);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->body.size(), chunks);
}

TEST(ResponseTest, ScannerContentLengthAndBadChunkSize) {
    MessageScanner sized;
    EXPECT_FALSE(sized.update(bytes("HTTP/1.1 200 OK\r\nContent-Le")));
    EXPECT_FALSE(sized.update(bytes("HTTP/1.1 200 OK\r\nContent-Length: 3\r\n\r\nab")));
    EXPECT_TRUE(sized.update(bytes("HTTP/1.1 200 OK\r\nContent-Length: 3\r\n\r\nabc")));

    // A bad size line means the body runs until the connection closes.
    MessageScanner bad;
    std::string head = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n";
    EXPECT_FALSE(bad.update(bytes(head)));
    EXPECT_FALSE(bad.update(bytes(head + "abc\r\n0\r\n\r\n")));
}

TEST(ResponseTest, InflateRespectsOutputLimit) {
    const std::string page(100000, 'z');
    auto gz = compress(page, 31);
    EXPECT_FALSE(inflate_body(gz, 1000).has_value());
    EXPECT_FALSE(inflate_body(gz, page.size() - 1).has_value());
    auto exact = inflate_body(gz, page.size());
    ASSERT_TRUE(exact.has_value());
    EXPECT_EQ(exact->size(), page.size());
}

TEST(ResponseTest, OversizedCompressedBodyRejected) {
    const std::string huge(kMaxInflatedBodyBytes + 1, '\0');
    auto gz = compress(huge, 31);
    ASSERT_LT(gz.size(), huge.size() / 100);

    auto data = bytes("HTTP/1.1 200 OK\r\nContent-Encoding: gzip\r\nContent-Length: " +
                      std::to_string(gz.size()) + "\r\n\r\n");
    data.insert(data.end(), gz.begin(), gz.end());
    EXPECT_TRUE(is_complete_message(data));
    EXPECT_FALSE(Response::parse(data).has_value());
}
