#pragma once
#include <toad/net/header_map.h>
#include <toad/url/url.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace toad::net {

struct Response {
    uint16_t status = 0;
    std::string status_text;
    HeaderMap headers;
    std::vector<uint8_t> body;
    url::URL url;   // final URL after redirects

    // Parses a complete HTTP/1.1 response. Chunked transfer coding and
    // gzip/deflate content coding are removed from the body.
    static std::optional<Response> parse(const std::vector<uint8_t>& data);

    std::string body_as_string() const;

    // Lowercase media type without parameters ("text/html").
    std::string media_type() const;
    bool is_redirect() const;
    bool is_success() const { return status >= 200 && status < 300; }
};

// True once data holds a whole message: headers plus the body that
// Content-Length or the final chunk delimits. Messages without either end
// at connection close, so they are never complete here.
bool is_complete_message(const std::vector<uint8_t>& data);

// Incremental form of is_complete_message for a receive buffer that only
// grows. Each call resumes where the previous one stopped, so the head is
// parsed once and every chunk-size line is read once.
class MessageScanner {
public:
    bool update(const std::vector<uint8_t>& data);
    bool complete() const { return complete_; }

private:
    enum class Framing { Unknown, UntilClose, Length, Chunked };

    bool scan_chunks(const std::vector<uint8_t>& data);

    Framing framing_ = Framing::Unknown;
    size_t header_search_ = 0;  // first offset not yet checked for "\r\n\r\n"
    size_t body_start_ = 0;
    size_t content_length_ = 0;
    size_t chunk_pos_ = 0;      // start of the next chunk-size line
    size_t line_search_ = 0;    // first offset not yet checked for its CRLF
    bool complete_ = false;
};

std::optional<std::vector<uint8_t>> decode_chunked(const uint8_t* data, size_t len);

// Inflated bodies larger than this are rejected.
inline constexpr size_t kMaxInflatedBodyBytes = 64u * 1024u * 1024u;

// Inflates gzip, zlib-wrapped or raw deflate data. Fails when the output
// would exceed max_output bytes.
std::optional<std::vector<uint8_t>> inflate_body(const std::vector<uint8_t>& compressed,
                                                 size_t max_output = kMaxInflatedBodyBytes);

} // namespace toad::net
