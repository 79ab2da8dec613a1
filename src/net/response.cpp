#include <toad/net/response.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <string_view>
#include <zlib.h>

namespace toad::net {

namespace {

// Position of the first byte after "\r\n\r\n" at or past from, or npos.
size_t find_header_end(const std::vector<uint8_t>& data, size_t from = 0) {
    const char* sep = "\r\n\r\n";
    if (data.size() < 4) return std::string::npos;
    for (size_t i = from; i + 4 <= data.size(); ++i) {
        if (std::memcmp(data.data() + i, sep, 4) == 0) return i + 4;
    }
    return std::string::npos;
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::optional<size_t> parse_content_length(const std::string& raw) {
    std::string value = trim(raw);
    size_t length = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
    if (ec != std::errc{} || ptr != value.data() + value.size()) return std::nullopt;
    return length;
}

// Hex chunk size from a chunk-size line, ignoring extensions after ';'.
std::optional<size_t> parse_chunk_size(const uint8_t* line, size_t len) {
    std::string_view size_str(reinterpret_cast<const char*>(line), len);
    auto semi = size_str.find(';');
    if (semi != std::string_view::npos) size_str = size_str.substr(0, semi);
    while (!size_str.empty() && size_str.back() == ' ') size_str.remove_suffix(1);
    if (size_str.empty()) return std::nullopt;

    size_t chunk_size = 0;
    auto [ptr, ec] = std::from_chars(size_str.data(), size_str.data() + size_str.size(),
                                     chunk_size, 16);
    if (ec != std::errc{}) return std::nullopt;
    return chunk_size;
}

bool has_no_body(uint16_t status) {
    return status < 200 || status == 204 || status == 304;
}

bool is_chunked(const HeaderMap& headers) {
    auto te = headers.get("Transfer-Encoding");
    return te && to_lower(*te).find("chunked") != std::string::npos;
}

bool parse_head(const std::string& head, Response& resp) {
    auto first_crlf = head.find("\r\n");
    std::string status_line = head.substr(0, first_crlf);
    if (status_line.rfind("HTTP/", 0) != 0) return false;

    auto sp1 = status_line.find(' ');
    if (sp1 == std::string::npos) return false;
    auto sp2 = status_line.find(' ', sp1 + 1);
    std::string code = status_line.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos
                                                                           : sp2 - sp1 - 1);
    unsigned status = 0;
    auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), status);
    if (ec != std::errc{} || ptr != code.data() + code.size() || status < 100 || status > 999) {
        return false;
    }
    resp.status = static_cast<uint16_t>(status);
    resp.status_text = sp2 == std::string::npos ? "" : status_line.substr(sp2 + 1);

    size_t pos = first_crlf == std::string::npos ? head.size() : first_crlf + 2;
    while (pos < head.size()) {
        auto line_end = head.find("\r\n", pos);
        if (line_end == std::string::npos) line_end = head.size();
        if (line_end == pos) break;
        std::string line = head.substr(pos, line_end - pos);
        pos = line_end + 2;
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string name = trim(line.substr(0, colon));
        if (name.empty()) continue;
        resp.headers.append(name, trim(line.substr(colon + 1)));
    }
    return true;
}

bool try_inflate(const std::vector<uint8_t>& compressed, int window_bits, size_t max_output,
                 std::vector<uint8_t>& output) {
    z_stream strm{};
    if (inflateInit2(&strm, window_bits) != Z_OK) return false;

    strm.avail_in = static_cast<uInt>(compressed.size());
    strm.next_in = const_cast<Bytef*>(compressed.data());

    output.clear();
    output.reserve(std::min(compressed.size() * 4, max_output));

    uint8_t buffer[32768];
    int ret;
    do {
        strm.avail_out = sizeof(buffer);
        strm.next_out = buffer;
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
            ret == Z_NEED_DICT || ret == Z_BUF_ERROR) {
            inflateEnd(&strm);
            return false;
        }
        size_t have = sizeof(buffer) - strm.avail_out;
        if (have > max_output - output.size()) {
            inflateEnd(&strm);
            return false;
        }
        output.insert(output.end(), buffer, buffer + have);
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);
    return true;
}

} // namespace

std::optional<std::vector<uint8_t>> decode_chunked(const uint8_t* data, size_t len) {
    std::vector<uint8_t> result;
    size_t pos = 0;
    while (pos < len) {
        size_t line_end = pos;
        while (line_end + 1 < len && !(data[line_end] == '\r' && data[line_end + 1] == '\n')) {
            ++line_end;
        }
        if (line_end + 1 >= len) return std::nullopt;

        auto size = parse_chunk_size(data + pos, line_end - pos);
        if (!size) return std::nullopt;
        const size_t chunk_size = *size;
        if (chunk_size == 0) return result;

        size_t chunk_start = line_end + 2;
        if (chunk_size > len - chunk_start) return std::nullopt;
        result.insert(result.end(), data + chunk_start, data + chunk_start + chunk_size);
        pos = chunk_start + chunk_size + 2;
    }
    return std::nullopt;
}

std::optional<std::vector<uint8_t>> inflate_body(const std::vector<uint8_t>& compressed,
                                                 size_t max_output) {
    if (compressed.empty()) return std::vector<uint8_t>{};
    std::vector<uint8_t> result;
    // 15 + 32: gzip or zlib header detection.
    if (try_inflate(compressed, 15 + 32, max_output, result)) return result;
    // Some servers send raw deflate under Content-Encoding: deflate.
    if (try_inflate(compressed, -15, max_output, result)) return result;
    return std::nullopt;
}

std::optional<Response> Response::parse(const std::vector<uint8_t>& data) {
    size_t header_end = find_header_end(data);
    if (header_end == std::string::npos) return std::nullopt;

    Response resp;
    std::string head(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(header_end - 4));
    if (!parse_head(head, resp)) return std::nullopt;

    const uint8_t* body = data.data() + header_end;
    size_t body_len = data.size() - header_end;

    if (is_chunked(resp.headers)) {
        auto decoded = decode_chunked(body, body_len);
        if (!decoded) return std::nullopt;
        resp.body = std::move(*decoded);
    } else if (auto cl = resp.headers.get("Content-Length")) {
        auto length = parse_content_length(*cl);
        if (!length || *length > body_len) return std::nullopt;
        resp.body.assign(body, body + *length);
    } else {
        resp.body.assign(body, body + body_len);
    }

    if (auto encoding = resp.headers.get("Content-Encoding")) {
        std::string coding = to_lower(trim(*encoding));
        if (coding == "gzip" || coding == "x-gzip" || coding == "deflate") {
            auto inflated = inflate_body(resp.body);
            if (!inflated) return std::nullopt;
            resp.body = std::move(*inflated);
        }
    }
    return resp;
}

std::string Response::body_as_string() const {
    return std::string(body.begin(), body.end());
}

std::string Response::media_type() const {
    auto type = headers.get("Content-Type");
    if (!type) return "";
    std::string value = *type;
    auto semi = value.find(';');
    if (semi != std::string::npos) value = value.substr(0, semi);
    return to_lower(trim(value));
}

bool Response::is_redirect() const {
    return (status == 301 || status == 302 || status == 303 || status == 307 || status == 308) &&
           headers.has("Location");
}

bool is_complete_message(const std::vector<uint8_t>& data) {
    MessageScanner scanner;
    return scanner.update(data);
}

bool MessageScanner::update(const std::vector<uint8_t>& data) {
    if (complete_) return true;

    if (framing_ == Framing::Unknown) {
        size_t header_end = find_header_end(data, header_search_);
        if (header_end == std::string::npos) {
            // A separator may straddle the end of what has arrived.
            header_search_ = data.size() < 3 ? 0 : data.size() - 3;
            return false;
        }
        Response resp;
        std::string head(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(header_end - 4));
        body_start_ = header_end;
        if (!parse_head(head, resp)) {
            framing_ = Framing::UntilClose;
            return false;
        }
        if (has_no_body(resp.status)) {
            complete_ = true;
            return true;
        }
        if (is_chunked(resp.headers)) {
            framing_ = Framing::Chunked;
            chunk_pos_ = line_search_ = header_end;
        } else if (auto cl = resp.headers.get("Content-Length")) {
            auto length = parse_content_length(*cl);
            framing_ = length ? Framing::Length : Framing::UntilClose;
            content_length_ = length.value_or(0);
        } else {
            framing_ = Framing::UntilClose;
        }
    }

    switch (framing_) {
        case Framing::Length:
            complete_ = data.size() - body_start_ >= content_length_;
            break;
        case Framing::Chunked:
            complete_ = scan_chunks(data);
            break;
        case Framing::Unknown:
        case Framing::UntilClose:
            break;
    }
    return complete_;
}

// Walks chunk-size lines from chunk_pos_ without copying chunk data. A
// malformed size line leaves the message to end at connection close.
bool MessageScanner::scan_chunks(const std::vector<uint8_t>& data) {
    const size_t len = data.size();
    while (true) {
        size_t line_end = std::max(line_search_, chunk_pos_);
        while (line_end + 1 < len && !(data[line_end] == '\r' && data[line_end + 1] == '\n')) {
            ++line_end;
        }
        if (line_end + 1 >= len) {
            line_search_ = line_end;
            return false;
        }

        auto size = parse_chunk_size(data.data() + chunk_pos_, line_end - chunk_pos_);
        if (!size) {
            framing_ = Framing::UntilClose;
            return false;
        }
        if (*size == 0) return true;

        const size_t chunk_start = line_end + 2;
        if (*size > SIZE_MAX - chunk_start - 2) {
            framing_ = Framing::UntilClose;
            return false;
        }
        chunk_pos_ = line_search_ = chunk_start + *size + 2;
    }
}

} // namespace toad::net
