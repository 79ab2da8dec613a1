#include <toad/url/data_url.h>
#include <toad/url/percent_encoding.h>

#include <algorithm>
#include <cctype>

namespace toad::url {

namespace {

std::string trim_lower(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    std::string out(s.substr(start, end - start));
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

int base64_digit(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return -1;
}

} // namespace

std::optional<std::vector<uint8_t>> base64_decode(std::string_view input) {
    std::vector<uint8_t> output;
    output.reserve(input.size() * 3 / 4);
    unsigned int acc = 0;
    int bits = -8;
    for (char c : input) {
        if (c == '=') break;
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        int d = base64_digit(c);
        if (d < 0) return std::nullopt;
        acc = ((acc << 6) | static_cast<unsigned>(d)) & 0xFFFFFFu;
        bits += 6;
        if (bits >= 0) {
            output.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
            bits -= 8;
        }
    }
    return output;
}

std::optional<DataURL> decode_data_url(std::string_view input) {
    if (input.size() < 5) return std::nullopt;
    if (trim_lower(input.substr(0, 5)) != "data:") return std::nullopt;
    input.remove_prefix(5);

    auto comma = input.find(',');
    if (comma == std::string_view::npos) return std::nullopt;

    std::string_view meta = input.substr(0, comma);
    std::string_view payload = input.substr(comma + 1);
    auto hash = payload.find('#');
    if (hash != std::string_view::npos) payload = payload.substr(0, hash);

    DataURL result;
    bool is_base64 = false;
    size_t pos = 0;
    bool first = true;
    while (pos <= meta.size()) {
        size_t semi = meta.find(';', pos);
        if (semi == std::string_view::npos) semi = meta.size();
        std::string part = trim_lower(meta.substr(pos, semi - pos));
        if (first) {
            result.media_type = part;
            first = false;
        } else if (part == "base64") {
            is_base64 = true;
        } else if (part.rfind("charset=", 0) == 0) {
            result.charset = part.substr(8);
        }
        pos = semi + 1;
    }
    if (result.media_type.empty()) {
        result.media_type = "text/plain";
        if (result.charset.empty()) result.charset = "us-ascii";
    }

    std::string decoded = percent_decode(payload);
    if (is_base64) {
        auto bytes = base64_decode(decoded);
        if (!bytes) return std::nullopt;
        result.body = std::move(*bytes);
    } else {
        result.body.assign(decoded.begin(), decoded.end());
    }
    return result;
}

} // namespace toad::url
