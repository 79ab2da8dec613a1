#include <toad/url/percent_encoding.h>

#include <cstring>

namespace toad::url {

namespace {

// RFC 3986 sub-delims plus the path separators that may stay literal.
constexpr const char* kPathSafe = "/:@!$&'()*+,;=";

bool keep_literal(unsigned char c, bool encode_path_chars) {
    if ((c | 0x20) >= 'a' && (c | 0x20) <= 'z') return true;
    if (c >= '0' && c <= '9') return true;
    if (c == '-' || c == '.' || c == '_' || c == '~') return true;
    return !encode_path_chars && c != 0 && std::strchr(kPathSafe, c) != nullptr;
}

int from_hex(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    const char lower = static_cast<char>(c | 0x20);
    if (lower >= 'a' && lower <= 'f') return lower - 'a' + 10;
    return -1;
}

char to_hex(unsigned nibble) {
    return static_cast<char>(nibble < 10 ? '0' + nibble : 'A' + (nibble - 10));
}

} // namespace

std::string percent_encode(std::string_view input, bool encode_path_chars) {
    std::string out;
    out.reserve(input.size() * 3);
    for (char ch : input) {
        const auto c = static_cast<unsigned char>(ch);
        if (keep_literal(c, encode_path_chars)) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(to_hex(c >> 4));
            out.push_back(to_hex(c & 0x0F));
        }
    }
    return out;
}

// Malformed escapes ("%G1", a trailing "%") pass through unchanged.
std::string percent_decode(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (input[i] == '%' && i + 2 < input.size()) {
            const int hi = from_hex(input[i + 1]);
            const int lo = from_hex(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 3;
                continue;
            }
        }
        out.push_back(input[i++]);
    }
    return out;
}

} // namespace toad::url
