#include <toad/url/url.h>
#include <toad/url/percent_encoding.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toad::url {

namespace {

std::optional<uint16_t> default_port_for_scheme(std::string_view scheme) {
    if (scheme == "http") return 80;
    if (scheme == "https") return 443;
    return std::nullopt;
}

bool is_special_scheme(std::string_view scheme) {
    return scheme == "http" || scheme == "https" || scheme == "file";
}

bool is_ascii_alpha(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool is_ascii_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_ascii_hex(char c) {
    return is_ascii_digit(c) || (c >= 'A' && c <= 'F') || (c >= 'a' && c <= 'f');
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Strip leading/trailing C0 controls and spaces, then drop tabs and newlines.
std::string clean_input(std::string_view input) {
    auto is_trim = [](char c) { return static_cast<unsigned char>(c) <= 0x20; };
    size_t start = 0;
    while (start < input.size() && is_trim(input[start])) ++start;
    size_t end = input.size();
    while (end > start && is_trim(input[end - 1])) --end;

    std::string result;
    result.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
        char c = input[i];
        if (c != '\t' && c != '\n' && c != '\r') result += c;
    }
    return result;
}

// Encodes a component, keeping existing %XX escapes and any character in
// keep intact. Spaces and non-ASCII bytes are always escaped.
std::string encode_component(std::string_view input, std::string_view keep) {
    static const char hex[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(input.size());
    for (size_t i = 0; i < input.size(); ++i) {
        auto c = static_cast<unsigned char>(input[i]);
        if (c == '%' && i + 2 < input.size() &&
            is_ascii_hex(input[i + 1]) && is_ascii_hex(input[i + 2])) {
            result.append(input.substr(i, 3));
            i += 2;
        } else if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~' ||
                   keep.find(static_cast<char>(c)) != std::string_view::npos) {
            result += static_cast<char>(c);
        } else {
            result += '%';
            result += hex[(c >> 4) & 0xF];
            result += hex[c & 0xF];
        }
    }
    return result;
}

constexpr std::string_view kPathKeep = "/:@!$&'()*+,;=";
constexpr std::string_view kQueryKeep = "/:@!$&'()*+,;=?";

std::string remove_dot_segments(std::string_view path) {
    if (path.empty()) return std::string{};

    const bool leading_slash = path.front() == '/';
    std::vector<std::string_view> segments;
    size_t pos = leading_slash ? 1 : 0;
    bool trailing_slash = false;

    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string_view::npos) next = path.size();
        std::string_view segment = path.substr(pos, next - pos);
        const bool last = next >= path.size();

        if (segment == "." || segment == "..") {
            if (segment == ".." && !segments.empty()) segments.pop_back();
            if (last) trailing_slash = true;
        } else {
            segments.push_back(segment);
        }

        if (last) break;
        pos = next + 1;
    }

    std::string result = leading_slash ? "/" : "";
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) result += '/';
        result.append(segments[i]);
    }
    if (trailing_slash && (result.empty() || result.back() != '/')) result += '/';
    return result;
}

struct Tail {
    std::string_view path;
    std::string_view query;
    std::string_view fragment;
    bool has_query = false;
};

Tail split_tail(std::string_view rest) {
    Tail tail;
    auto hash = rest.find('#');
    if (hash != std::string_view::npos) {
        tail.fragment = rest.substr(hash + 1);
        rest = rest.substr(0, hash);
    }
    auto question = rest.find('?');
    if (question != std::string_view::npos) {
        tail.query = rest.substr(question + 1);
        tail.has_query = true;
        rest = rest.substr(0, question);
    }
    tail.path = rest;
    return tail;
}

void apply_query_fragment(URL& url, const Tail& tail) {
    if (!tail.query.empty()) url.query = encode_component(tail.query, kQueryKeep);
    if (!tail.fragment.empty()) url.fragment = encode_component(tail.fragment, kQueryKeep);
}

void copy_authority(URL& url, const URL& base) {
    url.username = base.username;
    url.password = base.password;
    url.host = base.host;
    url.port = base.port;
}

std::optional<std::optional<uint16_t>> parse_port(std::string_view text, std::string_view scheme) {
    if (text.empty()) return std::optional<uint16_t>{};

    uint32_t value = 0;
    for (char c : text) {
        if (!is_ascii_digit(c)) return std::nullopt;
        value = value * 10 + static_cast<uint32_t>(c - '0');
        if (value > 65535) return std::nullopt;
    }

    auto port = static_cast<uint16_t>(value);
    auto def = default_port_for_scheme(scheme);
    if (def && *def == port) return std::optional<uint16_t>{};
    return std::optional<uint16_t>{port};
}

std::optional<std::string> parse_host(std::string_view text, bool special) {
    if (text.empty()) return std::string{};

    if (text.front() == '[') {
        if (text.back() != ']') return std::nullopt;
        return std::string(text);
    }

    if (!special) return percent_encode(text, true);

    std::string host = to_lower(percent_decode(text));
    for (unsigned char c : host) {
        if (c <= 0x20 || c == '#' || c == '/' || c == ':' || c == '<' || c == '>' ||
            c == '?' || c == '@' || c == '[' || c == '\\' || c == ']' || c == '^' ||
            c == '|' || c == '%') {
            return std::nullopt;
        }
    }
    return host;
}

bool parse_authority(URL& url, std::string_view authority) {
    auto at = authority.rfind('@');
    std::string_view host_port = authority;
    if (at != std::string_view::npos) {
        std::string_view userinfo = authority.substr(0, at);
        host_port = authority.substr(at + 1);
        auto colon = userinfo.find(':');
        url.username = encode_component(userinfo.substr(0, colon), "!$&'()*+,;=");
        if (colon != std::string_view::npos) {
            url.password = encode_component(userinfo.substr(colon + 1), "!$&'()*+,;=");
        }
    }

    std::string_view host_text = host_port;
    std::string_view port_text;
    if (!host_port.empty() && host_port.front() == '[') {
        auto close = host_port.find(']');
        if (close == std::string_view::npos) return false;
        host_text = host_port.substr(0, close + 1);
        std::string_view after = host_port.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return false;
            port_text = after.substr(1);
        }
    } else {
        auto colon = host_port.rfind(':');
        if (colon != std::string_view::npos) {
            host_text = host_port.substr(0, colon);
            port_text = host_port.substr(colon + 1);
        }
    }

    const bool special = is_special_scheme(url.scheme);
    auto host = parse_host(host_text, special);
    if (!host) return false;
    if (host->empty() && special && url.scheme != "file") return false;
    url.host = std::move(*host);

    auto port = parse_port(port_text, url.scheme);
    if (!port) return false;
    url.port = *port;
    return true;
}

std::string merge_paths(const URL& base, std::string_view relative) {
    if (!base.host.empty() && base.path.empty()) return "/" + std::string(relative);
    auto slash = base.path.rfind('/');
    if (slash == std::string::npos) return std::string(relative);
    return base.path.substr(0, slash + 1) + std::string(relative);
}

std::optional<URL> parse_relative(std::string_view input, const URL& base) {
    URL url;
    url.scheme = base.scheme;

    if (input.front() == '#') {
        copy_authority(url, base);
        url.path = base.path;
        url.query = base.query;
        url.fragment = encode_component(input.substr(1), kQueryKeep);
        return url;
    }

    if (input.size() >= 2 && input[0] == '/' && input[1] == '/') {
        std::string_view rest = input.substr(2);
        size_t end = rest.find_first_of("/?#");
        if (end == std::string_view::npos) end = rest.size();
        if (!parse_authority(url, rest.substr(0, end))) return std::nullopt;
        Tail tail = split_tail(rest.substr(end));
        url.path = remove_dot_segments(encode_component(tail.path, kPathKeep));
        if (url.path.empty() || url.path.front() != '/') url.path = "/" + url.path;
        apply_query_fragment(url, tail);
        return url;
    }

    copy_authority(url, base);
    Tail tail = split_tail(input);

    if (tail.path.empty()) {
        url.path = base.path;
        url.query = tail.has_query ? encode_component(tail.query, kQueryKeep) : base.query;
        if (!tail.fragment.empty()) url.fragment = encode_component(tail.fragment, kQueryKeep);
        return url;
    }

    std::string encoded = encode_component(tail.path, kPathKeep);
    if (encoded.front() == '/') {
        url.path = remove_dot_segments(encoded);
    } else {
        url.path = remove_dot_segments(merge_paths(base, encoded));
    }
    apply_query_fragment(url, tail);
    return url;
}

} // namespace

std::optional<URL> parse(std::string_view raw_input, const URL* base) {
    std::string input = clean_input(raw_input);
    if (input.empty()) {
        if (base) return *base;
        return std::nullopt;
    }

    size_t scheme_end = 0;
    if (is_ascii_alpha(input[0])) {
        scheme_end = 1;
        while (scheme_end < input.size() &&
               (std::isalnum(static_cast<unsigned char>(input[scheme_end])) ||
                input[scheme_end] == '+' || input[scheme_end] == '-' ||
                input[scheme_end] == '.')) {
            ++scheme_end;
        }
        if (scheme_end >= input.size() || input[scheme_end] != ':') scheme_end = 0;
    }

    if (scheme_end == 0) {
        if (!base || (!base->is_special() && base->host.empty())) return std::nullopt;
        return parse_relative(input, *base);
    }

    URL url;
    url.scheme = to_lower(std::string_view(input).substr(0, scheme_end));
    std::string_view rest = std::string_view(input).substr(scheme_end + 1);
    const bool special = is_special_scheme(url.scheme);

    if (rest.size() >= 2 && rest[0] == '/' && rest[1] == '/') {
        rest.remove_prefix(2);
        size_t end = rest.find_first_of("/?#");
        if (end == std::string_view::npos) end = rest.size();
        if (!parse_authority(url, rest.substr(0, end))) return std::nullopt;
        rest.remove_prefix(end);
    } else if (special) {
        // "http:foo" relative to a same-scheme base, or "file:/path".
        if (base && base->scheme == url.scheme && url.scheme != "file") {
            return parse_relative(rest, *base);
        }
        if (url.scheme != "file") return std::nullopt;
    } else {
        // Opaque path: data:, mailto:, about: and friends.
        Tail tail = split_tail(rest);
        url.path = std::string(tail.path);
        url.query = std::string(tail.query);
        url.fragment = std::string(tail.fragment);
        return url;
    }

    Tail tail = split_tail(rest);
    url.path = remove_dot_segments(encode_component(tail.path, kPathKeep));
    if (special && (url.path.empty() || url.path.front() != '/')) url.path = "/" + url.path;
    apply_query_fragment(url, tail);
    return url;
}

} // namespace toad::url
