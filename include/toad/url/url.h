#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace toad::url {

struct URL {
    std::string scheme;
    std::string username;
    std::string password;
    std::string host;
    std::optional<uint16_t> port;
    std::string path;
    std::string query;
    std::string fragment;

    std::string serialize() const;
    // Serialization without the fragment; used for history and fetches.
    std::string serialize_without_fragment() const;
    std::string origin() const;
    bool is_special() const;
    uint16_t effective_port() const;
    // Path plus "?query", as it appears in an HTTP request line.
    std::string request_target() const;
};

// Parses input, resolving it against base when it is relative.
// Returns nullopt for input that cannot form a URL.
std::optional<URL> parse(std::string_view input, const URL* base = nullptr);

bool urls_same_origin(const URL& a, const URL& b);

} // namespace toad::url
