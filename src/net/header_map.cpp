#include <toad/net/header_map.h>

#include <algorithm>
#include <cctype>

namespace toad::net {

std::string HeaderMap::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

void HeaderMap::set(const std::string& name, const std::string& value) {
    remove(name);
    headers_.emplace_back(normalize_name(name), value);
}

void HeaderMap::append(const std::string& name, const std::string& value) {
    headers_.emplace_back(normalize_name(name), value);
}

std::optional<std::string> HeaderMap::get(const std::string& name) const {
    auto key = normalize_name(name);
    for (const auto& [k, v] : headers_) {
        if (k == key) return v;
    }
    return std::nullopt;
}

std::vector<std::string> HeaderMap::get_all(const std::string& name) const {
    auto key = normalize_name(name);
    std::vector<std::string> result;
    for (const auto& [k, v] : headers_) {
        if (k == key) result.push_back(v);
    }
    return result;
}

bool HeaderMap::has(const std::string& name) const {
    return get(name).has_value();
}

void HeaderMap::remove(const std::string& name) {
    auto key = normalize_name(name);
    headers_.erase(std::remove_if(headers_.begin(), headers_.end(),
                                  [&](const auto& header) { return header.first == key; }),
                   headers_.end());
}

} // namespace toad::net
