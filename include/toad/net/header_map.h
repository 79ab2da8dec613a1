#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace toad::net {

// Case-insensitive header collection. Names are stored lowercase and keep
// their insertion order, so serialization is deterministic.
class HeaderMap {
public:
    void set(const std::string& name, const std::string& value);
    void append(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;
    std::vector<std::string> get_all(const std::string& name) const;
    bool has(const std::string& name) const;
    void remove(const std::string& name);
    size_t size() const { return headers_.size(); }
    bool empty() const { return headers_.empty(); }

    using iterator = std::vector<std::pair<std::string, std::string>>::const_iterator;
    iterator begin() const { return headers_.begin(); }
    iterator end() const { return headers_.end(); }

private:
    std::vector<std::pair<std::string, std::string>> headers_;
    static std::string normalize_name(const std::string& name);
};

} // namespace toad::net
