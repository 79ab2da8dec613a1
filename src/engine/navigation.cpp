#include <toad/engine/navigation.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <system_error>

namespace toad::engine {
namespace {

std::string trim_copy(const std::string& value) {
    size_t first = 0;
    while (first < value.size() && std::isspace(static_cast<unsigned char>(value[first]))) ++first;
    size_t last = value.size();
    while (last > first && std::isspace(static_cast<unsigned char>(value[last - 1]))) --last;
    return value.substr(first, last - first);
}

bool starts_with_ci(const std::string& value, const char* prefix) {
    size_t i = 0;
    for (; prefix[i] != '\0'; ++i) {
        if (i >= value.size()) return false;
        if (std::tolower(static_cast<unsigned char>(value[i])) != prefix[i]) return false;
    }
    return true;
}

std::filesystem::path normalize_file_path(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path normalized = path;
    if (normalized.is_relative()) {
        auto absolute = std::filesystem::absolute(normalized, ec);
        if (!ec) normalized = absolute;
    }
    return normalized.lexically_normal();
}

// host[:port][/path...] with a dot in the host, or localhost.
bool looks_like_host(const std::string& input) {
    if (input.empty()) return false;
    if (std::any_of(input.begin(), input.end(),
                    [](unsigned char c) { return std::isspace(c) != 0; })) {
        return false;
    }
    size_t host_end = input.find_first_of("/?#");
    std::string authority = input.substr(0, host_end);
    size_t colon = authority.rfind(':');
    std::string host = authority;
    if (colon != std::string::npos) {
        std::string port = authority.substr(colon + 1);
        if (port.empty() || !std::all_of(port.begin(), port.end(),
                                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return false;
        }
        host = authority.substr(0, colon);
    }
    if (host.empty()) return false;
    for (unsigned char c : host) {
        if (!std::isalnum(c) && c != '-' && c != '.' && c != '_') return false;
    }
    if (host == "localhost") return true;
    return host.find('.') != std::string::npos && host.front() != '.' && host.back() != '.';
}

} // namespace

const char* input_type_name(InputType type) {
    switch (type) {
        case InputType::Unknown:   return "unknown";
        case InputType::HttpUrl:   return "http_url";
        case InputType::FileUrl:   return "file_url";
        case InputType::LocalPath: return "local_path";
        case InputType::DataUrl:   return "data_url";
        case InputType::AboutUrl:  return "about_url";
        case InputType::BareHost:  return "bare_host";
    }
    return "unknown";
}

InputType classify_input(const std::string& raw) {
    const std::string input = trim_copy(raw);
    if (input.empty()) return InputType::Unknown;

    if (starts_with_ci(input, "data:")) return InputType::DataUrl;
    if (starts_with_ci(input, "file:")) return InputType::FileUrl;
    if (starts_with_ci(input, "about:")) return InputType::AboutUrl;
    if (starts_with_ci(input, "http://") || starts_with_ci(input, "https://")) {
        return url::parse(input) ? InputType::HttpUrl : InputType::Unknown;
    }

    std::error_code ec;
    if (std::filesystem::exists(input, ec) && !ec) return InputType::LocalPath;

    if (looks_like_host(input)) return InputType::BareHost;
    return InputType::Unknown;
}

bool normalize_input(const std::string& raw_input,
                     NavigationInput& result,
                     std::string& err) {
    result = {};
    result.raw_input = raw_input;
    result.input_type = classify_input(raw_input);
    const std::string input = trim_copy(raw_input);

    std::optional<url::URL> parsed;
    switch (result.input_type) {
        case InputType::HttpUrl:
        case InputType::FileUrl:
        case InputType::DataUrl:
            parsed = url::parse(input);
            break;

        case InputType::AboutUrl:
            parsed = url::parse(input);
            if (parsed && parsed->path != "blank") {
                err = "Unknown about: page: " + input;
                return false;
            }
            break;

        case InputType::LocalPath: {
            std::filesystem::path normalized = normalize_file_path(input);
            parsed = url::parse("file://" + normalized.generic_string());
            break;
        }

        case InputType::BareHost:
            parsed = url::parse("https://" + input);
            break;

        case InputType::Unknown:
            break;
    }

    if (!parsed) {
        err = "Unable to resolve input: " + input;
        return false;
    }
    result.url = std::move(*parsed);
    return true;
}

} // namespace toad::engine
