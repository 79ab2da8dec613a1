#include <toad/url/url.h>
#include <string>

namespace toad::url {

bool URL::is_special() const {
    return scheme == "http" || scheme == "https" || scheme == "file";
}

uint16_t URL::effective_port() const {
    if (port.has_value()) return *port;
    if (scheme == "https") return 443;
    return 80;
}

std::string URL::request_target() const {
    std::string target = path.empty() ? "/" : path;
    if (!query.empty()) {
        target += '?';
        target += query;
    }
    return target;
}

std::string URL::serialize_without_fragment() const {
    std::string result = scheme;
    result += ':';

    if (!host.empty() || is_special()) {
        result += "//";
        if (!username.empty() || !password.empty()) {
            result += username;
            if (!password.empty()) {
                result += ':';
                result += password;
            }
            result += '@';
        }
        result += host;
        if (port.has_value()) {
            result += ':';
            result += std::to_string(*port);
        }
    }

    result += path;
    if (!query.empty()) {
        result += '?';
        result += query;
    }
    return result;
}

std::string URL::serialize() const {
    std::string result = serialize_without_fragment();
    if (!fragment.empty()) {
        result += '#';
        result += fragment;
    }
    return result;
}

std::string URL::origin() const {
    if (scheme != "http" && scheme != "https") return "null";

    std::string result = scheme + "://" + host;
    if (port.has_value()) {
        result += ':';
        result += std::to_string(*port);
    }
    return result;
}

bool urls_same_origin(const URL& a, const URL& b) {
    return a.scheme == b.scheme && a.host == b.host && a.port == b.port;
}

} // namespace toad::url
