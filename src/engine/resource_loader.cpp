#include <toad/engine/resource_loader.h>

#include <toad/url/data_url.h>
#include <toad/url/percent_encoding.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <iterator>

namespace toad::engine {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool has_prefix(const std::vector<uint8_t>& body, const char* magic, size_t len) {
    return body.size() >= len && std::memcmp(body.data(), magic, len) == 0;
}

} // namespace

std::string media_type_for_path(const std::string& path) {
    auto slash = path.rfind('/');
    auto dot = path.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return "";
    const std::string ext = to_lower(path.substr(dot + 1));
    if (ext == "html" || ext == "htm" || ext == "xhtml") return "text/html";
    if (ext == "css") return "text/css";
    if (ext == "txt" || ext == "md") return "text/plain";
    if (ext == "png") return "image/png";
    if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if (ext == "gif") return "image/gif";
    if (ext == "bmp") return "image/bmp";
    return "";
}

std::string sniff_media_type(const std::vector<uint8_t>& body) {
    if (has_prefix(body, "\x89PNG\r\n\x1a\n", 8)) return "image/png";
    if (has_prefix(body, "\xff\xd8\xff", 3)) return "image/jpeg";
    if (has_prefix(body, "GIF87a", 6) || has_prefix(body, "GIF89a", 6)) return "image/gif";
    if (has_prefix(body, "BM", 2)) return "image/bmp";
    size_t i = 0;
    if (has_prefix(body, "\xef\xbb\xbf", 3)) i = 3;
    while (i < body.size() && std::isspace(body[i])) ++i;
    if (i < body.size() && body[i] == '<') return "text/html";
    return "text/plain";
}

ResourceLoader::ResourceLoader(net::Transport* transport, core::DiagnosticEmitter* diagnostics,
                               std::chrono::milliseconds timeout)
    : transport_(transport), diagnostics_(diagnostics), timeout_(timeout) {}

void ResourceLoader::emit(core::Severity severity, const std::string& message) {
    if (diagnostics_) diagnostics_->emit(severity, "net", "fetch", message);
}

LoadResult ResourceLoader::load(const url::URL& target) {
    LoadRequest request;
    request.url = target;
    return load(request);
}

LoadResult ResourceLoader::load(const LoadRequest& request) {
    ++fetch_count_;
    const std::string& scheme = request.url.scheme;
    if (scheme == "data") return load_data(request.url);
    if (scheme == "file") return load_file(request.url);
    if (scheme == "http" || scheme == "https") return load_http(request);

    LoadResult result;
    result.error = "Unsupported URL scheme: " + scheme;
    emit(core::Severity::Warning, result.error);
    return result;
}

LoadResult ResourceLoader::load_data(const url::URL& target) {
    LoadResult result;
    auto decoded = url::decode_data_url(target.serialize());
    if (!decoded) {
        result.error = "Malformed data: URL";
        emit(core::Severity::Warning, result.error);
        return result;
    }
    result.ok = true;
    result.resource.url = target;
    result.resource.media_type = decoded->media_type;
    result.resource.body = std::move(decoded->body);
    return result;
}

LoadResult ResourceLoader::load_file(const url::URL& target) {
    LoadResult result;
    const std::string path = url::percent_decode(target.path);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        result.error = "Cannot open file: " + path;
        emit(core::Severity::Warning, result.error);
        return result;
    }
    result.resource.body.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        result.error = "Error reading file: " + path;
        emit(core::Severity::Warning, result.error);
        return result;
    }
    result.ok = true;
    result.resource.url = target;
    result.resource.media_type = media_type_for_path(path);
    if (result.resource.media_type.empty()) {
        result.resource.media_type = sniff_media_type(result.resource.body);
    }
    return result;
}

LoadResult ResourceLoader::load_http(LoadRequest request) {
    LoadResult result;
    if (!transport_) {
        result.error = "No network transport available";
        return result;
    }

    for (int hop = 0; hop <= core::config::kMaxRedirects; ++hop) {
        net::Request wire = request.method == net::Method::Post
                                ? net::make_post_request(request.url, request.body,
                                                         request.content_type)
                                : net::make_get_request(request.url);
        emit(core::Severity::Info,
             std::string(net::method_to_string(request.method)) + " " + request.url.serialize());

        net::FetchResult fetched = transport_->fetch(wire, timeout_);
        if (!fetched.ok) {
            result.error = fetched.error.empty() ? "Fetch failed" : fetched.error;
            emit(core::Severity::Error, request.url.serialize() + ": " + result.error);
            return result;
        }

        net::Response& response = fetched.response;
        if (response.is_redirect()) {
            const std::string location = *response.headers.get("Location");
            auto next = url::parse(location, &request.url);
            if (!next) {
                result.error = "Invalid redirect location: " + location;
                emit(core::Severity::Error, result.error);
                return result;
            }
            // A fragment-less Location keeps the original fragment.
            if (next->fragment.empty()) next->fragment = request.url.fragment;
            emit(core::Severity::Info, "Redirect " + std::to_string(response.status) + " to " +
                                           next->serialize());
            if (response.status == 303 ||
                ((response.status == 301 || response.status == 302) &&
                 request.method == net::Method::Post)) {
                request.method = net::Method::Get;
                request.body.clear();
                request.content_type.clear();
            }
            request.url = std::move(*next);
            continue;
        }

        result.ok = true;
        result.resource.url = request.url;
        result.resource.status = response.status;
        result.resource.media_type = response.media_type();
        result.resource.body = std::move(response.body);
        if (result.resource.media_type.empty()) {
            result.resource.media_type = sniff_media_type(result.resource.body);
        }
        return result;
    }

    result.error = "Too many redirects";
    emit(core::Severity::Error, result.error);
    return result;
}

} // namespace toad::engine
