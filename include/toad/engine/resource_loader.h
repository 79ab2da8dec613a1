#pragma once
#include <toad/core/config.h>
#include <toad/core/diagnostics.h>
#include <toad/net/request.h>
#include <toad/net/transport.h>
#include <toad/url/url.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace toad::engine {

struct Resource {
    url::URL url;              // final URL, after redirects
    std::string media_type;    // lowercase, no parameters
    std::vector<uint8_t> body;
    int status = 200;

    std::string text() const { return std::string(body.begin(), body.end()); }
};

struct LoadResult {
    bool ok = false;
    std::string error;
    Resource resource;
};

struct LoadRequest {
    net::Method method = net::Method::Get;
    url::URL url;
    std::string body;
    std::string content_type;
};

// Fetches documents and subresources: data: and file: URLs locally,
// http(s) through the transport with redirects followed.
class ResourceLoader {
public:
    ResourceLoader(net::Transport* transport, core::DiagnosticEmitter* diagnostics,
                   std::chrono::milliseconds timeout = core::config::kDefaultFetchTimeout);

    LoadResult load(const url::URL& target);
    LoadResult load(const LoadRequest& request);

    size_t fetch_count() const { return fetch_count_; }

private:
    LoadResult load_http(LoadRequest request);
    LoadResult load_file(const url::URL& target);
    LoadResult load_data(const url::URL& target);
    void emit(core::Severity severity, const std::string& message);

    net::Transport* transport_;
    core::DiagnosticEmitter* diagnostics_;
    std::chrono::milliseconds timeout_;
    size_t fetch_count_ = 0;
};

// Media type from a file extension, or empty when unknown.
std::string media_type_for_path(const std::string& path);

// Guesses a media type from the first bytes: image signatures and markup.
std::string sniff_media_type(const std::vector<uint8_t>& body);

} // namespace toad::engine
