#include <toad/net/request.h>
#include <toad/core/config.h>

namespace toad::net {

namespace {

std::string host_header(const url::URL& url) {
    std::string host = url.host;
    if (url.port) host += ":" + std::to_string(*url.port);
    return host;
}

void apply_defaults(HeaderMap& headers) {
    if (!headers.has("User-Agent")) headers.set("User-Agent", core::config::kDefaultUserAgent);
    if (!headers.has("Accept")) headers.set("Accept", core::config::kDefaultAccept);
}

} // namespace

const char* method_to_string(Method method) {
    switch (method) {
        case Method::Get: return "GET";
        case Method::Post: return "POST";
    }
    return "GET";
}

std::vector<uint8_t> Request::serialize() const {
    std::string target = url.request_target();
    if (target.empty()) target = "/";

    HeaderMap all = headers;
    apply_defaults(all);
    if (!all.has("Host")) all.set("Host", host_header(url));
    if (!all.has("Accept-Encoding")) all.set("Accept-Encoding", "gzip, deflate");
    if (!all.has("Connection")) all.set("Connection", "close");
    if (!body.empty() || method == Method::Post) {
        all.set("Content-Length", std::to_string(body.size()));
    }

    std::string head;
    head += method_to_string(method);
    head += ' ';
    head += target;
    head += " HTTP/1.1\r\n";

    // Host goes first, the rest in insertion order.
    head += "Host: " + *all.get("Host") + "\r\n";
    for (const auto& [name, value] : all) {
        if (name == "host") continue;
        head += name + ": " + value + "\r\n";
    }
    head += "\r\n";

    std::vector<uint8_t> out(head.begin(), head.end());
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

Request make_get_request(const url::URL& url) {
    Request request;
    request.method = Method::Get;
    request.url = url;
    apply_defaults(request.headers);
    return request;
}

Request make_post_request(const url::URL& url, const std::string& body,
                          const std::string& content_type) {
    Request request;
    request.method = Method::Post;
    request.url = url;
    apply_defaults(request.headers);
    request.headers.set("Content-Type", content_type);
    request.body.assign(body.begin(), body.end());
    return request;
}

} // namespace toad::net
