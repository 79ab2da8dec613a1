#pragma once
#include <toad/net/header_map.h>
#include <toad/url/url.h>

#include <cstdint>
#include <string>
#include <vector>

namespace toad::net {

enum class Method {
    Get,
    Post
};

const char* method_to_string(Method method);

struct Request {
    Method method = Method::Get;
    url::URL url;
    HeaderMap headers;
    std::vector<uint8_t> body;

    // HTTP/1.1 request bytes. Host, User-Agent, Accept, Accept-Encoding and
    // Connection are filled in unless already set; bodies get a
    // Content-Length.
    std::vector<uint8_t> serialize() const;
};

// A GET for url with the default User-Agent and Accept headers.
Request make_get_request(const url::URL& url);

Request make_post_request(const url::URL& url, const std::string& body,
                          const std::string& content_type);

} // namespace toad::net
