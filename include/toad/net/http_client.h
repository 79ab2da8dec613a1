#pragma once
#include <toad/net/transport.h>

#include <cstddef>

namespace toad::net {

// HTTP/1.1 over POSIX sockets, with OpenSSL for https. One connection per
// request ("Connection: close"); redirects are returned to the caller.
class HttpClient : public Transport {
public:
    FetchResult fetch(const Request& request, std::chrono::milliseconds timeout) override;

    void set_max_response_bytes(size_t bytes) { max_response_bytes_ = bytes; }
    size_t max_response_bytes() const { return max_response_bytes_; }

private:
    size_t max_response_bytes_ = 32 * 1024 * 1024;
};

} // namespace toad::net
