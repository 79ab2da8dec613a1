#pragma once
#include <toad/net/request.h>
#include <toad/net/response.h>

#include <chrono>
#include <string>
#include <utility>

namespace toad::net {

struct FetchResult {
    bool ok = false;
    std::string error;
    Response response;

    static FetchResult failure(std::string message) {
        FetchResult result;
        result.error = std::move(message);
        return result;
    }
};

// Blocking request/response exchange. Implementations return failures as
// values and never throw.
class Transport {
public:
    virtual ~Transport() = default;
    virtual FetchResult fetch(const Request& request, std::chrono::milliseconds timeout) = 0;
};

} // namespace toad::net
