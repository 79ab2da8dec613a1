#include <toad/net/http_client.h>

#include <fcntl.h>
#include <netdb.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

namespace toad::net {

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kReadBufferSize = 16384;

timeval to_timeval(std::chrono::milliseconds ms) {
    if (ms.count() <= 0) ms = std::chrono::milliseconds(1);
    timeval tv;
    tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
    return tv;
}

bool set_nonblocking(int fd, bool nonblocking, std::string& err) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        err = "fcntl(F_GETFL) failed: " + std::string(std::strerror(errno));
        return false;
    }
    const int target = nonblocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (fcntl(fd, F_SETFL, target) < 0) {
        err = "fcntl(F_SETFL) failed: " + std::string(std::strerror(errno));
        return false;
    }
    return true;
}

bool set_socket_timeouts(int fd, std::chrono::milliseconds timeout, std::string& err) {
    timeval tv = to_timeval(timeout);
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
        err = "setsockopt(SO_RCVTIMEO) failed: " + std::string(std::strerror(errno));
        return false;
    }
    if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        err = "setsockopt(SO_SNDTIMEO) failed: " + std::string(std::strerror(errno));
        return false;
    }
    return true;
}

int connect_tcp(const std::string& host, uint16_t port, std::chrono::milliseconds timeout,
                std::string& err) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    // Bracketed IPv6 literals come through without brackets.
    std::string lookup = host;
    if (lookup.size() >= 2 && lookup.front() == '[' && lookup.back() == ']') {
        lookup = lookup.substr(1, lookup.size() - 2);
    }

    addrinfo* results = nullptr;
    const std::string port_str = std::to_string(port);
    const int gai_rc = getaddrinfo(lookup.c_str(), port_str.c_str(), &hints, &results);
    if (gai_rc != 0) {
        err = "DNS resolution failed for " + host + ": " + gai_strerror(gai_rc);
        return -1;
    }

    int connected_fd = -1;
    std::string last_error;

    for (addrinfo* addr = results; addr != nullptr; addr = addr->ai_next) {
        int fd = socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
        if (fd < 0) {
            last_error = "socket() failed: " + std::string(std::strerror(errno));
            continue;
        }

        std::string step_error;
        if (!set_nonblocking(fd, true, step_error)) {
            last_error = step_error;
            close(fd);
            continue;
        }

        int rc = connect(fd, addr->ai_addr, addr->ai_addrlen);
        if (rc < 0 && errno != EINPROGRESS) {
            last_error = "connect() failed: " + std::string(std::strerror(errno));
            close(fd);
            continue;
        }

        if (rc < 0) {
            fd_set write_set;
            FD_ZERO(&write_set);
            FD_SET(fd, &write_set);
            timeval tv = to_timeval(timeout);

            rc = select(fd + 1, nullptr, &write_set, nullptr, &tv);
            if (rc == 0) {
                last_error = "connect() timed out";
                close(fd);
                continue;
            }
            if (rc < 0) {
                last_error = "select() failed while connecting: " + std::string(std::strerror(errno));
                close(fd);
                continue;
            }

            int socket_error = 0;
            socklen_t len = sizeof(socket_error);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &socket_error, &len) < 0 || socket_error != 0) {
                last_error = "connect() failed: " +
                             std::string(std::strerror(socket_error != 0 ? socket_error : errno));
                close(fd);
                continue;
            }
        }

        if (!set_nonblocking(fd, false, step_error) ||
            !set_socket_timeouts(fd, timeout, step_error)) {
            last_error = step_error;
            close(fd);
            continue;
        }

        connected_fd = fd;
        break;
    }

    freeaddrinfo(results);
    if (connected_fd < 0) {
        err = last_error.empty() ? "Unable to connect to " + host : last_error;
    }
    return connected_fd;
}

void init_openssl_once() {
    static std::once_flag once;
    std::call_once(once, []() {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    });
}

std::string last_ssl_error(const char* what) {
    unsigned long code = ERR_get_error();
    if (code == 0) return what;
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return std::string(what) + ": " + buffer;
}

class Connection {
public:
    Connection() = default;
    ~Connection() { close_connection(); }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    bool open(const url::URL& target, std::chrono::milliseconds timeout, std::string& err) {
        fd_ = connect_tcp(target.host, target.effective_port(), timeout, err);
        if (fd_ < 0) return false;
        if (target.scheme != "https") return true;

        init_openssl_once();
        ssl_ctx_ = SSL_CTX_new(TLS_client_method());
        if (!ssl_ctx_) {
            err = last_ssl_error("SSL_CTX_new() failed");
            return false;
        }
        SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_min_proto_version(ssl_ctx_, TLS1_2_VERSION);
        if (SSL_CTX_set_default_verify_paths(ssl_ctx_) != 1) {
            err = last_ssl_error("SSL_CTX_set_default_verify_paths() failed");
            return false;
        }

        ssl_ = SSL_new(ssl_ctx_);
        if (!ssl_) {
            err = last_ssl_error("SSL_new() failed");
            return false;
        }
        SSL_set_tlsext_host_name(ssl_, target.host.c_str());
        // Hostname check is done by the verifier during the handshake.
        SSL_set1_host(ssl_, target.host.c_str());
        SSL_set_fd(ssl_, fd_);

        while (true) {
            const int rc = SSL_connect(ssl_);
            if (rc == 1) break;
            const int ssl_error = SSL_get_error(ssl_, rc);
            if (ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) continue;
            long verify = SSL_get_verify_result(ssl_);
            if (verify != X509_V_OK) {
                err = "TLS certificate verification failed: " +
                      std::string(X509_verify_cert_error_string(verify));
            } else {
                err = last_ssl_error("TLS handshake failed");
            }
            return false;
        }

        X509* peer_cert = SSL_get1_peer_certificate(ssl_);
        if (!peer_cert) {
            err = "TLS certificate verification failed: missing peer certificate";
            return false;
        }
        const int hostname_ok =
            X509_check_host(peer_cert, target.host.c_str(), target.host.size(), 0, nullptr);
        X509_free(peer_cert);
        if (hostname_ok != 1) {
            err = "TLS certificate verification failed: hostname mismatch for " + target.host;
            return false;
        }
        use_ssl_ = true;
        return true;
    }

    bool write_all(const std::vector<uint8_t>& data, std::string& err) {
        size_t written = 0;
        while (written < data.size()) {
            if (use_ssl_) {
                const int chunk = static_cast<int>(std::min<size_t>(data.size() - written, 1 << 20));
                const int rc = SSL_write(ssl_, data.data() + written, chunk);
                if (rc > 0) {
                    written += static_cast<size_t>(rc);
                    continue;
                }
                const int ssl_error = SSL_get_error(ssl_, rc);
                if (ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) continue;
                err = last_ssl_error("SSL_write() failed");
                return false;
            }

            const ssize_t rc = send(fd_, data.data() + written, data.size() - written, MSG_NOSIGNAL);
            if (rc > 0) {
                written += static_cast<size_t>(rc);
                continue;
            }
            if (rc < 0 && errno == EINTR) continue;
            if (rc < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                err = "Write timed out";
                return false;
            }
            err = rc == 0 ? "Connection closed while writing request"
                          : "send() failed: " + std::string(std::strerror(errno));
            return false;
        }
        return true;
    }

    // Returns bytes read, 0 at end of stream, -1 on error.
    ssize_t read_some(uint8_t* buffer, size_t size, std::string& err) {
        while (true) {
            if (use_ssl_) {
                const int rc = SSL_read(ssl_, buffer, static_cast<int>(size));
                if (rc > 0) return rc;
                const int ssl_error = SSL_get_error(ssl_, rc);
                if (ssl_error == SSL_ERROR_ZERO_RETURN) return 0;
                if (ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK) {
                        err = "Read timed out";
                        return -1;
                    }
                    continue;
                }
                // Servers that close without close_notify.
                if (ssl_error == SSL_ERROR_SYSCALL && rc == 0) return 0;
                err = last_ssl_error("SSL_read() failed");
                return -1;
            }

            const ssize_t rc = recv(fd_, buffer, size, 0);
            if (rc >= 0) return rc;
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                err = "Read timed out";
                return -1;
            }
            err = "recv() failed: " + std::string(std::strerror(errno));
            return -1;
        }
    }

private:
    void close_connection() {
        if (ssl_) {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
            ssl_ = nullptr;
        }
        if (ssl_ctx_) {
            SSL_CTX_free(ssl_ctx_);
            ssl_ctx_ = nullptr;
        }
        if (fd_ >= 0) {
            close(fd_);
            fd_ = -1;
        }
        use_ssl_ = false;
    }

    int fd_ = -1;
    bool use_ssl_ = false;
    SSL_CTX* ssl_ctx_ = nullptr;
    SSL* ssl_ = nullptr;
};

} // namespace

FetchResult HttpClient::fetch(const Request& request, std::chrono::milliseconds timeout) {
    const url::URL& target = request.url;
    if (target.scheme != "http" && target.scheme != "https") {
        return FetchResult::failure("Unsupported scheme: " + target.scheme);
    }
    if (target.host.empty()) {
        return FetchResult::failure("Missing host in " + target.serialize());
    }

    const auto deadline = Clock::now() + timeout;
    std::string err;
    Connection connection;
    if (!connection.open(target, timeout, err)) return FetchResult::failure(err);
    if (!connection.write_all(request.serialize(), err)) return FetchResult::failure(err);

    std::vector<uint8_t> data;
    MessageScanner scanner;
    uint8_t buffer[kReadBufferSize];
    while (true) {
        const ssize_t n = connection.read_some(buffer, sizeof(buffer), err);
        if (n < 0) return FetchResult::failure(err);
        if (n == 0) break;
        data.insert(data.end(), buffer, buffer + n);
        if (data.size() > max_response_bytes_) {
            return FetchResult::failure("Response exceeds " + std::to_string(max_response_bytes_) +
                                        " bytes");
        }
        if (scanner.update(data)) break;
        if (Clock::now() > deadline) return FetchResult::failure("Request timed out");
    }

    if (data.empty()) return FetchResult::failure("Empty response from " + target.host);
    auto parsed = Response::parse(data);
    if (!parsed) return FetchResult::failure("Malformed HTTP response from " + target.host);

    FetchResult result;
    result.ok = true;
    result.response = std::move(*parsed);
    result.response.url = target;
    return result;
}

} // namespace toad::net
