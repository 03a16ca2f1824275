#include <minhttp/net/socket.h>
#include <minhttp/net/url.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <limits>

#ifdef MINHTTP_USE_OPENSSL
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>
#include <mutex>
#endif

namespace minhttp::net {

namespace {

bool set_nonblocking(int fd, bool nonblocking, std::string& err) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        err = "fcntl(F_GETFL) failed: " + std::string(std::strerror(errno));
        return false;
    }

    const int target_flags = nonblocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (::fcntl(fd, F_SETFL, target_flags) < 0) {
        err = "fcntl(F_SETFL) failed: " + std::string(std::strerror(errno));
        return false;
    }

    return true;
}

timeval to_timeval(uint64_t seconds) {
    timeval tv{};
    const auto max_secs = static_cast<uint64_t>(std::numeric_limits<decltype(tv.tv_sec)>::max());
    tv.tv_sec = static_cast<decltype(tv.tv_sec)>(std::min(seconds, max_secs));
    tv.tv_usec = 0;
    return tv;
}

bool set_socket_timeouts(int fd, uint64_t timeout_seconds, std::string& err) {
    timeval timeout = to_timeval(timeout_seconds);

    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0) {
        err = "setsockopt(SO_RCVTIMEO) failed: " + std::string(std::strerror(errno));
        return false;
    }
    if (::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout)) < 0) {
        err = "setsockopt(SO_SNDTIMEO) failed: " + std::string(std::strerror(errno));
        return false;
    }

    return true;
}

// Waits for a non-blocking connect() to finish.
bool finish_connect(int fd, std::optional<uint64_t> timeout_seconds, std::string& err) {
    fd_set write_set;
    FD_ZERO(&write_set);
    FD_SET(fd, &write_set);

    timeval timeout{};
    timeval* timeout_ptr = nullptr;
    if (timeout_seconds.has_value()) {
        timeout = to_timeval(*timeout_seconds);
        timeout_ptr = &timeout;
    }

    int rc = 0;
    do {
        rc = ::select(fd + 1, nullptr, &write_set, nullptr, timeout_ptr);
    } while (rc < 0 && errno == EINTR);

    if (rc == 0) {
        err = "connect() timed out";
        return false;
    }
    if (rc < 0) {
        err = "select() failed while connecting: " + std::string(std::strerror(errno));
        return false;
    }

    int socket_error = 0;
    socklen_t socket_error_len = sizeof(socket_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &socket_error, &socket_error_len) < 0) {
        err = "getsockopt(SO_ERROR) failed: " + std::string(std::strerror(errno));
        return false;
    }
    if (socket_error != 0) {
        err = "connect() failed: " + std::string(std::strerror(socket_error));
        return false;
    }
    return true;
}

#ifdef MINHTTP_USE_OPENSSL
void init_openssl_once() {
    static std::once_flag once;
    std::call_once(once, []() {
        SSL_library_init();
        SSL_load_error_strings();
        OpenSSL_add_ssl_algorithms();
    });
}

// A blocking socket whose SO_RCVTIMEO/SO_SNDTIMEO expired surfaces as
// WANT_READ/WANT_WRITE or SYSCALL with errno EAGAIN.
bool socket_timed_out(int ssl_error) {
    if (ssl_error != SSL_ERROR_WANT_READ && ssl_error != SSL_ERROR_WANT_WRITE &&
        ssl_error != SSL_ERROR_SYSCALL) {
        return false;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
}

std::string last_ssl_error(const std::string& prefix) {
    const unsigned long code = ERR_get_error();
    if (code == 0) {
        return prefix;
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return prefix + ": " + buffer;
}
#endif

} // anonymous namespace

bool is_ip_literal(const std::string& host) {
    in6_addr addr{};
    return ::inet_pton(AF_INET, host.c_str(), &addr) == 1 ||
           ::inet_pton(AF_INET6, host.c_str(), &addr) == 1;
}

// ===========================================================================
// TcpStream
// ===========================================================================

TcpStream::~TcpStream() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::unique_ptr<TcpStream> TcpStream::connect(const std::string& host, uint16_t port,
                                              std::optional<uint64_t> timeout_seconds,
                                              std::string& err) {
    err.clear();
    if (timeout_seconds.has_value() && *timeout_seconds == 0) {
        timeout_seconds.reset();
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* results = nullptr;
    const std::string port_str = std::to_string(port);
    const int gai_rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &results);
    if (gai_rc != 0 || results == nullptr) {
        err = "DNS resolution failed for host '" + host + "': " + std::string(gai_strerror(gai_rc));
        return nullptr;
    }

    int connected_fd = -1;
    std::string last_error;

    for (addrinfo* addr = results; addr != nullptr; addr = addr->ai_next) {
        int fd = ::socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
        if (fd < 0) {
            last_error = "socket() failed: " + std::string(std::strerror(errno));
            continue;
        }

        std::string step_error;
        if (!set_nonblocking(fd, true, step_error)) {
            last_error = step_error;
            ::close(fd);
            continue;
        }

        int rc = ::connect(fd, addr->ai_addr, addr->ai_addrlen);
        if (rc < 0 && errno != EINPROGRESS) {
            last_error = "connect() failed: " + std::string(std::strerror(errno));
            ::close(fd);
            continue;
        }

        if (rc < 0 && !finish_connect(fd, timeout_seconds, step_error)) {
            last_error = step_error;
            ::close(fd);
            continue;
        }

        if (!set_nonblocking(fd, false, step_error)) {
            last_error = step_error;
            ::close(fd);
            continue;
        }

        if (timeout_seconds.has_value() &&
            !set_socket_timeouts(fd, *timeout_seconds, step_error)) {
            last_error = step_error;
            ::close(fd);
            continue;
        }

        connected_fd = fd;
        break;
    }

    ::freeaddrinfo(results);

    if (connected_fd < 0) {
        err = last_error.empty() ? "Unable to connect" : last_error;
        return nullptr;
    }

    return std::unique_ptr<TcpStream>(new TcpStream(connected_fd));
}

std::optional<size_t> TcpStream::read_some(uint8_t* buffer, size_t len, std::string& err) {
    while (true) {
        const ssize_t rc = ::recv(fd_, buffer, len, 0);
        if (rc >= 0) {
            return static_cast<size_t>(rc);
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            err = "Read timed out";
            return std::nullopt;
        }

        err = "recv() failed: " + std::string(std::strerror(errno));
        return std::nullopt;
    }
}

bool TcpStream::write_all(const uint8_t* data, size_t len, std::string& err) {
    size_t written = 0;
    while (written < len) {
        const ssize_t rc = ::send(fd_, data + written, len - written, MSG_NOSIGNAL);
        if (rc > 0) {
            written += static_cast<size_t>(rc);
            continue;
        }
        if (rc == 0) {
            err = "Connection closed while writing request";
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            err = "Write timed out";
            return false;
        }

        err = "send() failed: " + std::string(std::strerror(errno));
        return false;
    }

    return true;
}

// ===========================================================================
// TlsStream
// ===========================================================================

#ifdef MINHTTP_USE_OPENSSL

TlsStream::TlsStream(std::unique_ptr<TcpStream> tcp)
    : tcp_(std::move(tcp)) {}

TlsStream::~TlsStream() {
    close();
}

void TlsStream::close() {
    if (ssl_) {
        SSL_shutdown(ssl_);
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    if (ssl_ctx_) {
        SSL_CTX_free(ssl_ctx_);
        ssl_ctx_ = nullptr;
    }
}

std::unique_ptr<TlsStream> TlsStream::handshake(std::unique_ptr<TcpStream> tcp,
                                                const std::string& host,
                                                std::string& err) {
    init_openssl_once();

    std::unique_ptr<TlsStream> tls(new TlsStream(std::move(tcp)));

    tls->ssl_ctx_ = SSL_CTX_new(TLS_client_method());
    if (!tls->ssl_ctx_) {
        err = last_ssl_error("SSL_CTX_new() failed");
        return nullptr;
    }
    SSL_CTX_set_verify(tls->ssl_ctx_, SSL_VERIFY_PEER, nullptr);
    if (SSL_CTX_set_default_verify_paths(tls->ssl_ctx_) != 1) {
        err = last_ssl_error("SSL_CTX_set_default_verify_paths() failed");
        return nullptr;
    }

    tls->ssl_ = SSL_new(tls->ssl_ctx_);
    if (!tls->ssl_) {
        err = last_ssl_error("SSL_new() failed");
        return nullptr;
    }

    const bool ip_host = is_ip_literal(host);
    if (!ip_host) {
        SSL_set_tlsext_host_name(tls->ssl_, host.c_str());
    }
    SSL_set_fd(tls->ssl_, tls->tcp_->fd());

    while (true) {
        errno = 0;
        const int rc = SSL_connect(tls->ssl_);
        if (rc == 1) {
            break;
        }

        const int ssl_error = SSL_get_error(tls->ssl_, rc);
        if (socket_timed_out(ssl_error)) {
            err = "TLS handshake timed out";
            return nullptr;
        }
        if (ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) {
            continue;
        }

        err = last_ssl_error("TLS handshake failed");
        return nullptr;
    }

    if (SSL_get_verify_result(tls->ssl_) != X509_V_OK) {
        err = "TLS certificate verification failed: " +
              std::string(X509_verify_cert_error_string(SSL_get_verify_result(tls->ssl_)));
        return nullptr;
    }

    X509* peer_cert = SSL_get_peer_certificate(tls->ssl_);
    if (!peer_cert) {
        err = "TLS certificate verification failed: missing peer certificate";
        return nullptr;
    }

    const int hostname_ok =
        ip_host ? X509_check_ip_asc(peer_cert, host.c_str(), 0)
                : X509_check_host(peer_cert, host.c_str(), host.size(), 0, nullptr);
    X509_free(peer_cert);
    if (hostname_ok != 1) {
        err = "TLS certificate verification failed: hostname mismatch for " + host;
        return nullptr;
    }

    return tls;
}

std::optional<size_t> TlsStream::read_some(uint8_t* buffer, size_t len, std::string& err) {
    const int chunk = static_cast<int>(std::min<size_t>(len, 1 << 20));
    while (true) {
        errno = 0;
        const int rc = SSL_read(ssl_, buffer, chunk);
        if (rc > 0) {
            return static_cast<size_t>(rc);
        }

        const int ssl_error = SSL_get_error(ssl_, rc);
        if (ssl_error == SSL_ERROR_ZERO_RETURN) {
            return 0;
        }
        if (socket_timed_out(ssl_error)) {
            err = "Read timed out";
            return std::nullopt;
        }
        if (ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) {
            continue;
        }

        err = last_ssl_error("SSL_read() failed");
        return std::nullopt;
    }
}

bool TlsStream::write_all(const uint8_t* data, size_t len, std::string& err) {
    size_t written = 0;
    while (written < len) {
        const int remaining = static_cast<int>(std::min<size_t>(len - written, 1 << 20));
        errno = 0;
        const int rc = SSL_write(ssl_, data + written, remaining);
        if (rc > 0) {
            written += static_cast<size_t>(rc);
            continue;
        }

        const int ssl_error = SSL_get_error(ssl_, rc);
        if (socket_timed_out(ssl_error)) {
            err = "Write timed out";
            return false;
        }
        if (ssl_error == SSL_ERROR_WANT_READ || ssl_error == SSL_ERROR_WANT_WRITE) {
            continue;
        }

        err = last_ssl_error("SSL_write() failed");
        return false;
    }
    return true;
}

#endif  // MINHTTP_USE_OPENSSL

// ===========================================================================
// open_transport
// ===========================================================================

std::unique_ptr<Stream> open_transport(const std::string& authority, bool encrypted,
                                       std::optional<uint64_t> timeout_seconds,
                                       Error& err) {
#ifndef MINHTTP_USE_OPENSSL
    if (encrypted) {
        err.set(ErrorKind::Configuration,
                "HTTPS requested but OpenSSL support is not enabled (compile with MINHTTP_USE_OPENSSL)");
        return nullptr;
    }
#endif

    std::string host;
    uint16_t port = 0;
    std::string io_err;
    if (!split_authority(authority, host, port, io_err)) {
        err.set(ErrorKind::Transport, io_err);
        return nullptr;
    }

    auto tcp = TcpStream::connect(host, port, timeout_seconds, io_err);
    if (!tcp) {
        err.set(ErrorKind::Transport, io_err);
        return nullptr;
    }

#ifdef MINHTTP_USE_OPENSSL
    if (encrypted) {
        auto tls = TlsStream::handshake(std::move(tcp), host, io_err);
        if (!tls) {
            err.set(ErrorKind::Transport, io_err);
            return nullptr;
        }
        return tls;
    }
#endif

    return tcp;
}

} // namespace minhttp::net
