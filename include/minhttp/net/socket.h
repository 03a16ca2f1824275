#pragma once
#include <minhttp/net/error.h>
#include <minhttp/net/stream.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#ifdef MINHTTP_USE_OPENSSL
struct ssl_st;
struct ssl_ctx_st;
#endif

namespace minhttp::net {

// Blocking TCP connection. The descriptor is closed on destruction.
class TcpStream : public Stream {
public:
    ~TcpStream() override;

    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    // Resolves host and connects. With a timeout, it bounds the connect and
    // is installed as SO_RCVTIMEO/SO_SNDTIMEO; without one, or with 0, every
    // call blocks indefinitely.
    static std::unique_ptr<TcpStream> connect(const std::string& host, uint16_t port,
                                              std::optional<uint64_t> timeout_seconds,
                                              std::string& err);

    std::optional<size_t> read_some(uint8_t* buffer, size_t len,
                                    std::string& err) override;
    bool write_all(const uint8_t* data, size_t len, std::string& err) override;

    int fd() const { return fd_; }

private:
    explicit TcpStream(int fd) : fd_(fd) {}

    int fd_ = -1;
};

#ifdef MINHTTP_USE_OPENSSL
// TLS session over an owned TcpStream. The peer certificate is verified
// against the system trust store and checked against the host name.
// Timeouts stay on the underlying socket.
class TlsStream : public Stream {
public:
    ~TlsStream() override;

    TlsStream(const TlsStream&) = delete;
    TlsStream& operator=(const TlsStream&) = delete;

    static std::unique_ptr<TlsStream> handshake(std::unique_ptr<TcpStream> tcp,
                                                const std::string& host,
                                                std::string& err);

    std::optional<size_t> read_some(uint8_t* buffer, size_t len,
                                    std::string& err) override;
    bool write_all(const uint8_t* data, size_t len, std::string& err) override;

private:
    explicit TlsStream(std::unique_ptr<TcpStream> tcp);
    void close();

    std::unique_ptr<TcpStream> tcp_;
    ssl_ctx_st* ssl_ctx_ = nullptr;
    ssl_st* ssl_ = nullptr;
};
#endif

// True for an IPv4 or IPv6 address literal (without brackets). TLS sends no
// SNI for such hosts and matches the certificate's IP SANs instead.
bool is_ip_literal(const std::string& host);

// Opens a plain or TLS stream to "host:port". Failures are Transport
// errors, except TLS without OpenSSL support which is Configuration.
std::unique_ptr<Stream> open_transport(const std::string& authority, bool encrypted,
                                       std::optional<uint64_t> timeout_seconds,
                                       Error& err);

using TransportFactory = std::function<std::unique_ptr<Stream>(
    const std::string& authority, bool encrypted,
    std::optional<uint64_t> timeout_seconds, Error& err)>;

} // namespace minhttp::net
