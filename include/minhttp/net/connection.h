#pragma once
#include <minhttp/core/config.h>
#include <minhttp/core/diagnostics.h>
#include <minhttp/net/error.h>
#include <minhttp/net/request.h>
#include <minhttp/net/response.h>
#include <minhttp/net/socket.h>
#include <cstdint>
#include <optional>

namespace minhttp::net {

struct ClientConfig {
    // Used when the request carries no timeout of its own.
    std::optional<uint64_t> default_timeout_seconds;
    int max_redirects = core::config::kDefaultMaxRedirects;
    TransportFactory transport = open_transport;
    // Optional; not owned.
    core::DiagnosticEmitter* diagnostics = nullptr;

    // default_timeout_seconds from MINHTTP_TIMEOUT, everything else default.
    static ClientConfig from_environment();
};

// Sends one request and follows redirects. A Connection is used once:
// send() consumes it together with the request it was built from.
class Connection {
public:
    Connection(Request request, ClientConfig config);

    // Opens the transport, writes the request, parses the reply and, for a
    // 3xx with a Location header, re-sends to the new target (without the
    // body) until a non-redirect arrives. More than max_redirects hops fail
    // with ErrorKind::TooManyRedirects. Any error ends the chain.
    std::optional<Response> send(Error& err) &&;

    // Request timeout, else the configured default, else none. A timeout of
    // 0 means none.
    std::optional<uint64_t> timeout() const { return timeout_; }

private:
    std::optional<Response> exchange(const Request& request, Error& err);
    void log(core::Severity severity, const std::string& stage, const std::string& message);

    Request request_;
    ClientConfig config_;
    std::optional<uint64_t> timeout_;
};

} // namespace minhttp::net
