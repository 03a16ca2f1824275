#include <minhttp/net/connection.h>

namespace minhttp::net {

namespace {

constexpr const char kModule[] = "connection";

std::string describe_target(const Request& request) {
    return method_to_string(request.method()) + " " +
           (request.is_encrypted() ? "https://" : "http://") +
           request.authority() + request.resource();
}

// Zero means "no timeout", as it does for SO_RCVTIMEO.
std::optional<uint64_t> effective_timeout(std::optional<uint64_t> seconds) {
    if (seconds.has_value() && *seconds == 0) {
        return std::nullopt;
    }
    return seconds;
}

} // anonymous namespace

ClientConfig ClientConfig::from_environment() {
    ClientConfig config;
    config.default_timeout_seconds = core::config::timeout_from_environment();
    return config;
}

Connection::Connection(Request request, ClientConfig config)
    : request_(std::move(request)),
      config_(std::move(config)),
      timeout_(effective_timeout(request_.timeout().has_value()
                                     ? request_.timeout()
                                     : config_.default_timeout_seconds)) {}

void Connection::log(core::Severity severity, const std::string& stage,
                     const std::string& message) {
    if (config_.diagnostics != nullptr) {
        config_.diagnostics->emit(severity, kModule, stage, message);
    }
}

std::optional<Response> Connection::exchange(const Request& request, Error& err) {
    log(core::Severity::Info, "connect", describe_target(request));
    auto stream = config_.transport(request.authority(), request.is_encrypted(), timeout_, err);
    if (!stream) {
        if (err.empty()) {
            err.set(ErrorKind::Transport, "Unable to open connection to " + request.authority());
        }
        log(core::Severity::Error, "error", err.to_string());
        return std::nullopt;
    }

    const std::string bytes = request.serialize();
    std::string io_err;
    if (!stream->write_all(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size(), io_err)) {
        err.set(ErrorKind::Transport, io_err);
        log(core::Severity::Error, "error", err.to_string());
        return std::nullopt;
    }
    log(core::Severity::Info, "write", std::to_string(bytes.size()) + " bytes");

    const bool expects_body = request.method().kind != MethodKind::HEAD;
    auto response = Response::from_stream(std::move(stream), err, expects_body);
    if (!response.has_value()) {
        log(core::Severity::Error, "error", err.to_string());
        return std::nullopt;
    }
    if (!response->decode_body()) {
        log(core::Severity::Info, "decode", "no body, encoding headers left as received");
    }

    log(core::Severity::Info, "parse",
        std::to_string(response->status()) + " " + response->reason() + " (" +
            decoder_kind_name(response->body().kind()) + ")");
    return response;
}

std::optional<Response> Connection::send(Error& err) && {
    err.clear();
    Request current = std::move(request_);
    int redirects = 0;

    while (true) {
        // Kept for a possible redirect; current is only serialized.
        Request next = current;

        auto response = exchange(current, err);
        if (!response.has_value()) {
            return std::nullopt;
        }

        if (response->status_class() != StatusClass::Redirect) {
            log(core::Severity::Info, "complete", std::to_string(response->status()));
            return response;
        }

        auto location = response->headers().get("Location");
        if (!location.has_value()) {
            log(core::Severity::Warning, "redirect",
                std::to_string(response->status()) + " without Location, returning it as-is");
            return response;
        }

        if (redirects >= config_.max_redirects) {
            err.set(ErrorKind::TooManyRedirects,
                    "Exceeded " + std::to_string(config_.max_redirects) +
                        " redirects, last Location: " + *location);
            log(core::Severity::Error, "error", err.to_string());
            return std::nullopt;
        }
        ++redirects;

        next.redirect_to(*location);
        log(core::Severity::Info, "redirect",
            std::to_string(response->status()) + " -> " + describe_target(next));
        current = std::move(next);
    }
}

} // namespace minhttp::net
