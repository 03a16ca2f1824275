#pragma once
#include <minhttp/net/decoder.h>
#include <minhttp/net/error.h>
#include <minhttp/net/header_map.h>
#include <minhttp/net/stream.h>
#include <memory>
#include <optional>
#include <string>

namespace minhttp::net {

enum class StatusClass {
    Informational,  // 1xx
    Success,        // 2xx
    Redirect,       // 3xx
    ClientError,    // 4xx
    ServerError,    // 5xx, and any code outside 100-599
};

StatusClass classify_status(int code);
const char* status_class_name(StatusClass status_class);

class Response {
public:
    static constexpr int kMissingStatusCode = 503;
    static constexpr const char* kMissingStatusReason = "Server did not provide a status line";

    // Parses the status line and header block from stream, then stops: the
    // returned body reads the remaining bytes lazily. A missing or garbled
    // status line becomes 503 kMissingStatusReason. A header line without
    // ':' fails with ErrorKind::MalformedResponse.
    //
    // Content-Length, when present and numeric, bounds the body. With
    // expects_body false (HEAD requests) the body is empty.
    static std::optional<Response> from_stream(std::unique_ptr<Stream> stream,
                                               Error& err,
                                               bool expects_body = true);

    Response(Response&&) = default;
    Response& operator=(Response&&) = default;

    // Replaces the identity body with a gzip/deflate decoder according to
    // the encoding headers (see Decoder::detect). Returns false, leaving body
    // and headers untouched, if the response carries no body (HEAD, 1xx,
    // 204, 304) or the body has already been read from.
    bool decode_body();

    int status() const { return status_; }
    StatusClass status_class() const { return classify_status(status_); }
    bool is_success() const { return status_class() == StatusClass::Success; }
    const std::string& reason() const { return reason_; }
    const HeaderMap& headers() const { return headers_; }
    Decoder& body() { return body_; }

    // Convenience: drain the body into out.
    bool body_as_string(std::string& out, Error& err);

private:
    Response(int status, std::string reason, HeaderMap headers, Decoder body,
             bool has_body);

    int status_ = 0;
    std::string reason_;
    HeaderMap headers_;
    Decoder body_;
    bool has_body_ = true;
};

} // namespace minhttp::net
