#pragma once
#include <minhttp/net/error.h>
#include <minhttp/net/header_map.h>
#include <cstdint>
#include <optional>
#include <string>

namespace minhttp::net {

class Response;

enum class MethodKind {
    GET, HEAD, POST, PUT, DELETE_METHOD, CONNECT, OPTIONS, TRACE, PATCH, CUSTOM
};

// A request verb. CUSTOM carries its text, which is written into the
// request line verbatim without any token validation.
struct Method {
    MethodKind kind = MethodKind::GET;
    std::string custom;

    Method() = default;
    Method(MethodKind k) : kind(k) {}

    static Method Custom(std::string verb);

    bool operator==(const Method& other) const;
    bool operator!=(const Method& other) const { return !(*this == other); }
};

std::string method_to_string(const Method& method);

// Exact, case-sensitive match against the standard verbs; anything else
// becomes a CUSTOM method.
Method string_to_method(const std::string& str);

// An HTTP/1.1 request. Configure it with the with_* chain, which consumes
// and returns the value, then hand it to send().
//
//   Error err;
//   auto resp = minhttp::net::post("http://example.com/items")
//                   .with_header("Accept", "application/json")
//                   .with_body("{}")
//                   .send(err);
class Request {
public:
    Request(Method method, const std::string& url);

    Request with_header(const std::string& name, const std::string& value) &&;
    Request with_headers(const HeaderMap& headers) &&;
    // Also sets Content-Length to the body's byte length.
    Request with_body(std::string body) &&;
    // Overrides the MINHTTP_TIMEOUT default for this request. 0 disables
    // the timeout.
    Request with_timeout(uint64_t seconds) &&;

    // Consumes the request. Fails with ErrorKind::Configuration before any
    // network activity when the URL is https:// and TLS is not compiled in.
    std::optional<Response> send(Error& err) &&;

    // "<METHOD> <resource> HTTP/1.1\r\nHost: <authority>\r\n<headers>\r\n<body>"
    std::string serialize() const;

    // Retargets the request at a redirect Location. An absolute URL replaces
    // authority, resource and scheme; anything else is taken as a path on
    // the current authority. The body and its Content-Length are dropped.
    void redirect_to(const std::string& location);

    const Method& method() const { return method_; }
    const std::string& authority() const { return authority_; }
    const std::string& resource() const { return resource_; }
    const HeaderMap& headers() const { return headers_; }
    const std::optional<std::string>& body() const { return body_; }
    std::optional<uint64_t> timeout() const { return timeout_; }
    bool is_encrypted() const { return is_encrypted_; }

private:
    Method method_;
    std::string authority_;
    std::string resource_;
    HeaderMap headers_;
    std::optional<std::string> body_;
    std::optional<uint64_t> timeout_;
    bool is_encrypted_ = false;
};

Request create_request(Method method, const std::string& url);
Request get(const std::string& url);
Request head(const std::string& url);
Request post(const std::string& url);
Request put(const std::string& url);
Request delete_(const std::string& url);
Request connect(const std::string& url);
Request options(const std::string& url);
Request trace(const std::string& url);
Request patch(const std::string& url);

} // namespace minhttp::net
