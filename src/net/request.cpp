#include <minhttp/net/request.h>
#include <minhttp/core/config.h>
#include <minhttp/net/connection.h>
#include <minhttp/net/response.h>
#include <minhttp/net/url.h>

#include <sstream>

namespace minhttp::net {

Method Method::Custom(std::string verb) {
    Method m(MethodKind::CUSTOM);
    m.custom = std::move(verb);
    return m;
}

bool Method::operator==(const Method& other) const {
    if (kind != other.kind) return false;
    return kind != MethodKind::CUSTOM || custom == other.custom;
}

std::string method_to_string(const Method& method) {
    switch (method.kind) {
        case MethodKind::GET:           return "GET";
        case MethodKind::HEAD:          return "HEAD";
        case MethodKind::POST:          return "POST";
        case MethodKind::PUT:           return "PUT";
        case MethodKind::DELETE_METHOD: return "DELETE";
        case MethodKind::CONNECT:       return "CONNECT";
        case MethodKind::OPTIONS:       return "OPTIONS";
        case MethodKind::TRACE:         return "TRACE";
        case MethodKind::PATCH:         return "PATCH";
        case MethodKind::CUSTOM:        return method.custom;
    }
    return "GET";
}

Method string_to_method(const std::string& str) {
    if (str == "GET")     return MethodKind::GET;
    if (str == "HEAD")    return MethodKind::HEAD;
    if (str == "POST")    return MethodKind::POST;
    if (str == "PUT")     return MethodKind::PUT;
    if (str == "DELETE")  return MethodKind::DELETE_METHOD;
    if (str == "CONNECT") return MethodKind::CONNECT;
    if (str == "OPTIONS") return MethodKind::OPTIONS;
    if (str == "TRACE")   return MethodKind::TRACE;
    if (str == "PATCH")   return MethodKind::PATCH;
    return Method::Custom(str);
}

Request::Request(Method method, const std::string& url)
    : method_(std::move(method)) {
    UrlParts parts = parse_url(url);
    authority_ = std::move(parts.authority);
    resource_ = std::move(parts.resource);
    is_encrypted_ = parts.is_encrypted;
}

Request Request::with_header(const std::string& name, const std::string& value) && {
    headers_.set(name, value);
    return std::move(*this);
}

Request Request::with_headers(const HeaderMap& headers) && {
    headers_.merge(headers);
    return std::move(*this);
}

Request Request::with_body(std::string body) && {
    headers_.set("Content-Length", std::to_string(body.size()));
    body_ = std::move(body);
    return std::move(*this);
}

Request Request::with_timeout(uint64_t seconds) && {
    timeout_ = seconds;
    return std::move(*this);
}

std::optional<Response> Request::send(Error& err) && {
    err.clear();
    if (is_encrypted_ && !core::config::tls_supported()) {
        err.set(ErrorKind::Configuration,
                "Cannot send to an https:// URL: TLS support is not compiled in");
        return std::nullopt;
    }
    return Connection(std::move(*this), ClientConfig::from_environment()).send(err);
}

std::string Request::serialize() const {
    std::ostringstream oss;

    oss << method_to_string(method_) << " " << resource_ << " HTTP/1.1\r\n";
    oss << "Host: " << authority_ << "\r\n";

    for (const auto& [name, value] : headers_) {
        oss << name << ": " << value << "\r\n";
    }

    oss << "\r\n";
    if (body_.has_value()) {
        oss << *body_;
    }
    return oss.str();
}

void Request::redirect_to(const std::string& location) {
    if (has_scheme(location)) {
        UrlParts parts = parse_url(location);
        authority_ = std::move(parts.authority);
        resource_ = std::move(parts.resource);
        is_encrypted_ = parts.is_encrypted;
    } else if (!location.empty() && location.front() == '/') {
        resource_ = location;
    } else {
        resource_ = "/" + location;
    }

    body_.reset();
    headers_.remove("Content-Length");
}

Request create_request(Method method, const std::string& url) {
    return Request(std::move(method), url);
}

Request get(const std::string& url)     { return Request(MethodKind::GET, url); }
Request head(const std::string& url)    { return Request(MethodKind::HEAD, url); }
Request post(const std::string& url)    { return Request(MethodKind::POST, url); }
Request put(const std::string& url)     { return Request(MethodKind::PUT, url); }
Request delete_(const std::string& url) { return Request(MethodKind::DELETE_METHOD, url); }
Request connect(const std::string& url) { return Request(MethodKind::CONNECT, url); }
Request options(const std::string& url) { return Request(MethodKind::OPTIONS, url); }
Request trace(const std::string& url)   { return Request(MethodKind::TRACE, url); }
Request patch(const std::string& url)   { return Request(MethodKind::PATCH, url); }

} // namespace minhttp::net
