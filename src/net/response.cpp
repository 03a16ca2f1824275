#include <minhttp/net/response.h>

#include <cctype>
#include <charconv>
#include <string_view>
#include <vector>

namespace minhttp::net {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string strip_line_ending(const std::string& line) {
    size_t end = line.size();
    if (end > 0 && line[end - 1] == '\n') --end;
    if (end > 0 && line[end - 1] == '\r') --end;
    return line.substr(0, end);
}

// "HTTP/1.1 404 Not Found" -> 404, "Not". Only the first word of the reason
// phrase is kept.
bool parse_status_line(const std::string& raw_line, int& code, std::string& reason) {
    const std::string line = strip_line_ending(raw_line);

    std::vector<std::string_view> tokens;
    std::string_view rest(line);
    while (tokens.size() < 3) {
        const auto sp = rest.find(' ');
        tokens.push_back(rest.substr(0, sp));
        if (sp == std::string_view::npos) break;
        rest.remove_prefix(sp + 1);
    }
    if (tokens.size() < 3) {
        return false;
    }

    const std::string_view code_str = tokens[1];
    int value = 0;
    auto [ptr, ec] = std::from_chars(code_str.data(), code_str.data() + code_str.size(), value);
    if (ec != std::errc{} || ptr != code_str.data() + code_str.size() || code_str.empty()) {
        return false;
    }

    code = value;
    reason = std::string(tokens[2]);
    return true;
}

bool parse_content_length(const std::string& raw, size_t& content_length) {
    const std::string value = trim(raw);
    if (value.empty()) {
        return false;
    }
    size_t result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return false;
    }
    content_length = result;
    return true;
}

bool status_has_no_body(int code) {
    return (code >= 100 && code < 200) || code == 204 || code == 304;
}

} // anonymous namespace

StatusClass classify_status(int code) {
    if (code >= 100 && code < 200) return StatusClass::Informational;
    if (code >= 200 && code < 300) return StatusClass::Success;
    if (code >= 300 && code < 400) return StatusClass::Redirect;
    if (code >= 400 && code < 500) return StatusClass::ClientError;
    return StatusClass::ServerError;
}

const char* status_class_name(StatusClass status_class) {
    switch (status_class) {
        case StatusClass::Informational: return "Informational";
        case StatusClass::Success:       return "Success";
        case StatusClass::Redirect:      return "Redirect";
        case StatusClass::ClientError:   return "ClientError";
        case StatusClass::ServerError:   return "ServerError";
    }
    return "Unknown";
}

Response::Response(int status, std::string reason, HeaderMap headers, Decoder body,
                   bool has_body)
    : status_(status),
      reason_(std::move(reason)),
      headers_(std::move(headers)),
      body_(std::move(body)),
      has_body_(has_body) {}

std::optional<Response> Response::from_stream(std::unique_ptr<Stream> stream,
                                              Error& err,
                                              bool expects_body) {
    auto reader = std::make_unique<BufferedReader>(std::move(stream));

    std::string line;
    if (!reader->read_line(line, err)) {
        return std::nullopt;
    }

    int status = kMissingStatusCode;
    std::string reason;
    if (!parse_status_line(line, status, reason)) {
        status = kMissingStatusCode;
        reason = kMissingStatusReason;
    }

    HeaderMap headers;
    while (true) {
        if (!reader->read_line(line, err)) {
            return std::nullopt;
        }
        const std::string trimmed = trim(line);
        if (trimmed.empty()) {
            break;
        }

        const auto colon = trimmed.find(':');
        if (colon == std::string::npos) {
            err.set(ErrorKind::MalformedResponse,
                    "Header line without ':' separator: '" + trimmed + "'");
            return std::nullopt;
        }
        headers.set(trimmed.substr(0, colon), trim(trimmed.substr(colon + 1)));
    }

    size_t content_length = 0;
    const bool has_body = expects_body && !status_has_no_body(status);
    if (!has_body) {
        reader->set_limit(0);
    } else if (auto cl = headers.get("Content-Length");
               cl.has_value() && parse_content_length(*cl, content_length)) {
        reader->set_limit(content_length);
    }

    return Response(status, std::move(reason), std::move(headers),
                    Decoder::identity(std::move(reader)), has_body);
}

bool Response::decode_body() {
    if (!has_body_ || body_.started() || body_.kind() != Decoder::Kind::Identity) {
        return false;
    }
    body_ = Decoder::detect(headers_, std::move(body_).release_source());
    return true;
}

bool Response::body_as_string(std::string& out, Error& err) {
    out.clear();
    return body_.read_to_string(out, err);
}

} // namespace minhttp::net
