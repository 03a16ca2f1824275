#include <minhttp/net/error.h>

namespace minhttp::net {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "None";
        case ErrorKind::Configuration:     return "Configuration";
        case ErrorKind::Transport:         return "Transport";
        case ErrorKind::MalformedResponse: return "MalformedResponse";
        case ErrorKind::Decompression:     return "Decompression";
        case ErrorKind::TooManyRedirects:  return "TooManyRedirects";
    }
    return "Unknown";
}

void Error::set(ErrorKind k, std::string msg) {
    kind = k;
    message = std::move(msg);
}

void Error::clear() {
    kind = ErrorKind::None;
    message.clear();
}

std::string Error::to_string() const {
    if (message.empty()) {
        return error_kind_name(kind);
    }
    return std::string(error_kind_name(kind)) + ": " + message;
}

} // namespace minhttp::net
