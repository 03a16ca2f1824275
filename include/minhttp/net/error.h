#pragma once
#include <string>

namespace minhttp::net {

enum class ErrorKind {
    None,
    Configuration,      // e.g. https:// without TLS support compiled in
    Transport,          // DNS, connect, timeout, TLS, socket read/write
    MalformedResponse,  // header block violates the response grammar
    Decompression,      // gzip/deflate body rejected while reading
    TooManyRedirects,
};

const char* error_kind_name(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    void set(ErrorKind k, std::string msg);
    void clear();
    bool empty() const { return kind == ErrorKind::None; }

    // "<kind>: <message>"
    std::string to_string() const;
};

} // namespace minhttp::net
