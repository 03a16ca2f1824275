#pragma once
#include <cstdint>
#include <string>

namespace minhttp::net {

struct UrlParts {
    std::string authority;   // always "host:port" for well-formed input
    std::string resource;    // path + query, never empty
    bool is_encrypted = false;
};

// Splits "scheme://host[:port]/resource". The port defaults to 443 for
// https:// and 80 otherwise. Input without "//" yields an empty authority;
// that is reported by the transport when it fails to resolve.
UrlParts parse_url(const std::string& url);

// Splits "host:port" at the last ':'. Brackets around an IPv6 literal are
// removed from the host.
bool split_authority(const std::string& authority, std::string& host,
                     uint16_t& port, std::string& err);

// True when value starts with "<scheme>://".
bool has_scheme(const std::string& value);

} // namespace minhttp::net
