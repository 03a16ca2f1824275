#include <minhttp/net/url.h>

#include <cctype>

namespace minhttp::net {

UrlParts parse_url(const std::string& url) {
    UrlParts parts;
    int slashes = 0;
    for (char c : url) {
        if (c == '/') {
            ++slashes;
        } else if (slashes == 2) {
            parts.authority.push_back(c);
        }
        if (slashes >= 3) {
            parts.resource.push_back(c);
        }
    }

    if (parts.resource.empty()) {
        parts.resource = "/";
    }

    parts.is_encrypted = url.rfind("https://", 0) == 0;
    if (parts.authority.find(':') == std::string::npos) {
        parts.authority += parts.is_encrypted ? ":443" : ":80";
    }
    return parts;
}

bool split_authority(const std::string& authority, std::string& host,
                     uint16_t& port, std::string& err) {
    const auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        err = "Missing port in authority '" + authority + "'";
        return false;
    }

    host = authority.substr(0, colon);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    if (host.empty()) {
        err = "Empty host in authority '" + authority + "'";
        return false;
    }

    const std::string port_str = authority.substr(colon + 1);
    if (port_str.empty() || port_str.size() > 5) {
        err = "Invalid port in authority '" + authority + "'";
        return false;
    }

    unsigned long value = 0;
    for (char ch : port_str) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            err = "Invalid port in authority '" + authority + "'";
            return false;
        }
        value = value * 10 + static_cast<unsigned long>(ch - '0');
    }
    if (value == 0 || value > 65535UL) {
        err = "Port out of range in authority '" + authority + "'";
        return false;
    }

    port = static_cast<uint16_t>(value);
    return true;
}

bool has_scheme(const std::string& value) {
    const auto sep = value.find("://");
    if (sep == std::string::npos || sep == 0) {
        return false;
    }
    for (size_t i = 0; i < sep; ++i) {
        const auto ch = static_cast<unsigned char>(value[i]);
        if (!std::isalnum(ch) && ch != '+' && ch != '-' && ch != '.') {
            return false;
        }
    }
    return true;
}

} // namespace minhttp::net
