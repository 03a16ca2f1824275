#include <minhttp/core/config.h>

#include <cctype>
#include <cstdlib>
#include <limits>
#include <string>

namespace minhttp::core::config {

std::optional<std::uint64_t> timeout_from_environment() {
    const char* raw = std::getenv(kTimeoutEnvVar);
    if (raw == nullptr) {
        return std::nullopt;
    }

    const std::string value(raw);
    if (value.empty()) {
        return std::nullopt;
    }

    std::uint64_t result = 0;
    for (char ch : value) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return std::nullopt;
        }
        const auto digit = static_cast<std::uint64_t>(ch - '0');
        if (result > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        result = result * 10 + digit;
    }
    return result;
}

bool tls_supported() {
#ifdef MINHTTP_USE_OPENSSL
    return true;
#else
    return false;
#endif
}

}  // namespace minhttp::core::config
