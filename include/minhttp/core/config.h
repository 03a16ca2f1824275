#ifndef MINHTTP_CORE_CONFIG_H
#define MINHTTP_CORE_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <optional>

namespace minhttp::core::config {

inline constexpr const char kTimeoutEnvVar[] = "MINHTTP_TIMEOUT";
inline constexpr int kDefaultMaxRedirects = 10;
inline constexpr std::size_t kReadBufferSize = 8192;
inline constexpr std::size_t kMaxHeaderLineBytes = 64 * 1024;

// Seconds from MINHTTP_TIMEOUT, or nullopt when unset or not a number.
// "0" is returned as 0, which the client treats as no timeout.
std::optional<std::uint64_t> timeout_from_environment();

// True when the library was compiled with OpenSSL (MINHTTP_USE_OPENSSL).
bool tls_supported();

}  // namespace minhttp::core::config

#endif  // MINHTTP_CORE_CONFIG_H
