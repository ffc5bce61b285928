#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gabi {

/**
 * @brief Parsed absolute or empty URL
 *
 * Parsing is purely syntactic: an empty string, a URL with no scheme or
 * with no host all parse successfully. Whether the URL can actually be
 * dialed is the transport's concern.
 */
struct Url {
    std::string raw;                     // input as given
    std::string scheme;                  // lowercased, may be empty
    std::string host;                    // without brackets for IPv6 literals
    std::optional<uint16_t> port;
    std::string path;                    // as written, may be empty
    std::string query;                   // without the leading '?'

    [[nodiscard]] bool is_ipv6_literal() const {
        return host.find(':') != std::string::npos;
    }

    /// Explicit port, or the scheme default (80 / 443, 0 when unknown)
    [[nodiscard]] uint16_t effective_port() const;

    /// "scheme://host:port"
    [[nodiscard]] std::string origin() const;

    /// Path (or "/") followed by "?query" when present
    [[nodiscard]] std::string request_target() const;
};

/**
 * @brief Parse a URL string.
 *
 * Fails with CREATE_REQUEST_ERROR on control characters, malformed percent
 * escapes, a missing scheme before ':' or a non-numeric / out-of-range port.
 */
[[nodiscard]] Result<Url> parse_url(std::string_view raw);

} // namespace gabi
