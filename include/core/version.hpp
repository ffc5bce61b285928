#pragma once

#include <string>
#include <string_view>

// Injected by the build from the CMake project version
#ifndef GABI_AUDIT_VERSION
#define GABI_AUDIT_VERSION "0.0.0-dev"
#endif

namespace gabi {

inline constexpr std::string_view kProductName = "GABI";
inline constexpr std::string_view kVersion = GABI_AUDIT_VERSION;

[[nodiscard]] inline std::string version() { return std::string(kVersion); }

/// "GABI/<version>", sent as the User-Agent of every outbound request
[[nodiscard]] inline std::string user_agent() {
    std::string ua(kProductName);
    ua += '/';
    ua += kVersion;
    return ua;
}

} // namespace gabi
