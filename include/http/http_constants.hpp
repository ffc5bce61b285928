#pragma once

#include <string>
#include <string_view>

namespace gabi::http {

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAcceptHeader = "Accept";
inline const std::string kAcceptEncodingHeader = "Accept-Encoding";
inline const std::string kAuthorizationHeader = "Authorization";
inline const std::string kContentTypeHeader = "Content-Type";
inline const std::string kUserAgentHeader = "User-Agent";

inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kJsonUtf8ContentType = "application/json; charset=utf-8";
inline constexpr const char* kGzipEncoding = "gzip";

// HEC uses its own scheme name instead of "Bearer"
inline constexpr std::string_view kSplunkAuthPrefix = "Splunk ";

} // namespace gabi::http
