#pragma once

#include <string>
#include <string_view>

namespace auditpipe::http {

inline constexpr std::string_view kBearerPrefix = "Bearer ";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kPrometheusContentType = "text/plain; version=0.0.4; charset=utf-8";

} // namespace auditpipe::http
