#pragma once

#include <string>
#include <string_view>

namespace piiguard::http {

inline constexpr std::string_view kBearerPrefix = "Bearer ";
// std::string because cpp-httplib header APIs take const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline const std::string kRequestIdHeader = "X-Request-Id";
inline const std::string kRedactedHeader = "X-PII-Redacted";
inline const std::string kStateHeader = "X-PII-State";
inline const std::string kSnapshotHeader = "X-PII-Snapshot";
inline constexpr const char* kJsonContentType = "application/json";

inline constexpr const char* kSanitizePath = "/v1/sanitize";
inline constexpr const char* kHealthPath = "/health";
inline constexpr const char* kStatsPath = "/stats";
inline constexpr const char* kReloadPath = "/admin/reload";

} // namespace piiguard::http
