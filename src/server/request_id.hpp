#pragma once

#include <string>
#include <string_view>

namespace labgate::server {

inline constexpr std::string_view kRequestIdHeader = "X-Request-Id";

// 32 lowercase hex characters from a per-thread random engine.
std::string GenerateRequestId();

// Inbound ids are honored when they are 1..128 characters of
// [A-Za-z0-9._:-]; anything else is replaced with a generated id so log
// lines and response headers never carry client-controlled control bytes.
std::string ResolveRequestId(std::string_view inbound);

} // namespace labgate::server
