#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace labgate::upstream {

// Failure taxonomy surfaced by every upstream call. Each kind gets its own
// client-facing text, so callers branch on `kind`, never on `detail`.
enum class UpstreamErrorKind {
  kUnreachable,       // connection refused, DNS failure, connect/read timeout
  kUpstreamError,     // HTTP response outside 2xx
  kMalformedResponse, // 2xx but the body does not match the expected schema
};

// Stable, grep-friendly code, e.g. `UPSTREAM_UNREACHABLE`.
std::string_view ToStableErrorCode(UpstreamErrorKind kind);

struct UpstreamFailure {
  UpstreamErrorKind kind = UpstreamErrorKind::kUnreachable;
  int http_status = 0;
  std::string detail;
  std::uint32_t attempts = 0;
};

// Human-actionable guidance for one failure kind. `operation` is a label such
// as "inference" or "orchestration".
std::string BuildActionableMessage(UpstreamErrorKind kind, std::string_view operation);

// Single-line contract text:
//   "<STABLE_CODE>: <actionable_message> detail: <detail>"
// The detail suffix is omitted when there is no detail. An HTTP status, when
// known, is folded into the detail.
std::string FormatUpstreamFailure(std::string_view operation, const UpstreamFailure& failure);

} // namespace labgate::upstream
