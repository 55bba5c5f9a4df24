#include "upstream/upstream_error.hpp"

#include <cctype>
#include <string>

namespace labgate::upstream {

namespace {

std::string CollapseWhitespace(std::string_view text) {
  std::string normalized;
  normalized.reserve(text.size());
  bool previous_was_space = false;
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      if (!previous_was_space && !normalized.empty()) {
        normalized.push_back(' ');
      }
      previous_was_space = true;
      continue;
    }
    normalized.push_back(c);
    previous_was_space = false;
  }
  while (!normalized.empty() && normalized.back() == ' ') {
    normalized.pop_back();
  }
  return normalized;
}

} // namespace

std::string_view ToStableErrorCode(const UpstreamErrorKind kind) {
  switch (kind) {
  case UpstreamErrorKind::kUnreachable:
    return "UPSTREAM_UNREACHABLE";
  case UpstreamErrorKind::kUpstreamError:
    return "UPSTREAM_ERROR";
  case UpstreamErrorKind::kMalformedResponse:
    return "UPSTREAM_MALFORMED_RESPONSE";
  }
  return "UPSTREAM_ERROR";
}

std::string BuildActionableMessage(const UpstreamErrorKind kind, std::string_view operation) {
  const std::string operation_label =
      operation.empty() ? "the requested call" : std::string(operation);

  switch (kind) {
  case UpstreamErrorKind::kUnreachable:
    return "Lab service could not be reached for " + operation_label +
           "; check LABGATE_UPSTREAM_URL and that the service is running.";
  case UpstreamErrorKind::kUpstreamError:
    return "Lab service rejected the " + operation_label +
           " request; inspect the upstream logs for the reported error.";
  case UpstreamErrorKind::kMalformedResponse:
    return "Lab service returned an unexpected " + operation_label +
           " response; verify the gateway and lab service versions match.";
  }
  return "Lab service call failed for " + operation_label + ".";
}

std::string FormatUpstreamFailure(std::string_view operation, const UpstreamFailure& failure) {
  std::string detail = CollapseWhitespace(failure.detail);
  if (failure.http_status != 0) {
    detail = "HTTP " + std::to_string(failure.http_status) + (detail.empty() ? "" : " " + detail);
  }

  std::string formatted = std::string(ToStableErrorCode(failure.kind)) + ": " +
                          BuildActionableMessage(failure.kind, operation);
  if (!detail.empty()) {
    formatted += " detail: " + detail;
  }
  return formatted;
}

} // namespace labgate::upstream
