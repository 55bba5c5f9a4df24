#include "upstream/upstream_error.hpp"

#include "../common/assertions.hpp"

#include <iostream>
#include <string>

namespace up = labgate::upstream;
using labgate::tests::common::AssertContains;
using labgate::tests::common::AssertEq;
using labgate::tests::common::AssertNotContains;

int main() {
  AssertEq(up::ToStableErrorCode(up::UpstreamErrorKind::kUnreachable), "UPSTREAM_UNREACHABLE",
           "unreachable code");
  AssertEq(up::ToStableErrorCode(up::UpstreamErrorKind::kUpstreamError), "UPSTREAM_ERROR",
           "upstream error code");
  AssertEq(up::ToStableErrorCode(up::UpstreamErrorKind::kMalformedResponse),
           "UPSTREAM_MALFORMED_RESPONSE", "malformed code");

  // Every kind gets distinct guidance.
  const std::string unreachable =
      up::BuildActionableMessage(up::UpstreamErrorKind::kUnreachable, "inference");
  const std::string rejected =
      up::BuildActionableMessage(up::UpstreamErrorKind::kUpstreamError, "inference");
  const std::string malformed =
      up::BuildActionableMessage(up::UpstreamErrorKind::kMalformedResponse, "inference");
  if (unreachable == rejected || rejected == malformed || unreachable == malformed) {
    std::cerr << "failure kinds must have distinct messages\n";
    return 1;
  }
  AssertContains(unreachable, "LABGATE_UPSTREAM_URL");

  up::UpstreamFailure failure;
  failure.kind = up::UpstreamErrorKind::kUpstreamError;
  failure.http_status = 500;
  failure.detail = "Internal\n   Server   Error";
  const std::string formatted = up::FormatUpstreamFailure("orchestration", failure);
  AssertContains(formatted, "UPSTREAM_ERROR: ");
  AssertContains(formatted, "orchestration");
  AssertContains(formatted, "detail: HTTP 500 Internal Server Error");
  AssertNotContains(formatted, "\n");

  up::UpstreamFailure bare;
  bare.kind = up::UpstreamErrorKind::kMalformedResponse;
  AssertNotContains(up::FormatUpstreamFailure("inference", bare), "detail:");

  std::cout << "upstream_error_smoke: ok\n";
  return 0;
}
