#include "upstream/retry_policy.hpp"

#include "core/logging/logger.hpp"

namespace labgate::upstream {

std::string_view ToString(const TransportFault fault) {
  switch (fault) {
  case TransportFault::kNone:
    return "none";
  case TransportFault::kConnectFailed:
    return "connect_failed";
  case TransportFault::kReadFailed:
    return "read_failed";
  case TransportFault::kWriteFailed:
    return "write_failed";
  case TransportFault::kOther:
    return "other";
  }
  return "other";
}

bool IsConnectionLevelFailure(const TransportFault fault) {
  return fault == TransportFault::kConnectFailed;
}

std::uint32_t ComputeRetryAttemptsRemaining(const std::uint32_t retry_limit,
                                            const std::uint32_t retries_used) {
  if (retries_used >= retry_limit) {
    return 0U;
  }
  return retry_limit - retries_used;
}

RetriedOutcome ExecuteWithConnectRetry(const std::function<TransportOutcome()>& attempt,
                                       const std::uint32_t retry_limit,
                                       std::string_view operation,
                                       core::logging::Logger& logger) {
  RetriedOutcome result;
  std::uint32_t retries_used = 0;

  while (true) {
    ++result.attempts;
    result.outcome = attempt();

    if (!IsConnectionLevelFailure(result.outcome.fault)) {
      return result;
    }
    if (ComputeRetryAttemptsRemaining(retry_limit, retries_used) == 0U) {
      logger.Warn("upstream connect failed; retry budget exhausted",
                  {{"operation", operation},
                   {"attempts", std::to_string(result.attempts)},
                   {"error", result.outcome.detail}});
      return result;
    }

    ++retries_used;
    logger.Warn("upstream connect failed; retrying",
                {{"operation", operation},
                 {"attempt", std::to_string(result.attempts)},
                 {"retries_remaining",
                  std::to_string(ComputeRetryAttemptsRemaining(retry_limit, retries_used))},
                 {"error", result.outcome.detail}});
  }
}

} // namespace labgate::upstream
