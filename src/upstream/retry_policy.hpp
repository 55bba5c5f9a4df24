#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace labgate::core::logging {
class Logger;
}

namespace labgate::upstream {

// Transport-level outcome of one HTTP exchange, independent of the HTTP
// library in use.
enum class TransportFault {
  kNone,
  kConnectFailed, // no connection was established; nothing reached the upstream
  kReadFailed,    // request sent, response not received (includes read timeout)
  kWriteFailed,   // connection dropped while the request was being sent
  kOther,
};

std::string_view ToString(TransportFault fault);

struct TransportOutcome {
  TransportFault fault = TransportFault::kNone;
  int http_status = 0;
  std::string body;
  std::string detail;
};

// Only a failed connect is retried: once the request may have reached the
// upstream, a retry could re-run workflow steps that already executed.
bool IsConnectionLevelFailure(TransportFault fault);

// Remaining retries under a fixed budget.
std::uint32_t ComputeRetryAttemptsRemaining(std::uint32_t retry_limit,
                                            std::uint32_t retries_used);

struct RetriedOutcome {
  TransportOutcome outcome;
  std::uint32_t attempts = 0;
};

// Runs `attempt` once, then again up to `retry_limit` times while the
// previous attempt failed at connection level. Application responses (any
// HTTP status) end the loop immediately.
RetriedOutcome ExecuteWithConnectRetry(const std::function<TransportOutcome()>& attempt,
                                       std::uint32_t retry_limit, std::string_view operation,
                                       core::logging::Logger& logger);

} // namespace labgate::upstream
