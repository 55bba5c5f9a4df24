#pragma once

namespace labgate::core::errors {

// Stable process-exit contract for supervisors and scripts.
//
// 0/1/2 keep their conventional meanings (success, generic failure, usage).
// The remaining values let a supervisor tell a bad environment apart from a
// port that could not be bound without scraping stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kListenFailed = 20,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace labgate::core::errors
