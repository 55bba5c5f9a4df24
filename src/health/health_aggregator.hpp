#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace labgate::health {

enum class HealthStatus {
  kOk,
  kDegraded,
  kUnavailable,
};

std::string_view ToString(HealthStatus status);

// Result of one component check.
struct ComponentReport {
  HealthStatus status = HealthStatus::kUnavailable;
  std::chrono::milliseconds latency{0};
  std::string detail;
};

// `configuration` components gate the whole service: when one is not ok the
// service is unavailable. `dependency` components only degrade it.
enum class ComponentRole {
  kConfiguration,
  kDependency,
};

struct ComponentCheck {
  std::string name;
  ComponentRole role = ComponentRole::kDependency;
  std::function<ComponentReport()> run;
};

// Snapshot recomputed on every query; nothing is cached between calls.
struct HealthReport {
  HealthStatus overall = HealthStatus::kUnavailable;
  std::map<std::string, ComponentReport> components;
  std::chrono::system_clock::time_point timestamp{};
  std::int64_t uptime_seconds = 0;
};

struct BasicHealth {
  HealthStatus status = HealthStatus::kOk;
  std::chrono::system_clock::time_point timestamp{};
};

struct Readiness {
  bool ready = false;
  HealthReport report;
};

inline constexpr std::string_view kServiceName = "labgate";
inline constexpr std::string_view kServiceVersion = "0.1.0";

// ok iff every component is ok; unavailable iff a configuration component is
// not ok; degraded otherwise.
HealthStatus AggregateStatus(const std::vector<ComponentCheck>& checks,
                             const std::map<std::string, ComponentReport>& components);

// Runs registered component checks concurrently under one shared deadline.
//
// Checks must be cheap and side-effect free. Each runs on its own detached
// thread; a check still running when `check_timeout` elapses is reported
// unavailable ("timed out") and its late result is discarded. A check that
// throws is reported unavailable with the exception text. `check_timeout` is
// capped at `core::config::kMaxTimeout`.
class HealthAggregator {
public:
  HealthAggregator(std::vector<ComponentCheck> checks, std::chrono::milliseconds check_timeout);

  BasicHealth Basic() const;
  HealthReport Detailed() const;
  Readiness Ready() const;

private:
  std::vector<ComponentCheck> checks_;
  std::chrono::milliseconds check_timeout_;
  std::chrono::steady_clock::time_point started_at_;
};

std::string ToJson(const ComponentReport& component);
std::string ToJson(const HealthReport& report);
std::string ToJson(const BasicHealth& health);
std::string ToJson(const Readiness& readiness);

} // namespace labgate::health
