#include "health/health_aggregator.hpp"

#include "core/config/settings.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

namespace labgate::health {

namespace {

// Shared between `Detailed()` and the check threads. Threads that finish after
// the deadline still write here; nobody reads their slot anymore.
struct CheckRound {
  std::mutex mutex;
  std::condition_variable finished;
  std::vector<std::optional<ComponentReport>> reports;
  std::size_t completed = 0;
};

ComponentReport RunGuarded(const std::function<ComponentReport()>& run) {
  const auto started = std::chrono::steady_clock::now();
  ComponentReport report;
  try {
    report = run();
  } catch (const std::exception& ex) {
    report = ComponentReport{.status = HealthStatus::kUnavailable,
                             .detail = std::string("check failed: ") + ex.what()};
  }
  report.latency = core::ElapsedSince(started);
  return report;
}

void Record(CheckRound& round, const std::size_t index, ComponentReport report) {
  {
    std::lock_guard<std::mutex> lock(round.mutex);
    round.reports[index] = std::move(report);
    ++round.completed;
  }
  round.finished.notify_all();
}

} // namespace

std::string_view ToString(const HealthStatus status) {
  switch (status) {
  case HealthStatus::kOk:
    return "ok";
  case HealthStatus::kDegraded:
    return "degraded";
  case HealthStatus::kUnavailable:
    return "unavailable";
  }
  return "unavailable";
}

HealthStatus AggregateStatus(const std::vector<ComponentCheck>& checks,
                             const std::map<std::string, ComponentReport>& components) {
  bool all_ok = true;
  for (const ComponentCheck& check : checks) {
    const auto it = components.find(check.name);
    const bool ok = it != components.end() && it->second.status == HealthStatus::kOk;
    if (ok) {
      continue;
    }
    if (check.role == ComponentRole::kConfiguration) {
      return HealthStatus::kUnavailable;
    }
    all_ok = false;
  }
  return all_ok ? HealthStatus::kOk : HealthStatus::kDegraded;
}

HealthAggregator::HealthAggregator(std::vector<ComponentCheck> checks,
                                   const std::chrono::milliseconds check_timeout)
    : checks_(std::move(checks)),
      check_timeout_(std::min(check_timeout, core::config::kMaxTimeout)),
      started_at_(std::chrono::steady_clock::now()) {}

BasicHealth HealthAggregator::Basic() const {
  return BasicHealth{.status = HealthStatus::kOk, .timestamp = std::chrono::system_clock::now()};
}

HealthReport HealthAggregator::Detailed() const {
  auto round = std::make_shared<CheckRound>();
  round->reports.resize(checks_.size());
  const auto deadline = std::chrono::steady_clock::now() + check_timeout_;

  for (std::size_t i = 0; i < checks_.size(); ++i) {
    try {
      std::thread([round, i, run = checks_[i].run]() { Record(*round, i, RunGuarded(run)); })
          .detach();
    } catch (const std::system_error& ex) {
      Record(*round, i,
             ComponentReport{.status = HealthStatus::kUnavailable,
                             .detail = std::string("could not start check: ") + ex.what()});
    }
  }

  HealthReport report;
  {
    std::unique_lock<std::mutex> lock(round->mutex);
    round->finished.wait_until(lock, deadline,
                               [&round]() { return round->completed == round->reports.size(); });

    for (std::size_t i = 0; i < checks_.size(); ++i) {
      if (round->reports[i].has_value()) {
        report.components[checks_[i].name] = round->reports[i].value();
        continue;
      }
      report.components[checks_[i].name] = ComponentReport{
          .status = HealthStatus::kUnavailable,
          .latency = check_timeout_,
          .detail = "check timed out after " + std::to_string(check_timeout_.count()) + "ms"};
    }
  }

  report.overall = AggregateStatus(checks_, report.components);
  report.timestamp = std::chrono::system_clock::now();
  report.uptime_seconds =
      std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() -
                                                       started_at_)
          .count();
  return report;
}

Readiness HealthAggregator::Ready() const {
  Readiness readiness;
  readiness.report = Detailed();
  readiness.ready = readiness.report.overall != HealthStatus::kUnavailable;
  return readiness;
}

std::string ToJson(const ComponentReport& component) {
  std::ostringstream out;
  out << "{"
      << "\"status\":" << core::QuoteJson(ToString(component.status)) << ","
      << "\"latency_ms\":" << component.latency.count();
  if (!component.detail.empty()) {
    out << ",\"detail\":" << core::QuoteJson(component.detail);
  }
  out << "}";
  return out.str();
}

namespace {

std::string ComponentsToJson(const std::map<std::string, ComponentReport>& components) {
  std::ostringstream out;
  out << "{";
  bool first = true;
  for (const auto& [name, component] : components) {
    if (!first) {
      out << ',';
    }
    out << core::QuoteJson(name) << ':' << ToJson(component);
    first = false;
  }
  out << "}";
  return out.str();
}

} // namespace

std::string ToJson(const HealthReport& report) {
  std::ostringstream out;
  out << "{"
      << "\"status\":" << core::QuoteJson(ToString(report.overall)) << ","
      << "\"service\":" << core::QuoteJson(kServiceName) << ","
      << "\"version\":" << core::QuoteJson(kServiceVersion) << ","
      << "\"timestamp\":" << core::QuoteJson(core::FormatUtcTimestamp(report.timestamp)) << ","
      << "\"uptime_seconds\":" << report.uptime_seconds << ","
      << "\"components\":" << ComponentsToJson(report.components) << "}";
  return out.str();
}

std::string ToJson(const BasicHealth& health) {
  std::ostringstream out;
  out << "{"
      << "\"status\":" << core::QuoteJson(ToString(health.status)) << ","
      << "\"service\":" << core::QuoteJson(kServiceName) << ","
      << "\"timestamp\":" << core::QuoteJson(core::FormatUtcTimestamp(health.timestamp)) << "}";
  return out.str();
}

std::string ToJson(const Readiness& readiness) {
  std::ostringstream out;
  out << "{"
      << "\"status\":" << core::QuoteJson(ToString(readiness.report.overall)) << ","
      << "\"ready\":" << (readiness.ready ? "true" : "false") << ","
      << "\"timestamp\":"
      << core::QuoteJson(core::FormatUtcTimestamp(readiness.report.timestamp)) << ","
      << "\"components\":" << ComponentsToJson(readiness.report.components) << "}";
  return out.str();
}

} // namespace labgate::health
