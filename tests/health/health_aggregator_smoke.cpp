#include "core/config/settings.hpp"
#include "health/component_checks.hpp"
#include "health/health_aggregator.hpp"
#include "upstream/testing/fake_upstream_client.hpp"

#include "../common/assertions.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace health = labgate::health;
namespace up = labgate::upstream;
using labgate::tests::common::AssertContains;
using labgate::tests::common::Fail;

namespace {

health::ComponentCheck FixedCheck(std::string name, health::ComponentRole role,
                                  health::HealthStatus status) {
  return health::ComponentCheck{
      .name = std::move(name), .role = role, .run = [status]() {
        health::ComponentReport report;
        report.status = status;
        return report;
      }};
}

} // namespace

int main() {
  labgate::core::config::Settings settings;

  // All checks ok.
  {
    auto upstream = std::make_shared<up::testing::FakeUpstreamClient>();
    const health::HealthAggregator aggregator(health::BuildDefaultChecks(settings, upstream),
                                              std::chrono::milliseconds(1'000));
    const health::HealthReport report = aggregator.Detailed();
    if (report.overall != health::HealthStatus::kOk || report.components.size() != 3U) {
      Fail("healthy dependencies must report ok");
    }
    if (upstream->probe_calls() != 2U || upstream->inference_calls() != 0U ||
        upstream->orchestrate_calls() != 0U) {
      Fail("health checks must only probe, never execute");
    }
    const health::Readiness readiness = aggregator.Ready();
    if (!readiness.ready) {
      Fail("ok service must be ready");
    }
    const std::string json = health::ToJson(report);
    AssertContains(json, R"("status":"ok")");
    AssertContains(json, R"("service":"labgate")");
    AssertContains(json, R"("upstream_inference":{"status":"ok")");
    AssertContains(json, R"("uptime_seconds":)");
  }

  // Upstream down -> degraded but still ready.
  {
    auto upstream = std::make_shared<up::testing::FakeUpstreamClient>();
    up::ProbeResult down;
    down.reachable = false;
    down.detail = "Connection refused";
    upstream->SetProbeResult(up::ProbeTarget::kInference, down);
    upstream->SetProbeResult(up::ProbeTarget::kOrchestration, down);
    const health::HealthAggregator aggregator(health::BuildDefaultChecks(settings, upstream),
                                              std::chrono::milliseconds(1'000));
    const health::Readiness readiness = aggregator.Ready();
    if (readiness.report.overall != health::HealthStatus::kDegraded || !readiness.ready) {
      Fail("unreachable upstream must degrade without making the service unready");
    }
    AssertContains(health::ToJson(readiness), R"("ready":true)");
    AssertContains(health::ToJson(readiness), "Connection refused");
  }

  // Broken configuration -> unavailable and not ready.
  {
    labgate::core::config::Settings broken;
    broken.upstream_url = "ftp://lab";
    auto upstream = std::make_shared<up::testing::FakeUpstreamClient>();
    const health::HealthAggregator aggregator(health::BuildDefaultChecks(broken, upstream),
                                              std::chrono::milliseconds(1'000));
    const health::Readiness readiness = aggregator.Ready();
    if (readiness.report.overall != health::HealthStatus::kUnavailable || readiness.ready) {
      Fail("invalid configuration must make the service unavailable");
    }
    AssertContains(readiness.report.components.at("configuration").detail, "ftp");
  }

  // A slow check is cut off at the deadline; the others still report.
  {
    auto upstream = std::make_shared<up::testing::FakeUpstreamClient>();
    upstream->SetProbeDelay(std::chrono::milliseconds(2'000));
    const health::HealthAggregator aggregator(health::BuildDefaultChecks(settings, upstream),
                                              std::chrono::milliseconds(200));

    const auto started = std::chrono::steady_clock::now();
    const health::HealthReport report = aggregator.Detailed();
    const auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed > std::chrono::milliseconds(1'000)) {
      Fail("detailed health must return near the check deadline");
    }
    const health::ComponentReport& slow = report.components.at("upstream_inference");
    if (slow.status != health::HealthStatus::kUnavailable) {
      Fail("timed-out check must be unavailable");
    }
    AssertContains(slow.detail, "timed out");
    if (report.components.at("configuration").status != health::HealthStatus::kOk ||
        report.overall != health::HealthStatus::kDegraded) {
      Fail("timed-out dependency must only degrade the service");
    }
  }

  // Checks run concurrently: two 300ms checks finish well under 600ms.
  {
    std::vector<health::ComponentCheck> checks;
    for (const char* name : {"a", "b"}) {
      checks.push_back(health::ComponentCheck{
          .name = name, .role = health::ComponentRole::kDependency, .run = []() {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            health::ComponentReport report;
            report.status = health::HealthStatus::kOk;
            return report;
          }});
    }
    const health::HealthAggregator aggregator(std::move(checks), std::chrono::milliseconds(2'000));
    const auto started = std::chrono::steady_clock::now();
    const health::HealthReport report = aggregator.Detailed();
    if (std::chrono::steady_clock::now() - started > std::chrono::milliseconds(550) ||
        report.overall != health::HealthStatus::kOk) {
      Fail("checks must run concurrently");
    }
  }

  // A throwing check is reported, not propagated.
  {
    std::vector<health::ComponentCheck> checks;
    checks.push_back(FixedCheck("configuration", health::ComponentRole::kConfiguration,
                                health::HealthStatus::kOk));
    checks.push_back(health::ComponentCheck{
        .name = "flaky", .role = health::ComponentRole::kDependency, .run = []() -> health::ComponentReport {
          throw std::runtime_error("probe exploded");
        }});
    const health::HealthAggregator aggregator(std::move(checks), std::chrono::milliseconds(500));
    const health::HealthReport report = aggregator.Detailed();
    if (report.overall != health::HealthStatus::kDegraded) {
      Fail("throwing dependency check must degrade");
    }
    AssertContains(report.components.at("flaky").detail, "probe exploded");
  }

  // Basic health never runs checks.
  {
    auto upstream = std::make_shared<up::testing::FakeUpstreamClient>();
    const health::HealthAggregator aggregator(health::BuildDefaultChecks(settings, upstream),
                                              std::chrono::milliseconds(500));
    const health::BasicHealth basic = aggregator.Basic();
    if (basic.status != health::HealthStatus::kOk || upstream->probe_calls() != 0U) {
      Fail("basic health must be ok without probing");
    }
    AssertContains(health::ToJson(basic), R"("status":"ok","service":"labgate")");
  }

  // An oversized deadline is capped instead of wrapping into the past.
  {
    const health::HealthAggregator aggregator(
        {FixedCheck("configuration", health::ComponentRole::kConfiguration,
                    health::HealthStatus::kOk)},
        std::chrono::milliseconds(10'000'000'000'000));
    const health::HealthReport report = aggregator.Detailed();
    if (report.overall != health::HealthStatus::kOk ||
        report.components.at("configuration").status != health::HealthStatus::kOk) {
      Fail("a fast check must pass under an oversized timeout");
    }
  }

  std::cout << "health_aggregator_smoke: ok\n";
  return 0;
}
