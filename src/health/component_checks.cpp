#include "health/component_checks.hpp"

#include <utility>

namespace labgate::health {

namespace {

std::string JoinIssues(const std::vector<std::string>& issues) {
  std::string joined;
  for (const std::string& issue : issues) {
    if (!joined.empty()) {
      joined += "; ";
    }
    joined += issue;
  }
  return joined;
}

} // namespace

ComponentCheck MakeConfigurationCheck(const core::config::Settings& settings) {
  // Settings never change after startup, so the verdict is computed once and
  // the check itself only reports it.
  std::vector<std::string> issues;
  const bool valid = core::config::ValidateSettings(settings, issues);
  ComponentReport verdict;
  verdict.status = valid ? HealthStatus::kOk : HealthStatus::kUnavailable;
  verdict.detail = JoinIssues(issues);

  return ComponentCheck{.name = "configuration",
                        .role = ComponentRole::kConfiguration,
                        .run = [verdict]() { return verdict; }};
}

ComponentCheck MakeUpstreamCheck(std::string name,
                                 std::shared_ptr<upstream::IUpstreamClient> client,
                                 const upstream::ProbeTarget target) {
  return ComponentCheck{
      .name = std::move(name),
      .role = ComponentRole::kDependency,
      .run = [client = std::move(client), target]() {
        const upstream::ProbeResult probe = client->Probe(target);
        ComponentReport report;
        report.status = probe.reachable ? HealthStatus::kOk : HealthStatus::kUnavailable;
        report.latency = probe.latency;
        report.detail = probe.detail;
        return report;
      }};
}

std::vector<ComponentCheck>
BuildDefaultChecks(const core::config::Settings& settings,
                   const std::shared_ptr<upstream::IUpstreamClient>& client) {
  std::vector<ComponentCheck> checks;
  checks.push_back(MakeConfigurationCheck(settings));
  checks.push_back(MakeUpstreamCheck("upstream_inference", client, upstream::ProbeTarget::kInference));
  checks.push_back(
      MakeUpstreamCheck("upstream_orchestrator", client, upstream::ProbeTarget::kOrchestration));
  return checks;
}

} // namespace labgate::health
