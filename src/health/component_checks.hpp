#pragma once

#include "core/config/settings.hpp"
#include "health/health_aggregator.hpp"
#include "upstream/upstream_client.hpp"

#include <memory>
#include <vector>

namespace labgate::health {

// Validates the immutable settings; a failure makes the service unavailable.
ComponentCheck MakeConfigurationCheck(const core::config::Settings& settings);

// Reachability of one upstream endpoint through `IUpstreamClient::Probe`.
// The check keeps the client alive, since a timed-out probe may still be
// running after the report was returned.
ComponentCheck MakeUpstreamCheck(std::string name, std::shared_ptr<upstream::IUpstreamClient> client,
                                 upstream::ProbeTarget target);

// configuration, upstream_inference, upstream_orchestrator.
std::vector<ComponentCheck>
BuildDefaultChecks(const core::config::Settings& settings,
                   const std::shared_ptr<upstream::IUpstreamClient>& client);

} // namespace labgate::health
