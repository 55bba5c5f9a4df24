#pragma once

#include "execution/model.hpp"
#include "upstream/upstream_client.hpp"

#include <chrono>
#include <string_view>

namespace labgate::execution {

// Maps the flat inference response into a result without `flow`. Status is
// success unless the upstream reports `success: false` or an error.
ExecutionResult Normalize(const upstream::InferenceResponse& response);

// Maps the multi-node orchestration response into a result whose `flow`
// mirrors the upstream node order.
//   success: every node is done (and no upstream error)
//   partial: otherwise, when at least one node produced output
//   failure: otherwise, including an empty node list
ExecutionResult Normalize(const upstream::OrchestrationResponse& response);

// Result for a call that never produced a usable response.
ExecutionResult NormalizeFailure(std::string_view operation,
                                 const upstream::UpstreamFailure& failure);

// Fills `metrics.latency_ms` with the gateway round trip when the upstream
// did not report one.
void ApplyMeasuredLatency(ExecutionResult& result, std::chrono::milliseconds round_trip);

} // namespace labgate::execution
