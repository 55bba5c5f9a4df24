#include "execution/normalizer.hpp"

#include <algorithm>

namespace labgate::execution {

namespace {

constexpr std::string_view kLatencyMetric = "latency_ms";

ExecutionMetrics ToExecutionMetrics(const upstream::UpstreamMetrics& upstream_metrics) {
  ExecutionMetrics metrics;
  for (const auto& [name, value] : upstream_metrics) {
    if (name == kLatencyMetric) {
      metrics.latency_ms = value;
    } else {
      metrics.counters[name] = value;
    }
  }
  return metrics;
}

void AddCounterIfAbsent(ExecutionMetrics& metrics, const std::string& name, std::size_t value) {
  metrics.counters.emplace(name, static_cast<double>(value));
}

std::string LastNonEmptyNodeOutput(const std::vector<NodeState>& nodes) {
  const auto it = std::find_if(nodes.rbegin(), nodes.rend(),
                               [](const NodeState& node) { return !node.output.empty(); });
  return it == nodes.rend() ? std::string() : it->output;
}

} // namespace

ExecutionResult Normalize(const upstream::InferenceResponse& response) {
  ExecutionResult result;
  result.metrics = ToExecutionMetrics(response.metrics);
  result.metrics.models_used = response.models_used;

  if (upstream::ReportsFailure(response.success, response.error)) {
    result.status = ExecutionStatus::kFailure;
    if (response.error.has_value() && !response.error->empty()) {
      result.output = response.error.value();
    } else if (!response.text.empty()) {
      result.output = response.text;
    } else {
      result.output = "upstream reported failure";
    }
    return result;
  }

  result.status = ExecutionStatus::kSuccess;
  result.output = response.text;
  return result;
}

ExecutionResult Normalize(const upstream::OrchestrationResponse& response) {
  ExecutionResult result;
  result.metrics = ToExecutionMetrics(response.metrics);
  result.metrics.models_used = response.models_used;

  const std::vector<NodeState>& nodes = response.nodes;
  const auto done = static_cast<std::size_t>(std::count_if(
      nodes.begin(), nodes.end(), [](const NodeState& n) { return n.status == NodeStatus::kDone; }));
  const auto failed = static_cast<std::size_t>(
      std::count_if(nodes.begin(), nodes.end(),
                    [](const NodeState& n) { return n.status == NodeStatus::kFailed; }));
  AddCounterIfAbsent(result.metrics, "steps_total", nodes.size());
  AddCounterIfAbsent(result.metrics, "steps_done", done);
  AddCounterIfAbsent(result.metrics, "steps_failed", failed);

  if (!nodes.empty()) {
    result.flow = nodes;
  }

  const bool any_output = std::any_of(nodes.begin(), nodes.end(),
                                      [](const NodeState& n) { return !n.output.empty(); });
  const bool upstream_failed = upstream::ReportsFailure(response.success, response.error);
  if (!nodes.empty() && done == nodes.size() && !upstream_failed) {
    result.status = ExecutionStatus::kSuccess;
  } else if (any_output) {
    result.status = ExecutionStatus::kPartial;
  } else {
    result.status = ExecutionStatus::kFailure;
  }

  if (response.output.has_value() && !response.output->empty()) {
    result.output = response.output.value();
  } else {
    result.output = LastNonEmptyNodeOutput(nodes);
  }

  if (result.status == ExecutionStatus::kFailure && result.output.empty()) {
    if (response.error.has_value() && !response.error->empty()) {
      result.output = response.error.value();
    } else if (upstream_failed) {
      result.output = "upstream reported failure";
    } else if (nodes.empty()) {
      result.output = "orchestration returned no nodes";
    } else {
      result.output = "orchestration produced no output";
    }
  }
  return result;
}

ExecutionResult NormalizeFailure(std::string_view operation,
                                 const upstream::UpstreamFailure& failure) {
  ExecutionResult result;
  result.status = ExecutionStatus::kFailure;
  result.output = upstream::FormatUpstreamFailure(operation, failure);
  return result;
}

void ApplyMeasuredLatency(ExecutionResult& result, const std::chrono::milliseconds round_trip) {
  if (!result.metrics.latency_ms.has_value()) {
    result.metrics.latency_ms = static_cast<double>(round_trip.count());
  }
}

} // namespace labgate::execution
