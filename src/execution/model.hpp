#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace labgate::execution {

// Request discriminant. Only these two values may ever reach the router; the
// request parser rejects everything else before dispatch.
enum class ExecutionType {
  kSimple,
  kOrchestrator,
};

std::string_view ToString(ExecutionType type);
bool ParseExecutionType(std::string_view raw, ExecutionType& type);

// Optional tuning relayed to `/inference/` when the client sets it.
struct InferenceOptions {
  std::optional<std::string> strategy;
  std::optional<double> temperature;
  std::optional<std::uint32_t> max_tokens;
};

// Optional flags relayed to `/orchestrate/` when the client sets them.
struct OrchestrationOptions {
  std::optional<bool> verbose;
  std::optional<bool> enable_history;
  std::optional<bool> retry_on_error;
};

struct ExecutionRequest {
  std::string prompt;
  std::string model;
  ExecutionType execution_type = ExecutionType::kSimple;
  std::vector<std::string> agents;
  std::vector<std::string> tools;
  InferenceOptions inference;
  OrchestrationOptions orchestration;
};

enum class ExecutionStatus {
  kSuccess,
  kPartial,
  kFailure,
};

std::string_view ToString(ExecutionStatus status);

enum class NodeStatus {
  kPending,
  kRunning,
  kDone,
  kFailed,
};

std::string_view ToString(NodeStatus status);

// Accepts the canonical names plus the upstream's legacy spellings
// (`completed` -> done, `error` -> failed).
bool ParseNodeStatus(std::string_view raw, NodeStatus& status);

// One step of an orchestrated workflow as reported by the upstream. Values are
// relayed, never rewritten; `position` is the index in the upstream list.
struct NodeState {
  std::size_t position = 0;
  std::string name;
  NodeStatus status = NodeStatus::kPending;
  std::string output;
  std::optional<std::string> id;
  std::optional<std::string> type;
  std::optional<std::string> error;
  // Upstream epoch seconds; relayed only when reported.
  std::optional<double> start_time;
  std::optional<double> end_time;
};

// `latency_ms` is the upstream-reported latency when present, otherwise the
// gateway's measured round trip. `counters` hold every other numeric metric
// by name. `models_used` is omitted from JSON when empty.
struct ExecutionMetrics {
  std::optional<double> latency_ms;
  std::map<std::string, double> counters;
  std::vector<std::string> models_used;
};

// Unified client-facing result. `flow` is only engaged for orchestrator
// executions; which upstream shape produced the result is not recorded.
struct ExecutionResult {
  std::string id;
  std::chrono::system_clock::time_point timestamp{};
  ExecutionStatus status = ExecutionStatus::kFailure;
  std::string output;
  ExecutionMetrics metrics;
  std::optional<std::vector<NodeState>> flow;
};

std::string ToJson(const NodeState& node);
std::string ToJson(const ExecutionMetrics& metrics);
std::string ToJson(const ExecutionResult& result);

} // namespace labgate::execution
