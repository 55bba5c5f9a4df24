#include "execution/model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace labgate::execution {

std::string_view ToString(const ExecutionType type) {
  switch (type) {
  case ExecutionType::kSimple:
    return "simple";
  case ExecutionType::kOrchestrator:
    return "orchestrator";
  }
  return "unknown";
}

bool ParseExecutionType(std::string_view raw, ExecutionType& type) {
  if (raw == "simple") {
    type = ExecutionType::kSimple;
    return true;
  }
  if (raw == "orchestrator") {
    type = ExecutionType::kOrchestrator;
    return true;
  }
  return false;
}

std::string_view ToString(const ExecutionStatus status) {
  switch (status) {
  case ExecutionStatus::kSuccess:
    return "success";
  case ExecutionStatus::kPartial:
    return "partial";
  case ExecutionStatus::kFailure:
    return "failure";
  }
  return "failure";
}

std::string_view ToString(const NodeStatus status) {
  switch (status) {
  case NodeStatus::kPending:
    return "pending";
  case NodeStatus::kRunning:
    return "running";
  case NodeStatus::kDone:
    return "done";
  case NodeStatus::kFailed:
    return "failed";
  }
  return "pending";
}

bool ParseNodeStatus(std::string_view raw, NodeStatus& status) {
  if (raw == "pending") {
    status = NodeStatus::kPending;
    return true;
  }
  if (raw == "running") {
    status = NodeStatus::kRunning;
    return true;
  }
  if (raw == "done" || raw == "completed") {
    status = NodeStatus::kDone;
    return true;
  }
  if (raw == "failed" || raw == "error") {
    status = NodeStatus::kFailed;
    return true;
  }
  return false;
}

std::string ToJson(const NodeState& node) {
  std::ostringstream out;
  out << "{"
      << "\"position\":" << node.position << ","
      << "\"name\":" << core::QuoteJson(node.name) << ","
      << "\"status\":" << core::QuoteJson(ToString(node.status)) << ","
      << "\"output\":" << core::QuoteJson(node.output);
  if (node.id.has_value()) {
    out << ",\"id\":" << core::QuoteJson(node.id.value());
  }
  if (node.type.has_value()) {
    out << ",\"type\":" << core::QuoteJson(node.type.value());
  }
  if (node.error.has_value()) {
    out << ",\"error\":" << core::QuoteJson(node.error.value());
  }
  if (node.start_time.has_value()) {
    out << ",\"start_time\":" << core::FormatJsonNumber(node.start_time.value());
  }
  if (node.end_time.has_value()) {
    out << ",\"end_time\":" << core::FormatJsonNumber(node.end_time.value());
  }
  out << "}";
  return out.str();
}

std::string ToJson(const ExecutionMetrics& metrics) {
  std::ostringstream out;
  out << "{";
  bool first = true;
  if (metrics.latency_ms.has_value()) {
    out << "\"latency_ms\":" << core::FormatJsonNumber(metrics.latency_ms.value());
    first = false;
  }
  for (const auto& [name, value] : metrics.counters) {
    if (name == "latency_ms") {
      continue;
    }
    if (!first) {
      out << ',';
    }
    out << core::QuoteJson(name) << ':' << core::FormatJsonNumber(value);
    first = false;
  }
  if (!metrics.models_used.empty()) {
    if (!first) {
      out << ',';
    }
    out << "\"models_used\":[";
    for (std::size_t i = 0; i < metrics.models_used.size(); ++i) {
      if (i > 0U) {
        out << ',';
      }
      out << core::QuoteJson(metrics.models_used[i]);
    }
    out << ']';
  }
  out << "}";
  return out.str();
}

std::string ToJson(const ExecutionResult& result) {
  std::ostringstream out;
  out << "{"
      << "\"status\":" << core::QuoteJson(ToString(result.status)) << ","
      << "\"output\":" << core::QuoteJson(result.output) << ","
      << "\"metrics\":" << ToJson(result.metrics);

  // Simple executions omit the key entirely rather than sending `null`.
  if (result.flow.has_value()) {
    out << ",\"flow\":[";
    for (std::size_t i = 0; i < result.flow->size(); ++i) {
      if (i > 0U) {
        out << ',';
      }
      out << ToJson(result.flow->at(i));
    }
    out << "]";
  }

  out << ",\"id\":" << core::QuoteJson(result.id)
      << ",\"timestamp\":" << core::QuoteJson(core::FormatUtcTimestamp(result.timestamp)) << "}";
  return out.str();
}

} // namespace labgate::execution
