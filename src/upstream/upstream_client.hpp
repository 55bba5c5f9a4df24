#pragma once

#include "execution/model.hpp"
#include "upstream/upstream_error.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace labgate::upstream {

// Body of `POST /inference/`.
struct InferencePayload {
  std::string prompt;
  std::string model;
  execution::InferenceOptions options;
};

// Body of `POST /orchestrate/`.
struct OrchestrationPayload {
  std::string prompt;
  std::string model;
  std::vector<std::string> agents;
  std::vector<std::string> tools;
  execution::OrchestrationOptions options;
};

std::string ToJson(const InferencePayload& payload);
std::string ToJson(const OrchestrationPayload& payload);

using UpstreamMetrics = std::map<std::string, double>;

// Flat single-shot inference result.
struct InferenceResponse {
  std::string text;
  UpstreamMetrics metrics;
  std::vector<std::string> models_used;
  std::optional<bool> success;
  std::optional<std::string> error;
  std::optional<std::string> model;
};

// Multi-node orchestration result. `nodes` keeps the upstream order and each
// node's `position` is its index in that order. `success == false` or any
// `error` marks the run as failed by the upstream.
struct OrchestrationResponse {
  std::vector<execution::NodeState> nodes;
  std::optional<std::string> output;
  UpstreamMetrics metrics;
  std::vector<std::string> models_used;
  std::optional<bool> success;
  std::optional<std::string> error;
};

// True when the upstream flagged the run as failed: `success == false` or a
// non-empty `error`. An empty `error` string counts as no error.
bool ReportsFailure(const std::optional<bool>& success, const std::optional<std::string>& error);

enum class ProbeTarget {
  kInference,
  kOrchestration,
};

std::string_view ToString(ProbeTarget target);

struct ProbeResult {
  bool reachable = false;
  std::chrono::milliseconds latency{0};
  int http_status = 0;
  std::string detail;
};

// Outbound contract with the Lab Service.
//
// Implementations must be safe to call from many request workers at once and
// must translate every transport fault into an `UpstreamFailure`; nothing is
// thrown across this boundary.
class IUpstreamClient {
public:
  virtual ~IUpstreamClient() = default;

  // `POST /inference/`. Returns false and fills `failure` on any failure.
  virtual bool CallInference(const InferencePayload& payload, InferenceResponse& response,
                             UpstreamFailure& failure) = 0;

  // `POST /orchestrate/`. Returns false and fills `failure` on any failure.
  virtual bool CallOrchestrate(const OrchestrationPayload& payload,
                               OrchestrationResponse& response, UpstreamFailure& failure) = 0;

  // Lightweight reachability check against the upstream's health paths. Never
  // triggers model loading or workflow execution.
  virtual ProbeResult Probe(ProbeTarget target) = 0;
};

} // namespace labgate::upstream
