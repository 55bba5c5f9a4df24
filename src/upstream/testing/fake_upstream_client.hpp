#pragma once

#include "upstream/upstream_client.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

namespace labgate::upstream::testing {

// In-memory upstream used by router, health and server tests. Each call
// returns whatever was last scripted for it and counts invocations, so tests
// can assert both the outcome and that no upstream call happened at all.
class FakeUpstreamClient final : public IUpstreamClient {
public:
  FakeUpstreamClient();

  void SetInferenceResponse(InferenceResponse response);
  void SetInferenceFailure(UpstreamFailure failure);
  void SetOrchestrationResponse(OrchestrationResponse response);
  void SetOrchestrationFailure(UpstreamFailure failure);
  void SetProbeResult(ProbeTarget target, ProbeResult result);
  // Every probe sleeps this long before answering.
  void SetProbeDelay(std::chrono::milliseconds delay);
  // Every inference/orchestration call sleeps this long before answering.
  void SetCallDelay(std::chrono::milliseconds delay);

  bool CallInference(const InferencePayload& payload, InferenceResponse& response,
                     UpstreamFailure& failure) override;
  bool CallOrchestrate(const OrchestrationPayload& payload, OrchestrationResponse& response,
                       UpstreamFailure& failure) override;
  ProbeResult Probe(ProbeTarget target) override;

  std::uint32_t inference_calls() const;
  std::uint32_t orchestrate_calls() const;
  std::uint32_t probe_calls() const;
  std::optional<InferencePayload> last_inference_payload() const;
  std::optional<OrchestrationPayload> last_orchestration_payload() const;

private:
  mutable std::mutex mutex_;
  InferenceResponse inference_response_;
  std::optional<UpstreamFailure> inference_failure_;
  OrchestrationResponse orchestration_response_;
  std::optional<UpstreamFailure> orchestration_failure_;
  ProbeResult inference_probe_;
  ProbeResult orchestration_probe_;
  std::chrono::milliseconds probe_delay_{0};
  std::chrono::milliseconds call_delay_{0};
  std::optional<InferencePayload> last_inference_payload_;
  std::optional<OrchestrationPayload> last_orchestration_payload_;

  std::atomic<std::uint32_t> inference_calls_{0};
  std::atomic<std::uint32_t> orchestrate_calls_{0};
  std::atomic<std::uint32_t> probe_calls_{0};
};

} // namespace labgate::upstream::testing
