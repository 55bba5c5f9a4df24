#include "core/config/settings.hpp"
#include "core/logging/logger.hpp"
#include "upstream/http_upstream_client.hpp"

#include "../common/assertions.hpp"
#include "../common/fake_lab_service.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <string>

namespace up = labgate::upstream;
using labgate::tests::common::AssertContains;
using labgate::tests::common::Fail;
using labgate::tests::common::FakeLabService;

namespace {

labgate::core::config::Settings SettingsFor(const std::string& base_url) {
  labgate::core::config::Settings settings;
  settings.upstream_url = base_url;
  settings.upstream_timeout = std::chrono::milliseconds(2'000);
  settings.connect_timeout = std::chrono::milliseconds(500);
  settings.probe_timeout = std::chrono::milliseconds(500);
  return settings;
}

up::InferencePayload SamplePayload() {
  up::InferencePayload payload;
  payload.prompt = "List the first three prime numbers";
  payload.model = "mistral7b";
  payload.options.temperature = 0.5;
  return payload;
}

} // namespace

int main() {
  std::ostringstream log_out;
  labgate::core::logging::Logger logger(labgate::core::logging::LogLevel::kDebug, log_out);

  FakeLabService lab;
  lab.Start();
  const labgate::core::config::Settings settings = SettingsFor(lab.base_url());
  up::HttpUpstreamClient client(settings, logger);

  // Inference round trip.
  {
    lab.SetInferenceReply(200, R"({"text":"2, 3, 5","metrics":{"latency_ms":120}})");
    up::InferenceResponse response;
    up::UpstreamFailure failure;
    if (!client.CallInference(SamplePayload(), response, failure)) {
      Fail("inference call failed: " + up::FormatUpstreamFailure("inference", failure));
    }
    if (response.text != "2, 3, 5" || response.metrics.at("latency_ms") != 120.0) {
      Fail("inference response not parsed");
    }
    const std::string sent = lab.last_inference_body();
    AssertContains(sent, R"("prompt":"List the first three prime numbers")");
    AssertContains(sent, R"("model":"mistral7b")");
    AssertContains(sent, R"("temperature":0.5)");
  }

  // Orchestration round trip.
  {
    lab.SetOrchestrateReply(
        200, R"({"nodes":[{"name":"analyzer","status":"done","output":"a"},{"name":"executor","status":"failed"}]})");
    up::OrchestrationPayload payload;
    payload.prompt = "p";
    payload.model = "mistral7b";
    payload.agents = {"analyzer", "executor"};
    up::OrchestrationResponse response;
    up::UpstreamFailure failure;
    if (!client.CallOrchestrate(payload, response, failure)) {
      Fail("orchestration call failed: " + up::FormatUpstreamFailure("orchestration", failure));
    }
    if (response.nodes.size() != 2U || response.nodes[1].name != "executor") {
      Fail("orchestration response not parsed");
    }
    AssertContains(lab.last_orchestrate_body(), R"("agents":["analyzer","executor"])");
    AssertContains(lab.last_orchestrate_body(), R"("tools":[])");
  }

  // Non-2xx -> UpstreamError with status and body.
  {
    const int hits_before = lab.inference_hits();
    lab.SetInferenceReply(500, R"({"detail":"model crashed"})");
    up::InferenceResponse response;
    up::UpstreamFailure failure;
    if (client.CallInference(SamplePayload(), response, failure)) {
      Fail("HTTP 500 must fail the call");
    }
    if (failure.kind != up::UpstreamErrorKind::kUpstreamError || failure.http_status != 500) {
      Fail("HTTP 500 must map to UpstreamError");
    }
    AssertContains(failure.detail, "model crashed");
    if (lab.inference_hits() != hits_before + 1) {
      Fail("application errors must not be retried");
    }
  }

  // 2xx with the wrong schema -> MalformedResponse.
  {
    lab.SetInferenceReply(200, R"({"answer":"2, 3, 5"})");
    up::InferenceResponse response;
    up::UpstreamFailure failure;
    if (client.CallInference(SamplePayload(), response, failure) ||
        failure.kind != up::UpstreamErrorKind::kMalformedResponse) {
      Fail("schema mismatch must map to MalformedResponse");
    }
  }

  // Read timeout -> Unreachable, single attempt.
  {
    labgate::core::config::Settings slow_settings = SettingsFor(lab.base_url());
    slow_settings.upstream_timeout = std::chrono::milliseconds(200);
    up::HttpUpstreamClient slow_client(slow_settings, logger);
    lab.SetInferenceReply(200, R"({"text":"late"})");
    lab.SetInferenceDelay(std::chrono::milliseconds(1'000));
    const int hits_before = lab.inference_hits();

    up::InferenceResponse response;
    up::UpstreamFailure failure;
    if (slow_client.CallInference(SamplePayload(), response, failure)) {
      Fail("read timeout must fail the call");
    }
    if (failure.kind != up::UpstreamErrorKind::kUnreachable || failure.attempts != 1U) {
      Fail("read timeout must map to Unreachable without retry");
    }
    if (lab.inference_hits() != hits_before + 1) {
      Fail("read timeout must not be retried");
    }
    lab.SetInferenceDelay(std::chrono::milliseconds(0));
  }

  // Probes.
  {
    const up::ProbeResult inference = client.Probe(up::ProbeTarget::kInference);
    const up::ProbeResult orchestration = client.Probe(up::ProbeTarget::kOrchestration);
    if (!inference.reachable || inference.http_status != 200) {
      Fail("inference probe must be reachable");
    }
    if (!orchestration.reachable || orchestration.http_status != 405) {
      Fail("405 on GET /orchestrate/ must count as reachable");
    }

    lab.SetHealthStatus(503);
    const up::ProbeResult unhealthy = client.Probe(up::ProbeTarget::kInference);
    if (unhealthy.reachable) {
      Fail("HTTP 503 health must not count as reachable");
    }
    AssertContains(unhealthy.detail, "503");
    lab.SetHealthStatus(200);
  }

  lab.Stop();

  // Refused connection -> Unreachable after exactly one retry.
  {
    const int closed_port = labgate::tests::common::ReserveClosedPort();
    const labgate::core::config::Settings closed_settings =
        SettingsFor("http://127.0.0.1:" + std::to_string(closed_port));
    up::HttpUpstreamClient closed_client(closed_settings, logger);

    up::InferenceResponse response;
    up::UpstreamFailure failure;
    if (closed_client.CallInference(SamplePayload(), response, failure)) {
      Fail("refused connection must fail the call");
    }
    if (failure.kind != up::UpstreamErrorKind::kUnreachable || failure.attempts != 2U) {
      Fail("refused connection must be Unreachable after one retry");
    }
    if (closed_client.Probe(up::ProbeTarget::kInference).reachable) {
      Fail("probe against a closed port must be unreachable");
    }
  }

  AssertContains(log_out.str(), "upstream connect failed; retrying");
  std::cout << "http_upstream_client_smoke: ok\n";
  return 0;
}
