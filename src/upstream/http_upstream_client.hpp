#pragma once

#include "core/config/settings.hpp"
#include "core/logging/logger.hpp"
#include "upstream/retry_policy.hpp"
#include "upstream/upstream_client.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace labgate::upstream {

// Lab Service client over plain HTTP (cpp-httplib).
//
// Every call opens its own short-lived connection, so concurrent requests
// share no connection state and the client needs no locking. Timeouts come
// from `Settings`: `connect_timeout` for establishing the connection,
// `upstream_timeout` for sending and receiving inference/orchestration calls,
// `probe_timeout` for health probes.
class HttpUpstreamClient final : public IUpstreamClient {
public:
  HttpUpstreamClient(const core::config::Settings& settings, core::logging::Logger& logger);

  HttpUpstreamClient(const HttpUpstreamClient&) = delete;
  HttpUpstreamClient& operator=(const HttpUpstreamClient&) = delete;

  bool CallInference(const InferencePayload& payload, InferenceResponse& response,
                     UpstreamFailure& failure) override;
  bool CallOrchestrate(const OrchestrationPayload& payload, OrchestrationResponse& response,
                       UpstreamFailure& failure) override;
  ProbeResult Probe(ProbeTarget target) override;

private:
  // Sends one POST with the connect-retry policy applied. Returns false with
  // `failure` filled for transport faults and non-2xx responses; on success
  // `body` holds the response body.
  bool PostJson(std::string_view operation, const std::string& path, const std::string& json,
                std::string& body, UpstreamFailure& failure);

  TransportOutcome SendOnce(const std::string& method, const std::string& path,
                            const std::string& json, std::chrono::milliseconds io_timeout) const;

  std::string ResolvePath(std::string_view endpoint_path) const;

  core::config::UpstreamEndpoint endpoint_;
  bool endpoint_valid_ = false;
  std::string endpoint_error_;
  std::chrono::milliseconds call_timeout_;
  std::chrono::milliseconds connect_timeout_;
  std::chrono::milliseconds probe_timeout_;
  std::uint32_t connect_retries_;
  core::logging::Logger& logger_;
};

} // namespace labgate::upstream
