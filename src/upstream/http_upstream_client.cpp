#include "upstream/http_upstream_client.hpp"

#include "core/time_utils.hpp"
#include "upstream/response_parser.hpp"

#include <httplib.h>

#include <algorithm>
#include <ctime>

namespace labgate::upstream {

namespace {

constexpr std::string_view kInferencePath = "/inference/";
constexpr std::string_view kOrchestratePath = "/orchestrate/";
constexpr std::string_view kInferenceHealthPath = "/health";
constexpr std::size_t kMaxErrorBodyChars = 512U;
constexpr int kHttpMethodNotAllowed = 405;

bool IsSuccessStatus(const int status) {
  return status >= 200 && status < 300;
}

TransportFault MapHttplibError(const httplib::Error error) {
  switch (error) {
  case httplib::Error::Success:
    return TransportFault::kNone;
  case httplib::Error::Connection:
  case httplib::Error::BindIPAddress:
    return TransportFault::kConnectFailed;
  case httplib::Error::Read:
    return TransportFault::kReadFailed;
  case httplib::Error::Write:
    return TransportFault::kWriteFailed;
  default:
    return TransportFault::kOther;
  }
}

struct TimeoutParts {
  std::time_t seconds = 0;
  std::time_t microseconds = 0;
};

TimeoutParts SplitTimeout(const std::chrono::milliseconds timeout) {
  const auto millis = std::max<std::int64_t>(timeout.count(), 1);
  return {.seconds = static_cast<std::time_t>(millis / 1000),
          .microseconds = static_cast<std::time_t>((millis % 1000) * 1000)};
}

std::string TruncateForDetail(const std::string& body) {
  if (body.size() <= kMaxErrorBodyChars) {
    return body;
  }
  return body.substr(0, kMaxErrorBodyChars) + "...";
}

} // namespace

HttpUpstreamClient::HttpUpstreamClient(const core::config::Settings& settings,
                                       core::logging::Logger& logger)
    : call_timeout_(std::min(settings.upstream_timeout, core::config::kMaxTimeout)),
      connect_timeout_(std::min(settings.connect_timeout, core::config::kMaxTimeout)),
      probe_timeout_(std::min(settings.probe_timeout, core::config::kMaxTimeout)),
      connect_retries_(std::min(settings.connect_retries, core::config::kMaxConnectRetries)),
      logger_(logger) {
  endpoint_valid_ =
      core::config::ParseUpstreamUrl(settings.upstream_url, endpoint_, endpoint_error_);
}

std::string HttpUpstreamClient::ResolvePath(std::string_view endpoint_path) const {
  return endpoint_.base_path + std::string(endpoint_path);
}

TransportOutcome HttpUpstreamClient::SendOnce(const std::string& method, const std::string& path,
                                              const std::string& json,
                                              const std::chrono::milliseconds io_timeout) const {
  TransportOutcome outcome;
  if (!endpoint_valid_) {
    outcome.fault = TransportFault::kOther;
    outcome.detail = "invalid upstream URL: " + endpoint_error_;
    return outcome;
  }

  httplib::Client client(endpoint_.host, endpoint_.port);
  const TimeoutParts connect = SplitTimeout(std::min(connect_timeout_, io_timeout));
  const TimeoutParts io = SplitTimeout(io_timeout);
  client.set_connection_timeout(connect.seconds, connect.microseconds);
  client.set_read_timeout(io.seconds, io.microseconds);
  client.set_write_timeout(io.seconds, io.microseconds);

  httplib::Result result =
      method == "POST" ? client.Post(path, json, "application/json") : client.Get(path);
  if (!result) {
    const httplib::Error error = result.error();
    outcome.fault = MapHttplibError(error);
    outcome.detail = httplib::to_string(error) + " (" + method + " " + path + ")";
    return outcome;
  }

  outcome.http_status = result->status;
  outcome.body = result->body;
  return outcome;
}

bool HttpUpstreamClient::PostJson(std::string_view operation, const std::string& path,
                                  const std::string& json, std::string& body,
                                  UpstreamFailure& failure) {
  logger_.Debug("upstream call started", {{"operation", operation}, {"path", path}});

  const RetriedOutcome retried = ExecuteWithConnectRetry(
      [&]() { return SendOnce("POST", path, json, call_timeout_); }, connect_retries_, operation,
      logger_);
  const TransportOutcome& outcome = retried.outcome;

  if (outcome.fault != TransportFault::kNone) {
    failure = UpstreamFailure{.kind = UpstreamErrorKind::kUnreachable,
                              .http_status = 0,
                              .detail = outcome.detail,
                              .attempts = retried.attempts};
    return false;
  }

  if (!IsSuccessStatus(outcome.http_status)) {
    failure = UpstreamFailure{.kind = UpstreamErrorKind::kUpstreamError,
                              .http_status = outcome.http_status,
                              .detail = TruncateForDetail(outcome.body),
                              .attempts = retried.attempts};
    return false;
  }

  body = outcome.body;
  return true;
}

bool HttpUpstreamClient::CallInference(const InferencePayload& payload,
                                       InferenceResponse& response, UpstreamFailure& failure) {
  std::string body;
  if (!PostJson("inference", ResolvePath(kInferencePath), ToJson(payload), body, failure)) {
    return false;
  }

  std::string parse_error;
  if (!ParseInferenceResponse(body, response, parse_error)) {
    failure = UpstreamFailure{.kind = UpstreamErrorKind::kMalformedResponse,
                              .http_status = 0,
                              .detail = parse_error,
                              .attempts = 1};
    return false;
  }
  return true;
}

bool HttpUpstreamClient::CallOrchestrate(const OrchestrationPayload& payload,
                                         OrchestrationResponse& response,
                                         UpstreamFailure& failure) {
  std::string body;
  if (!PostJson("orchestration", ResolvePath(kOrchestratePath), ToJson(payload), body, failure)) {
    return false;
  }

  std::string parse_error;
  if (!ParseOrchestrationResponse(body, response, parse_error)) {
    failure = UpstreamFailure{.kind = UpstreamErrorKind::kMalformedResponse,
                              .http_status = 0,
                              .detail = parse_error,
                              .attempts = 1};
    return false;
  }
  return true;
}

ProbeResult HttpUpstreamClient::Probe(const ProbeTarget target) {
  const std::string path = ResolvePath(
      target == ProbeTarget::kInference ? kInferenceHealthPath : kOrchestratePath);

  const auto started = std::chrono::steady_clock::now();
  const TransportOutcome outcome = SendOnce("GET", path, "", probe_timeout_);

  ProbeResult probe;
  probe.latency = core::ElapsedSince(started);
  probe.http_status = outcome.http_status;

  if (outcome.fault != TransportFault::kNone) {
    probe.detail = outcome.detail;
    return probe;
  }

  // GET on the orchestration endpoint answers 405 when only POST is routed;
  // that still proves the endpoint is up.
  probe.reachable = IsSuccessStatus(outcome.http_status) ||
                    (target == ProbeTarget::kOrchestration &&
                     outcome.http_status == kHttpMethodNotAllowed);
  if (!probe.reachable) {
    probe.detail = "GET " + path + " answered HTTP " + std::to_string(outcome.http_status);
  }
  return probe;
}

} // namespace labgate::upstream
