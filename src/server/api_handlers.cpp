#include "server/api_handlers.hpp"

#include "core/json_utils.hpp"
#include "execution/request_parser.hpp"

namespace labgate::server {

namespace {

constexpr int kHttpOk = 200;
constexpr int kHttpInternalError = 500;
constexpr int kHttpServiceUnavailable = 503;

} // namespace

std::string ErrorBody(std::string_view code, std::string_view message) {
  return "{\"error\":{\"code\":" + core::QuoteJson(code) +
         ",\"message\":" + core::QuoteJson(message) + "}}";
}

ApiHandlers::ApiHandlers(const core::config::Settings& settings,
                         const execution::ExecutionRouter& router,
                         const health::HealthAggregator& health, core::logging::Logger& logger)
    : settings_(settings), router_(router), health_(health), logger_(logger) {}

HttpReply ApiHandlers::Execute(std::string_view body, std::string_view request_id) const {
  execution::ExecutionRequest request;
  execution::RequestRejection rejection;
  if (!execution::ParseExecutionRequest(body, settings_, request, rejection)) {
    const int status = execution::HttpStatusFor(rejection.code);
    logger_.Info("execution rejected",
                 {{"request_id", request_id},
                  {"code", execution::ToStableCode(rejection.code)},
                  {"status", std::to_string(status)},
                  {"issues", std::to_string(rejection.issues.size())}});
    return HttpReply{.status = status, .body = execution::ToJson(rejection)};
  }

  execution::ExecutionResult result;
  std::string error;
  if (!router_.Route(request, request_id, result, error)) {
    return HttpReply{.status = kHttpInternalError,
                     .body = ErrorBody("internal_routing_error", error)};
  }
  return HttpReply{.status = kHttpOk, .body = execution::ToJson(result)};
}

HttpReply ApiHandlers::Health() const {
  return HttpReply{.status = kHttpOk, .body = health::ToJson(health_.Basic())};
}

HttpReply ApiHandlers::DetailedHealth() const {
  const health::HealthReport report = health_.Detailed();
  logger_.Debug("detailed health computed", {{"status", health::ToString(report.overall)}});
  return HttpReply{.status = kHttpOk, .body = health::ToJson(report)};
}

HttpReply ApiHandlers::Ready() const {
  const health::Readiness readiness = health_.Ready();
  if (!readiness.ready) {
    logger_.Warn("service not ready", {{"status", health::ToString(readiness.report.overall)}});
  }
  return HttpReply{.status = readiness.ready ? kHttpOk : kHttpServiceUnavailable,
                   .body = health::ToJson(readiness)};
}

} // namespace labgate::server
