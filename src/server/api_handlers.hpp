#pragma once

#include "core/config/settings.hpp"
#include "core/logging/logger.hpp"
#include "execution/router.hpp"
#include "health/health_aggregator.hpp"

#include <string>
#include <string_view>

namespace labgate::server {

// Transport-neutral reply; the HTTP layer copies it onto the wire.
struct HttpReply {
  int status = 200;
  std::string body;
};

// `{"error":{"code":...,"message":...}}`
std::string ErrorBody(std::string_view code, std::string_view message);

// Endpoint logic behind the HTTP routes, kept free of the HTTP library so it
// can be exercised directly.
class ApiHandlers {
public:
  ApiHandlers(const core::config::Settings& settings, const execution::ExecutionRouter& router,
              const health::HealthAggregator& health, core::logging::Logger& logger);

  ApiHandlers(const ApiHandlers&) = delete;
  ApiHandlers& operator=(const ApiHandlers&) = delete;

  // POST /api/v1/execute
  HttpReply Execute(std::string_view body, std::string_view request_id) const;
  // GET /api/v1/health
  HttpReply Health() const;
  // GET /api/v1/health/detailed
  HttpReply DetailedHealth() const;
  // GET /api/v1/ready: 200 when ready, 503 otherwise.
  HttpReply Ready() const;

private:
  const core::config::Settings& settings_;
  const execution::ExecutionRouter& router_;
  const health::HealthAggregator& health_;
  core::logging::Logger& logger_;
};

} // namespace labgate::server
