#pragma once

#include "core/logging/logger.hpp"
#include "server/api_handlers.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace httplib {
class Server;
}

namespace labgate::server {

// Inbound HTTP surface. At most `worker_threads` executions run at once; the
// pool keeps extra workers beyond that so health and readiness requests are
// served while every execution slot waits on the upstream. An execution
// arriving with all slots taken is answered 503 `busy`.
class GatewayServer {
public:
  GatewayServer(ApiHandlers& handlers, core::logging::Logger& logger,
                std::uint32_t worker_threads);
  ~GatewayServer();

  GatewayServer(const GatewayServer&) = delete;
  GatewayServer& operator=(const GatewayServer&) = delete;

  // Binds the listening socket. `port == 0` picks a free port; see
  // `bound_port()`.
  bool Bind(const std::string& host, int port, std::string& error);

  // Blocks serving requests until `Stop()` is called. Requires `Bind()`.
  bool Serve(std::string& error);

  void Stop();
  bool IsRunning() const;
  int bound_port() const;

private:
  void RegisterRoutes();

  ApiHandlers& handlers_;
  core::logging::Logger& logger_;
  std::unique_ptr<httplib::Server> server_;
  std::uint32_t max_executions_;
  std::atomic<std::uint32_t> executions_in_flight_{0};
  int bound_port_ = 0;
  bool bound_ = false;
};

} // namespace labgate::server
