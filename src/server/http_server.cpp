#include "server/http_server.hpp"

#include "server/request_id.hpp"

#include <httplib.h>

#include <algorithm>
#include <atomic>
#include <string>

namespace labgate::server {

namespace {

constexpr const char* kJsonContentType = "application/json";
constexpr std::size_t kMaxRequestBodyBytes = 1024U * 1024U;
constexpr std::uint32_t kReservedHealthWorkers = 2U;
constexpr int kHttpServiceUnavailable = 503;

// Claims one execution slot for the lifetime of the guard.
class ExecutionSlot {
public:
  ExecutionSlot(std::atomic<std::uint32_t>& in_flight, const std::uint32_t limit)
      : in_flight_(in_flight) {
    acquired_ = in_flight_.fetch_add(1U) < limit;
    if (!acquired_) {
      in_flight_.fetch_sub(1U);
    }
  }
  ~ExecutionSlot() {
    if (acquired_) {
      in_flight_.fetch_sub(1U);
    }
  }

  ExecutionSlot(const ExecutionSlot&) = delete;
  ExecutionSlot& operator=(const ExecutionSlot&) = delete;

  bool acquired() const { return acquired_; }

private:
  std::atomic<std::uint32_t>& in_flight_;
  bool acquired_ = false;
};

void WriteReply(const HttpReply& reply, httplib::Response& res) {
  res.status = reply.status;
  res.set_content(reply.body, kJsonContentType);
}

} // namespace

GatewayServer::GatewayServer(ApiHandlers& handlers, core::logging::Logger& logger,
                             const std::uint32_t worker_threads)
    : handlers_(handlers),
      logger_(logger),
      server_(std::make_unique<httplib::Server>()),
      max_executions_(std::max<std::uint32_t>(worker_threads, 1U)) {
  const std::size_t pool_size = max_executions_ + kReservedHealthWorkers;
  server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };
  server_->set_payload_max_length(kMaxRequestBodyBytes);
  RegisterRoutes();
}

GatewayServer::~GatewayServer() {
  Stop();
}

void GatewayServer::RegisterRoutes() {
  server_->Post("/api/v1/execute", [this](const httplib::Request& req, httplib::Response& res) {
    const std::string request_id = ResolveRequestId(req.get_header_value(kRequestIdHeader.data()));
    res.set_header(kRequestIdHeader.data(), request_id);

    const ExecutionSlot slot(executions_in_flight_, max_executions_);
    if (!slot.acquired()) {
      logger_.Warn("execution rejected; all execution slots busy",
                   {{"request_id", request_id},
                    {"max_executions", std::to_string(max_executions_)}});
      WriteReply(HttpReply{.status = kHttpServiceUnavailable,
                           .body = ErrorBody("busy", "all " + std::to_string(max_executions_) +
                                                         " execution slots are in use; retry later")},
                 res);
      return;
    }
    WriteReply(handlers_.Execute(req.body, request_id), res);
  });

  server_->Get("/api/v1/health", [this](const httplib::Request& /*req*/, httplib::Response& res) {
    WriteReply(handlers_.Health(), res);
  });

  server_->Get("/api/v1/health/detailed",
               [this](const httplib::Request& /*req*/, httplib::Response& res) {
                 WriteReply(handlers_.DetailedHealth(), res);
               });

  server_->Get("/api/v1/ready", [this](const httplib::Request& /*req*/, httplib::Response& res) {
    WriteReply(handlers_.Ready(), res);
  });

  // Called for every response with status >= 400. Handler replies already
  // carry a JSON body; only library-generated errors (unknown route, oversized
  // body) need one.
  server_->set_error_handler([](const httplib::Request& req, httplib::Response& res) {
    if (!res.body.empty()) {
      return;
    }
    if (res.status == 404) {
      res.set_content(ErrorBody("not_found", "no route for " + req.method + " " + req.path),
                      kJsonContentType);
      return;
    }
    res.set_content(ErrorBody("http_error", "request failed with HTTP " +
                                                std::to_string(res.status)),
                    kJsonContentType);
  });
}

bool GatewayServer::Bind(const std::string& host, const int port, std::string& error) {
  if (bound_) {
    error = "server is already bound to port " + std::to_string(bound_port_);
    return false;
  }

  if (port == 0) {
    const int chosen = server_->bind_to_any_port(host);
    if (chosen < 0) {
      error = "failed to bind " + host + " on any port";
      return false;
    }
    bound_port_ = chosen;
  } else {
    if (!server_->bind_to_port(host, port)) {
      error = "failed to bind " + host + ":" + std::to_string(port);
      return false;
    }
    bound_port_ = port;
  }

  bound_ = true;
  return true;
}

bool GatewayServer::Serve(std::string& error) {
  if (!bound_) {
    error = "server must be bound before serving";
    return false;
  }

  logger_.Info("listening", {{"port", std::to_string(bound_port_)}});
  if (!server_->listen_after_bind()) {
    error = "listener on port " + std::to_string(bound_port_) + " stopped with an error";
    return false;
  }
  logger_.Info("listener stopped", {{"port", std::to_string(bound_port_)}});
  return true;
}

void GatewayServer::Stop() {
  if (server_ != nullptr) {
    server_->stop();
  }
}

bool GatewayServer::IsRunning() const {
  return server_ != nullptr && server_->is_running();
}

int GatewayServer::bound_port() const {
  return bound_port_;
}

} // namespace labgate::server
