#ifndef LABGATE_TESTS_COMMON_FAKE_LAB_SERVICE_HPP_
#define LABGATE_TESTS_COMMON_FAKE_LAB_SERVICE_HPP_

#include "assertions.hpp"

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace labgate::tests::common {

// In-process stand-in for the Lab Service on a loopback port. Replies are
// scripted per endpoint; hit counters let tests assert which endpoints the
// gateway actually called.
class FakeLabService {
public:
  struct Reply {
    int status = 200;
    std::string body;
  };

  FakeLabService() {
    server_.Post("/inference/", [this](const httplib::Request& req, httplib::Response& res) {
      ++inference_hits_;
      Reply reply;
      std::chrono::milliseconds delay{0};
      {
        std::lock_guard<std::mutex> lock(mutex_);
        last_inference_body_ = req.body;
        reply = inference_reply_;
        delay = inference_delay_;
      }
      if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
      }
      res.status = reply.status;
      res.set_content(reply.body, "application/json");
    });
    server_.Post("/orchestrate/", [this](const httplib::Request& req, httplib::Response& res) {
      ++orchestrate_hits_;
      Reply reply;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        last_orchestrate_body_ = req.body;
        reply = orchestrate_reply_;
      }
      res.status = reply.status;
      res.set_content(reply.body, "application/json");
    });
    server_.Get("/orchestrate/", [this](const httplib::Request& /*req*/, httplib::Response& res) {
      ++probe_hits_;
      res.status = 405;
      res.set_content("{\"detail\":\"Method Not Allowed\"}", "application/json");
    });
    server_.Get("/health", [this](const httplib::Request& /*req*/, httplib::Response& res) {
      ++probe_hits_;
      std::lock_guard<std::mutex> lock(mutex_);
      res.status = health_status_;
      res.set_content("{\"status\":\"healthy\"}", "application/json");
    });
  }

  ~FakeLabService() { Stop(); }

  FakeLabService(const FakeLabService&) = delete;
  FakeLabService& operator=(const FakeLabService&) = delete;

  void Start() {
    port_ = server_.bind_to_any_port("127.0.0.1");
    if (port_ <= 0) {
      Fail("fake lab service could not bind a loopback port");
    }
    thread_ = std::thread([this]() { server_.listen_after_bind(); });
    for (int i = 0; i < 200 && !server_.is_running(); ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (!server_.is_running()) {
      Fail("fake lab service did not start");
    }
  }

  void Stop() {
    server_.stop();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  int port() const { return port_; }
  std::string base_url() const { return "http://127.0.0.1:" + std::to_string(port_); }

  void SetInferenceReply(int status, std::string body) {
    std::lock_guard<std::mutex> lock(mutex_);
    inference_reply_ = Reply{.status = status, .body = std::move(body)};
  }

  void SetOrchestrateReply(int status, std::string body) {
    std::lock_guard<std::mutex> lock(mutex_);
    orchestrate_reply_ = Reply{.status = status, .body = std::move(body)};
  }

  void SetInferenceDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    inference_delay_ = delay;
  }

  void SetHealthStatus(int status) {
    std::lock_guard<std::mutex> lock(mutex_);
    health_status_ = status;
  }

  int inference_hits() const { return inference_hits_.load(); }
  int orchestrate_hits() const { return orchestrate_hits_.load(); }
  int probe_hits() const { return probe_hits_.load(); }

  std::string last_inference_body() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_inference_body_;
  }

  std::string last_orchestrate_body() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_orchestrate_body_;
  }

private:
  httplib::Server server_;
  std::thread thread_;
  int port_ = 0;

  mutable std::mutex mutex_;
  Reply inference_reply_{.status = 200, .body = R"({"text":"ok","metrics":{"latency_ms":12}})"};
  Reply orchestrate_reply_{
      .status = 200,
      .body = R"({"nodes":[{"name":"executor","status":"done","output":"ok"}]})"};
  std::chrono::milliseconds inference_delay_{0};
  int health_status_ = 200;
  std::string last_inference_body_;
  std::string last_orchestrate_body_;

  std::atomic<int> inference_hits_{0};
  std::atomic<int> orchestrate_hits_{0};
  std::atomic<int> probe_hits_{0};
};

// Returns a loopback port with nothing listening on it: the port is bound
// once to learn a free number, then released.
inline int ReserveClosedPort() {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    Fail("could not create probe socket");
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  socklen_t len = sizeof(addr);
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
      ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    ::close(fd);
    Fail("could not reserve a loopback port");
  }
  ::close(fd);
  return ntohs(addr.sin_port);
}

} // namespace labgate::tests::common

#endif // LABGATE_TESTS_COMMON_FAKE_LAB_SERVICE_HPP_
