#pragma once

#include "events/event_model.hpp"
#include "events/event_sink.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace labgate::events {

// Typed facade over an event sink so every execution event carries the same
// payload keys.
class Emitter {
public:
  struct ExecutionStartedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string request_id;
    std::string path;
    std::string model;
  };

  struct ExecutionCompletedEvent {
    std::chrono::system_clock::time_point ts{};
    std::string request_id;
    std::string path;
    std::string status;
    std::int64_t latency_ms = 0;
    std::size_t flow_nodes = 0;
  };

  struct RoutingErrorEvent {
    std::chrono::system_clock::time_point ts{};
    std::string request_id;
    std::string reason;
  };

  explicit Emitter(IEventSink& sink);

  bool EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
               std::map<std::string, std::string> payload, std::string& error) const;

  bool EmitExecutionStarted(const ExecutionStartedEvent& event, std::string& error) const;
  bool EmitExecutionCompleted(const ExecutionCompletedEvent& event, std::string& error) const;
  bool EmitRoutingError(const RoutingErrorEvent& event, std::string& error) const;

private:
  IEventSink& sink_;
};

} // namespace labgate::events
