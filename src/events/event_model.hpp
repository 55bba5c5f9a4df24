#pragma once

#include <chrono>
#include <map>
#include <string>

namespace labgate::events {

// Execution lifecycle categories published to the event sink.
enum class EventType {
  kExecutionStarted,
  kExecutionCompleted,
  kExecutionRoutingError,
};

// One event line.
//
// - `ts`: UTC timestamp when the event occurred.
// - `type`: lifecycle category.
// - `payload`: string key/value attributes (request id, path, status...).
struct Event {
  std::chrono::system_clock::time_point ts{};
  EventType type = EventType::kExecutionStarted;
  std::map<std::string, std::string> payload;
};

std::string ToJson(EventType event_type);
std::string ToJson(const Event& event);

} // namespace labgate::events
