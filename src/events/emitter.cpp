#include "events/emitter.hpp"

#include <utility>

namespace labgate::events {

Emitter::Emitter(IEventSink& sink) : sink_(sink) {}

bool Emitter::EmitRaw(EventType type, std::chrono::system_clock::time_point ts,
                      std::map<std::string, std::string> payload, std::string& error) const {
  Event event;
  event.ts = ts;
  event.type = type;
  event.payload = std::move(payload);
  return sink_.Publish(event, error);
}

bool Emitter::EmitExecutionStarted(const ExecutionStartedEvent& event, std::string& error) const {
  return EmitRaw(EventType::kExecutionStarted, event.ts,
                 {
                     {"request_id", event.request_id},
                     {"path", event.path},
                     {"model", event.model},
                 },
                 error);
}

bool Emitter::EmitExecutionCompleted(const ExecutionCompletedEvent& event,
                                     std::string& error) const {
  std::map<std::string, std::string> payload = {
      {"request_id", event.request_id},
      {"path", event.path},
      {"status", event.status},
      {"latency_ms", std::to_string(event.latency_ms)},
  };
  if (event.flow_nodes > 0U) {
    payload["flow_nodes"] = std::to_string(event.flow_nodes);
  }
  return EmitRaw(EventType::kExecutionCompleted, event.ts, std::move(payload), error);
}

bool Emitter::EmitRoutingError(const RoutingErrorEvent& event, std::string& error) const {
  return EmitRaw(EventType::kExecutionRoutingError, event.ts,
                 {
                     {"request_id", event.request_id},
                     {"reason", event.reason},
                 },
                 error);
}

} // namespace labgate::events
