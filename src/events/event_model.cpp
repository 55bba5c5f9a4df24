#include "events/event_model.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <sstream>

namespace labgate::events {

std::string ToJson(EventType event_type) {
  switch (event_type) {
  case EventType::kExecutionStarted:
    return "execution_started";
  case EventType::kExecutionCompleted:
    return "execution_completed";
  case EventType::kExecutionRoutingError:
    return "execution_routing_error";
  }

  return "unknown";
}

std::string ToJson(const Event& event) {
  std::ostringstream out;
  out << "{"
      << "\"ts_utc\":" << core::QuoteJson(core::FormatUtcTimestamp(event.ts)) << ","
      << "\"type\":" << core::QuoteJson(ToJson(event.type)) << ","
      << "\"payload\":{";

  // std::map keeps key order stable across lines.
  bool first = true;
  for (const auto& [key, value] : event.payload) {
    if (!first) {
      out << ',';
    }
    out << core::QuoteJson(key) << ':' << core::QuoteJson(value);
    first = false;
  }

  out << "}}";
  return out.str();
}

} // namespace labgate::events
