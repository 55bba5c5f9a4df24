#include "events/event_sink.hpp"

#include "events/jsonl_writer.hpp"

#include <utility>

namespace labgate::events {

bool NullEventSink::Publish(const Event& /*event*/, std::string& error) {
  error.clear();
  return true;
}

JsonlEventSink::JsonlEventSink(std::filesystem::path events_file)
    : events_file_(std::move(events_file)) {}

bool JsonlEventSink::Publish(const Event& event, std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  return AppendEventJsonl(event, events_file_, error);
}

const std::filesystem::path& JsonlEventSink::events_file() const {
  return events_file_;
}

IEventSink& NullSink() {
  static NullEventSink sink;
  return sink;
}

} // namespace labgate::events
