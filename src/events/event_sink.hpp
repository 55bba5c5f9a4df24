#pragma once

#include "events/event_model.hpp"

#include <filesystem>
#include <mutex>
#include <string>

namespace labgate::events {

// Narrow fan-out boundary for execution events. Implementations serialize
// their own writes; callers may publish from any request worker.
class IEventSink {
public:
  virtual ~IEventSink() = default;

  virtual bool Publish(const Event& event, std::string& error) = 0;
};

class NullEventSink final : public IEventSink {
public:
  bool Publish(const Event& event, std::string& error) override;
};

// Appends every event to one JSONL file.
class JsonlEventSink final : public IEventSink {
public:
  explicit JsonlEventSink(std::filesystem::path events_file);

  bool Publish(const Event& event, std::string& error) override;

  const std::filesystem::path& events_file() const;

private:
  std::filesystem::path events_file_;
  std::mutex mutex_;
};

// Process-wide no-op sink used when no events path is configured.
IEventSink& NullSink();

} // namespace labgate::events
