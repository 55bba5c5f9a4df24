#pragma once

#include "events/event_model.hpp"

#include <filesystem>
#include <string>

namespace labgate::events {

// Appends one JSON-serialized event as a single line to `events_file`.
//
// Contract:
// - Creates the parent directory if needed.
// - Opens the file in append mode.
// - Writes exactly one line per call.
// - Returns false with `error` populated on failure.
bool AppendEventJsonl(const Event& event, const std::filesystem::path& events_file,
                      std::string& error);

} // namespace labgate::events
