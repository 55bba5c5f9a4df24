#include "events/jsonl_writer.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace labgate::events {

bool AppendEventJsonl(const Event& event, const fs::path& events_file, std::string& error) {
  if (events_file.empty()) {
    error = "events file path cannot be empty";
    return false;
  }

  const fs::path parent = events_file.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      error = "failed to create events directory '" + parent.string() + "': " + ec.message();
      return false;
    }
  }

  std::ofstream out_file(events_file, std::ios::binary | std::ios::app);
  if (!out_file) {
    error = "failed to open event log '" + events_file.string() + "' for append";
    return false;
  }

  out_file << ToJson(event) << '\n';
  if (!out_file) {
    error = "failed while writing event log '" + events_file.string() + "'";
    return false;
  }

  return true;
}

} // namespace labgate::events
