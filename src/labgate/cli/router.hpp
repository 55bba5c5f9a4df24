#pragma once

#include "core/config/settings.hpp"
#include "core/logging/logger.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace labgate::cli {

// `labgate serve` flags. Each one, when given, overrides the matching
// `LABGATE_*` environment value.
struct ServeOptions {
  std::optional<std::string> listen_host;
  std::optional<std::uint16_t> listen_port;
  std::optional<core::logging::LogLevel> log_level;
};

bool ParseServeOptions(const std::vector<std::string_view>& args, ServeOptions& options,
                       std::string& error);

void ApplyServeOptions(const ServeOptions& options, core::config::Settings& settings);

// Routes `labgate` subcommands and returns process exit codes with a stable
// contract for supervisors:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => configuration invalid (`labgate config`)
//   20 => listening socket could not be bound (`labgate serve`)
int Dispatch(int argc, char** argv);

// Same as above with an injected environment, for tests.
int Dispatch(int argc, char** argv, const core::config::EnvLookup& env);

} // namespace labgate::cli
