#pragma once

#include "core/logging/logger.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace labgate::core::config {

// Parsed form of the upstream base URL, e.g. `http://lab:8001/api` ->
// {scheme=http, host=lab, port=8001, base_path=/api}. IPv6 literals use the
// bracketed form `http://[::1]:8001`; `host` holds the address without
// brackets. `base_path` never ends
// with '/', so endpoint paths can be appended directly.
struct UpstreamEndpoint {
  std::string scheme;
  std::string host;
  int port = 0;
  std::string base_path;
};

bool ParseUpstreamUrl(std::string_view raw, UpstreamEndpoint& endpoint, std::string& error);

// Upper bound for every `*_timeout` setting. Larger values overflow once
// converted to steady-clock deadlines.
constexpr std::chrono::milliseconds kMaxTimeout = std::chrono::hours(24);

// Connection-level retries are capped at one; anything beyond risks
// duplicating partially executed orchestration steps.
constexpr std::uint32_t kMaxConnectRetries = 1U;

// Process-wide settings. Built once at startup from the environment (and CLI
// overrides) and then only ever passed around by const reference.
struct Settings {
  std::string upstream_url = "http://127.0.0.1:8001";
  std::chrono::milliseconds upstream_timeout{300'000};
  std::chrono::milliseconds connect_timeout{5'000};
  std::uint32_t connect_retries = kMaxConnectRetries;
  std::chrono::milliseconds probe_timeout{5'000};
  std::chrono::milliseconds health_check_timeout{2'000};
  std::vector<std::string> allowed_models = {"mistral7b"};
  std::string default_model = "mistral7b";

  std::string listen_host = "0.0.0.0";
  std::uint16_t listen_port = 8000;
  std::uint32_t worker_threads = 16;
  logging::LogLevel log_level = logging::LogLevel::kInfo;
  std::optional<std::filesystem::path> events_path;

  // Raw values that could not be parsed. The affected field keeps its default
  // and the configuration health check reports the issue.
  std::vector<std::string> load_issues;

  bool IsModelAllowed(std::string_view model) const;
};

// Environment accessor seam so tests can feed a fixed map instead of mutating
// the process environment.
using EnvLookup = std::function<std::optional<std::string>(std::string_view name)>;

std::optional<std::string> LookupProcessEnv(std::string_view name);

// Reads every `LABGATE_*` variable. Never fails; see `Settings::load_issues`.
Settings LoadSettings(const EnvLookup& lookup);

// Returns true when the settings are safe to serve with. `issues` receives
// load issues first, then semantic validation failures.
bool ValidateSettings(const Settings& settings, std::vector<std::string>& issues);

// Multi-line `key: value` rendering for `labgate config`.
std::string DescribeSettings(const Settings& settings);

} // namespace labgate::core::config
