#include "core/config/settings.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <utility>

namespace labgate::core::config {

namespace {

constexpr std::string_view kEnvUpstreamUrl = "LABGATE_UPSTREAM_URL";
constexpr std::string_view kEnvUpstreamTimeoutMs = "LABGATE_UPSTREAM_TIMEOUT_MS";
constexpr std::string_view kEnvConnectTimeoutMs = "LABGATE_CONNECT_TIMEOUT_MS";
constexpr std::string_view kEnvConnectRetries = "LABGATE_CONNECT_RETRIES";
constexpr std::string_view kEnvProbeTimeoutMs = "LABGATE_PROBE_TIMEOUT_MS";
constexpr std::string_view kEnvHealthCheckTimeoutMs = "LABGATE_HEALTH_CHECK_TIMEOUT_MS";
constexpr std::string_view kEnvAllowedModels = "LABGATE_ALLOWED_MODELS";
constexpr std::string_view kEnvDefaultModel = "LABGATE_DEFAULT_MODEL";
constexpr std::string_view kEnvListenHost = "LABGATE_LISTEN_HOST";
constexpr std::string_view kEnvListenPort = "LABGATE_LISTEN_PORT";
constexpr std::string_view kEnvWorkerThreads = "LABGATE_WORKER_THREADS";
constexpr std::string_view kEnvLogLevel = "LABGATE_LOG_LEVEL";
constexpr std::string_view kEnvEventsPath = "LABGATE_EVENTS_PATH";

std::string Trim(std::string_view raw) {
  std::size_t begin = 0;
  while (begin < raw.size() && std::isspace(static_cast<unsigned char>(raw[begin])) != 0) {
    ++begin;
  }

  std::size_t end = raw.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1])) != 0) {
    --end;
  }
  return std::string(raw.substr(begin, end - begin));
}

std::string ToLowerAscii(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool ParseUInt64(std::string_view raw, std::uint64_t& parsed) {
  if (raw.empty()) {
    return false;
  }
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  return ec == std::errc() && ptr == end;
}

std::optional<std::string> LookupTrimmed(const EnvLookup& lookup, std::string_view name) {
  const std::optional<std::string> raw = lookup(name);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  std::string trimmed = Trim(raw.value());
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

void ReadMilliseconds(const EnvLookup& lookup, std::string_view name,
                      std::chrono::milliseconds& field, std::vector<std::string>& issues) {
  const auto raw = LookupTrimmed(lookup, name);
  if (!raw.has_value()) {
    return;
  }
  std::uint64_t parsed = 0;
  if (!ParseUInt64(raw.value(), parsed)) {
    issues.push_back(std::string(name) + ": expected a non-negative integer of milliseconds, got '" +
                     raw.value() + "'");
    return;
  }
  if (parsed > static_cast<std::uint64_t>(kMaxTimeout.count())) {
    issues.push_back(std::string(name) + ": " + raw.value() + "ms exceeds the maximum of " +
                     std::to_string(kMaxTimeout.count()) + "ms");
    return;
  }
  field = std::chrono::milliseconds(static_cast<std::int64_t>(parsed));
}

template <typename UInt>
void ReadUnsigned(const EnvLookup& lookup, std::string_view name, UInt& field,
                  std::vector<std::string>& issues) {
  const auto raw = LookupTrimmed(lookup, name);
  if (!raw.has_value()) {
    return;
  }
  std::uint64_t parsed = 0;
  if (!ParseUInt64(raw.value(), parsed) ||
      parsed > static_cast<std::uint64_t>(std::numeric_limits<UInt>::max())) {
    issues.push_back(std::string(name) + ": expected an unsigned integer, got '" + raw.value() +
                     "'");
    return;
  }
  field = static_cast<UInt>(parsed);
}

std::vector<std::string> SplitModelList(std::string_view raw) {
  std::vector<std::string> models;
  std::size_t start = 0;
  while (start <= raw.size()) {
    const std::size_t comma = raw.find(',', start);
    const std::size_t stop = comma == std::string_view::npos ? raw.size() : comma;
    std::string item = Trim(raw.substr(start, stop - start));
    if (!item.empty() && std::find(models.begin(), models.end(), item) == models.end()) {
      models.push_back(std::move(item));
    }
    if (comma == std::string_view::npos) {
      break;
    }
    start = comma + 1;
  }
  return models;
}

} // namespace

bool ParseUpstreamUrl(std::string_view raw, UpstreamEndpoint& endpoint, std::string& error) {
  endpoint = UpstreamEndpoint{};
  const std::string trimmed = Trim(raw);
  if (trimmed.empty()) {
    error = "upstream URL is empty";
    return false;
  }

  const std::size_t scheme_end = trimmed.find("://");
  if (scheme_end == std::string::npos) {
    error = "upstream URL '" + trimmed + "' is missing a scheme (expected http://host[:port])";
    return false;
  }
  endpoint.scheme = ToLowerAscii(trimmed.substr(0, scheme_end));
  if (endpoint.scheme != "http") {
    error = "upstream URL scheme '" + endpoint.scheme + "' is not supported (expected http)";
    return false;
  }

  const std::string rest = trimmed.substr(scheme_end + 3);
  const std::size_t path_start = rest.find('/');
  const std::string authority = rest.substr(0, path_start);
  std::string path = path_start == std::string::npos ? std::string() : rest.substr(path_start);
  while (!path.empty() && path.back() == '/') {
    path.pop_back();
  }
  endpoint.base_path = path;

  std::string port_text;
  bool has_port = false;
  if (!authority.empty() && authority.front() == '[') {
    const std::size_t close = authority.find(']');
    if (close == std::string::npos) {
      error = "upstream URL '" + trimmed + "' has an unterminated IPv6 address";
      return false;
    }
    endpoint.host = authority.substr(1, close - 1);
    const std::string after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after.front() != ':') {
        error = "upstream URL '" + trimmed + "' has unexpected text after the IPv6 address";
        return false;
      }
      has_port = true;
      port_text = after.substr(1);
    }
  } else {
    const std::size_t colon = authority.rfind(':');
    if (colon == std::string::npos) {
      endpoint.host = authority;
    } else {
      endpoint.host = authority.substr(0, colon);
      has_port = true;
      port_text = authority.substr(colon + 1);
    }
  }

  endpoint.port = 80;
  if (has_port) {
    std::uint64_t port = 0;
    if (!ParseUInt64(port_text, port) || port == 0U || port > 65535U) {
      error = "upstream URL '" + trimmed + "' has an invalid port";
      return false;
    }
    endpoint.port = static_cast<int>(port);
  }

  if (endpoint.host.empty()) {
    error = "upstream URL '" + trimmed + "' is missing a host";
    return false;
  }
  return true;
}

bool Settings::IsModelAllowed(std::string_view model) const {
  return std::find(allowed_models.begin(), allowed_models.end(), model) != allowed_models.end();
}

std::optional<std::string> LookupProcessEnv(std::string_view name) {
  const std::string key(name);
  const char* raw = std::getenv(key.c_str());
  if (raw == nullptr) {
    return std::nullopt;
  }
  return std::string(raw);
}

Settings LoadSettings(const EnvLookup& lookup) {
  Settings settings;
  std::vector<std::string>& issues = settings.load_issues;

  if (const auto url = LookupTrimmed(lookup, kEnvUpstreamUrl); url.has_value()) {
    settings.upstream_url = url.value();
  }
  ReadMilliseconds(lookup, kEnvUpstreamTimeoutMs, settings.upstream_timeout, issues);
  ReadMilliseconds(lookup, kEnvConnectTimeoutMs, settings.connect_timeout, issues);
  ReadUnsigned(lookup, kEnvConnectRetries, settings.connect_retries, issues);
  ReadMilliseconds(lookup, kEnvProbeTimeoutMs, settings.probe_timeout, issues);
  ReadMilliseconds(lookup, kEnvHealthCheckTimeoutMs, settings.health_check_timeout, issues);

  if (const auto models = LookupTrimmed(lookup, kEnvAllowedModels); models.has_value()) {
    settings.allowed_models = SplitModelList(models.value());
  }
  if (const auto model = LookupTrimmed(lookup, kEnvDefaultModel); model.has_value()) {
    settings.default_model = model.value();
  }

  if (const auto host = LookupTrimmed(lookup, kEnvListenHost); host.has_value()) {
    settings.listen_host = host.value();
  }
  ReadUnsigned(lookup, kEnvListenPort, settings.listen_port, issues);
  ReadUnsigned(lookup, kEnvWorkerThreads, settings.worker_threads, issues);

  if (const auto level = LookupTrimmed(lookup, kEnvLogLevel); level.has_value()) {
    std::string level_error;
    if (!logging::ParseLogLevel(level.value(), settings.log_level, level_error)) {
      issues.push_back(std::string(kEnvLogLevel) + ": " + level_error);
    }
  }

  if (const auto events = LookupTrimmed(lookup, kEnvEventsPath); events.has_value()) {
    settings.events_path = std::filesystem::path(events.value());
  }

  return settings;
}

bool ValidateSettings(const Settings& settings, std::vector<std::string>& issues) {
  issues = settings.load_issues;

  UpstreamEndpoint endpoint;
  std::string url_error;
  if (!ParseUpstreamUrl(settings.upstream_url, endpoint, url_error)) {
    issues.push_back(url_error);
  }

  if (settings.upstream_timeout.count() <= 0) {
    issues.push_back("upstream timeout must be greater than zero");
  }
  if (settings.connect_timeout.count() <= 0) {
    issues.push_back("connect timeout must be greater than zero");
  }
  if (settings.probe_timeout.count() <= 0) {
    issues.push_back("probe timeout must be greater than zero");
  }
  if (settings.health_check_timeout.count() <= 0) {
    issues.push_back("health check timeout must be greater than zero");
  }
  const std::pair<std::string_view, std::chrono::milliseconds> timeouts[] = {
      {"upstream timeout", settings.upstream_timeout},
      {"connect timeout", settings.connect_timeout},
      {"probe timeout", settings.probe_timeout},
      {"health check timeout", settings.health_check_timeout},
  };
  for (const auto& [label, value] : timeouts) {
    if (value > kMaxTimeout) {
      issues.push_back(std::string(label) + " must not exceed " +
                       std::to_string(kMaxTimeout.count()) + "ms");
    }
  }
  if (settings.connect_retries > kMaxConnectRetries) {
    issues.push_back("connect retries must be 0 or " + std::to_string(kMaxConnectRetries));
  }

  if (settings.allowed_models.empty()) {
    issues.push_back("allowed model list is empty");
  } else if (!settings.IsModelAllowed(settings.default_model)) {
    issues.push_back("default model '" + settings.default_model +
                     "' is not in the allowed model list");
  }

  if (settings.listen_port == 0U) {
    issues.push_back("listen port must be between 1 and 65535");
  }
  if (settings.worker_threads == 0U) {
    issues.push_back("worker thread count must be at least 1");
  }

  return issues.empty();
}

std::string DescribeSettings(const Settings& settings) {
  std::ostringstream out;
  out << "upstream_url: " << settings.upstream_url << '\n'
      << "upstream_timeout_ms: " << settings.upstream_timeout.count() << '\n'
      << "connect_timeout_ms: " << settings.connect_timeout.count() << '\n'
      << "connect_retries: " << settings.connect_retries << '\n'
      << "probe_timeout_ms: " << settings.probe_timeout.count() << '\n'
      << "health_check_timeout_ms: " << settings.health_check_timeout.count() << '\n'
      << "allowed_models: ";
  for (std::size_t i = 0; i < settings.allowed_models.size(); ++i) {
    if (i > 0U) {
      out << ',';
    }
    out << settings.allowed_models[i];
  }
  out << '\n'
      << "default_model: " << settings.default_model << '\n'
      << "listen: " << settings.listen_host << ':' << settings.listen_port << '\n'
      << "worker_threads: " << settings.worker_threads << '\n'
      << "log_level: " << logging::ToString(settings.log_level) << '\n'
      << "events_path: "
      << (settings.events_path.has_value() ? settings.events_path->string() : std::string("-"))
      << '\n';
  return out.str();
}

} // namespace labgate::core::config
