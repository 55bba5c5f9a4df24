#include "labgate/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "events/event_sink.hpp"
#include "execution/router.hpp"
#include "health/component_checks.hpp"
#include "health/health_aggregator.hpp"
#include "server/api_handlers.hpp"
#include "server/http_server.hpp"
#include "upstream/http_upstream_client.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace labgate::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitListenFailed = core::errors::ToInt(core::errors::ExitCode::kListenFailed);

constexpr auto kStopPollInterval = std::chrono::milliseconds(100);

// Set from the signal handler; polled by the serve loop's watcher thread.
std::atomic<bool> g_stop_requested{false};

void HandleStopSignal(int /*signal*/) {
  g_stop_requested.store(true);
}

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  labgate serve [--host <addr>] [--port <port>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  labgate config\n"
      << "  labgate version\n"
      << "\n"
      << "configuration is read from LABGATE_* environment variables; run\n"
      << "`labgate config` to print the effective values.\n";
}

bool ParsePort(std::string_view raw, std::uint16_t& port, std::string& error) {
  unsigned int value = 0;
  const auto [end, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
  if (ec != std::errc() || end != raw.data() + raw.size() || value == 0U || value > 65535U) {
    error = "invalid port '" + std::string(raw) + "' (expected 1..65535)";
    return false;
  }
  port = static_cast<std::uint16_t>(value);
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << health::kServiceName << ' ' << health::kServiceVersion << '\n';
  return kExitSuccess;
}

int CommandConfig(const std::vector<std::string_view>& args, const core::config::EnvLookup& env) {
  if (!args.empty()) {
    std::cerr << "error: config does not accept arguments\n";
    return kExitUsage;
  }

  const core::config::Settings settings = core::config::LoadSettings(env);
  std::cout << core::config::DescribeSettings(settings);

  std::vector<std::string> issues;
  if (!core::config::ValidateSettings(settings, issues)) {
    for (const std::string& issue : issues) {
      std::cerr << "config issue: " << issue << '\n';
    }
    return kExitConfigInvalid;
  }
  std::cout << "config: valid\n";
  return kExitSuccess;
}

int CommandServe(const std::vector<std::string_view>& args, const core::config::EnvLookup& env) {
  ServeOptions options;
  std::string error;
  if (!ParseServeOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::config::Settings settings = core::config::LoadSettings(env);
  ApplyServeOptions(options, settings);

  core::logging::Logger logger(settings.log_level, std::cerr);

  // Invalid settings do not stop the process; the configuration health check
  // reports them and readiness stays false.
  std::vector<std::string> issues;
  if (!core::config::ValidateSettings(settings, issues)) {
    for (const std::string& issue : issues) {
      logger.Warn("configuration issue", {{"issue", issue}});
    }
  }

  auto upstream_client = std::make_shared<upstream::HttpUpstreamClient>(settings, logger);

  std::unique_ptr<events::JsonlEventSink> jsonl_sink;
  events::IEventSink* sink = &events::NullSink();
  if (settings.events_path.has_value()) {
    jsonl_sink = std::make_unique<events::JsonlEventSink>(settings.events_path.value());
    sink = jsonl_sink.get();
  }

  const execution::ExecutionRouter router(settings, *upstream_client, logger, *sink);
  const health::HealthAggregator health(health::BuildDefaultChecks(settings, upstream_client),
                                        settings.health_check_timeout);
  server::ApiHandlers handlers(settings, router, health, logger);
  server::GatewayServer gateway(handlers, logger, settings.worker_threads);

  if (!gateway.Bind(settings.listen_host, settings.listen_port, error)) {
    logger.Error("listen failed", {{"error", error}});
    return kExitListenFailed;
  }

  logger.Info("labgate starting",
              {{"version", health::kServiceVersion},
               {"listen_host", settings.listen_host},
               {"listen_port", std::to_string(gateway.bound_port())},
               {"upstream_url", settings.upstream_url},
               {"worker_threads", std::to_string(settings.worker_threads)}});

  g_stop_requested.store(false);
  std::signal(SIGINT, HandleStopSignal);
  std::signal(SIGTERM, HandleStopSignal);

  std::atomic<bool> serving_done{false};
  std::thread stop_watcher([&gateway, &serving_done, &logger]() {
    while (!serving_done.load()) {
      if (g_stop_requested.load()) {
        logger.Info("stop signal received; shutting down");
        gateway.Stop();
        return;
      }
      std::this_thread::sleep_for(kStopPollInterval);
    }
  });

  const bool served = gateway.Serve(error);
  serving_done.store(true);
  stop_watcher.join();

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);

  if (!served) {
    logger.Error("server failed", {{"error", error}});
    return kExitFailure;
  }
  return kExitSuccess;
}

} // namespace

bool ParseServeOptions(const std::vector<std::string_view>& args, ServeOptions& options,
                       std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--host" || token == "--port" || token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(token);
        return false;
      }
    }

    if (token == "--host") {
      if (args[i + 1].empty()) {
        error = "--host cannot be empty";
        return false;
      }
      options.listen_host = std::string(args[i + 1]);
      ++i;
      continue;
    }
    if (token == "--port") {
      std::uint16_t port = 0;
      if (!ParsePort(args[i + 1], port, error)) {
        return false;
      }
      options.listen_port = port;
      ++i;
      continue;
    }
    if (token == "--log-level") {
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(args[i + 1], parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      ++i;
      continue;
    }

    error = "unknown option: " + std::string(token);
    return false;
  }
  return true;
}

void ApplyServeOptions(const ServeOptions& options, core::config::Settings& settings) {
  if (options.listen_host.has_value()) {
    settings.listen_host = options.listen_host.value();
  }
  if (options.listen_port.has_value()) {
    settings.listen_port = options.listen_port.value();
  }
  if (options.log_level.has_value()) {
    settings.log_level = options.log_level.value();
  }
}

int Dispatch(int argc, char** argv) {
  return Dispatch(argc, argv, core::config::LookupProcessEnv);
}

int Dispatch(int argc, char** argv, const core::config::EnvLookup& env) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "config") {
    return CommandConfig(args, env);
  }

  if (command == "serve") {
    return CommandServe(args, env);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace labgate::cli
