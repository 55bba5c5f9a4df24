#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"

#include <iostream>
#include <string>

using labgate::tests::common::AssertContains;
using labgate::tests::common::AssertNotContains;
using labgate::tests::common::CapturedDispatch;
using labgate::tests::common::DispatchArgs;
using labgate::tests::common::Fail;
using labgate::tests::common::MakeEnv;

namespace {

void ExpectExit(const CapturedDispatch& result, int expected, const std::string& what) {
  if (result.exit_code != expected) {
    Fail(what + ": expected exit " + std::to_string(expected) + ", got " +
         std::to_string(result.exit_code) + "\nstderr: " + result.stderr_text);
  }
}

} // namespace

int main() {
  const auto empty_env = MakeEnv({});

  {
    const CapturedDispatch result = DispatchArgs({"labgate", "version"}, empty_env);
    ExpectExit(result, 0, "version");
    AssertContains(result.stdout_text, "labgate 0.1.0");
  }

  {
    const CapturedDispatch result = DispatchArgs({"labgate", "version", "extra"}, empty_env);
    ExpectExit(result, 2, "version with arguments");
  }

  {
    const CapturedDispatch result = DispatchArgs({"labgate", "help"}, empty_env);
    ExpectExit(result, 0, "help");
    AssertContains(result.stdout_text, "labgate serve");
  }

  {
    const CapturedDispatch result = DispatchArgs({"labgate"}, empty_env);
    ExpectExit(result, 2, "no subcommand");
    AssertContains(result.stderr_text, "usage:");
  }

  {
    const CapturedDispatch result = DispatchArgs({"labgate", "launch"}, empty_env);
    ExpectExit(result, 2, "unknown subcommand");
    AssertContains(result.stderr_text, "unknown subcommand: launch");
  }

  {
    const CapturedDispatch result = DispatchArgs(
        {"labgate", "config"},
        MakeEnv({{"LABGATE_UPSTREAM_URL", "http://lab-service:8001"},
                 {"LABGATE_ALLOWED_MODELS", "mistral7b, llama3"}}));
    ExpectExit(result, 0, "valid config");
    AssertContains(result.stdout_text, "upstream_url: http://lab-service:8001");
    AssertContains(result.stdout_text, "llama3");
    AssertContains(result.stdout_text, "config: valid");
  }

  {
    const CapturedDispatch result = DispatchArgs(
        {"labgate", "config"},
        MakeEnv({{"LABGATE_UPSTREAM_URL", "ftp://lab-service"},
                 {"LABGATE_UPSTREAM_TIMEOUT_MS", "soon"}}));
    ExpectExit(result, 10, "invalid config");
    AssertContains(result.stderr_text, "config issue: LABGATE_UPSTREAM_TIMEOUT_MS");
    AssertContains(result.stderr_text, "ftp");
    AssertNotContains(result.stdout_text, "config: valid");
  }

  {
    const CapturedDispatch result =
        DispatchArgs({"labgate", "serve", "--port", "70000"}, empty_env);
    ExpectExit(result, 2, "serve with out-of-range port");
    AssertContains(result.stderr_text, "invalid port '70000'");
  }

  {
    const CapturedDispatch result =
        DispatchArgs({"labgate", "serve", "--log-level", "loud"}, empty_env);
    ExpectExit(result, 2, "serve with bad log level");
  }

  {
    const CapturedDispatch result = DispatchArgs({"labgate", "serve", "--host"}, empty_env);
    ExpectExit(result, 2, "serve with missing option value");
    AssertContains(result.stderr_text, "missing value for --host");
  }

  {
    const CapturedDispatch result =
        DispatchArgs({"labgate", "serve", "--daemon"}, empty_env);
    ExpectExit(result, 2, "serve with unknown option");
    AssertContains(result.stderr_text, "unknown option: --daemon");
  }

  {
    labgate::cli::ServeOptions options;
    std::string error;
    if (!labgate::cli::ParseServeOptions({"--host", "127.0.0.1", "--port", "9100", "--log-level",
                                          "DEBUG"},
                                         options, error)) {
      Fail("valid serve options rejected: " + error);
    }
    labgate::core::config::Settings settings;
    labgate::cli::ApplyServeOptions(options, settings);
    if (settings.listen_host != "127.0.0.1" || settings.listen_port != 9100 ||
        settings.log_level != labgate::core::logging::LogLevel::kDebug) {
      Fail("serve options must override settings");
    }
  }

  std::cout << "cli_dispatch_smoke: ok\n";
  return 0;
}
