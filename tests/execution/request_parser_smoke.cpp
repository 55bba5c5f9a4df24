#include "core/config/settings.hpp"
#include "execution/request_parser.hpp"
#include "../common/assertions.hpp"

#include <iostream>
#include <string>

namespace exec = labgate::execution;
using labgate::tests::common::AssertContains;
using labgate::tests::common::Fail;

namespace {

exec::RequestRejection ExpectRejected(const std::string& body,
                                      const labgate::core::config::Settings& settings) {
  exec::ExecutionRequest request;
  exec::RequestRejection rejection;
  if (exec::ParseExecutionRequest(body, settings, request, rejection)) {
    Fail("expected rejection for body: " + body);
  }
  return rejection;
}

} // namespace

int main() {
  labgate::core::config::Settings settings;
  settings.allowed_models = {"mistral7b", "llama3"};
  settings.default_model = "mistral7b";

  // Simple request, model omitted -> configured default.
  {
    exec::ExecutionRequest request;
    exec::RequestRejection rejection;
    if (!exec::ParseExecutionRequest(
            R"({"prompt":"first three primes","execution_type":"simple","temperature":0.2,"max_tokens":64})",
            settings, request, rejection)) {
      Fail("valid simple request rejected: " + exec::ToJson(rejection));
    }
    if (request.execution_type != exec::ExecutionType::kSimple || request.model != "mistral7b") {
      Fail("simple request fields not populated");
    }
    if (!request.inference.temperature.has_value() || request.inference.max_tokens != 64U) {
      Fail("inference tuning fields not populated");
    }
  }

  // Orchestrator request with agents and tools.
  {
    exec::ExecutionRequest request;
    exec::RequestRejection rejection;
    if (!exec::ParseExecutionRequest(
            R"({"prompt":"p","model":"llama3","execution_type":"orchestrator","agents":["analyzer","executor"],"tools":["search"],"verbose":true})",
            settings, request, rejection)) {
      Fail("valid orchestrator request rejected: " + exec::ToJson(rejection));
    }
    if (request.agents.size() != 2U || request.tools.size() != 1U || request.model != "llama3" ||
        request.orchestration.verbose != true) {
      Fail("orchestrator request fields not populated");
    }
  }

  {
    const exec::RequestRejection rejection = ExpectRejected("{not json", settings);
    if (rejection.code != exec::RejectionCode::kInvalidJson || exec::HttpStatusFor(rejection.code) != 400) {
      Fail("malformed body must map to invalid_json/400");
    }
  }

  {
    const exec::RequestRejection rejection =
        ExpectRejected(R"({"prompt":"p","execution_type":"challenge"})", settings);
    if (rejection.code != exec::RejectionCode::kUnsupportedExecutionType ||
        exec::HttpStatusFor(rejection.code) != 422) {
      Fail("unknown execution_type must map to unsupported_execution_type/422");
    }
    AssertContains(exec::ToJson(rejection), R"("code":"unsupported_execution_type")");
    AssertContains(exec::ToJson(rejection), R"("path":"$.execution_type")");
  }

  {
    const exec::RequestRejection rejection = ExpectRejected(R"({"prompt":"p"})", settings);
    if (rejection.code != exec::RejectionCode::kInvalidRequest) {
      Fail("missing execution_type must be invalid_request");
    }
  }

  {
    const exec::RequestRejection rejection =
        ExpectRejected(R"({"prompt":"p","execution_type":"simple","model":"gpt-4"})", settings);
    if (rejection.code != exec::RejectionCode::kUnsupportedModel) {
      Fail("disallowed model must be unsupported_model");
    }
  }

  // Every issue is listed; the execution_type code wins over the others.
  {
    const exec::RequestRejection rejection = ExpectRejected(
        R"({"prompt":"   ","execution_type":"batch","model":"gpt-4","agents":"all","max_tokens":8})",
        settings);
    if (rejection.code != exec::RejectionCode::kUnsupportedExecutionType) {
      Fail("execution_type rejection must take priority");
    }
    if (rejection.issues.size() != 5U) {
      Fail("expected five issues, got " + std::to_string(rejection.issues.size()));
    }
    const std::string json = exec::ToJson(rejection);
    AssertContains(json, R"("path":"$.prompt")");
    AssertContains(json, R"("path":"$.model")");
    AssertContains(json, R"("path":"$.agents")");
    AssertContains(json, R"("path":"$.max_tokens")");
  }

  {
    const exec::RequestRejection rejection = ExpectRejected(R"(["simple"])", settings);
    if (rejection.code != exec::RejectionCode::kInvalidRequest) {
      Fail("non-object body must be invalid_request");
    }
  }

  std::cout << "request_parser_smoke: ok\n";
  return 0;
}
