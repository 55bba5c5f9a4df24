#pragma once

#include "core/config/settings.hpp"
#include "execution/model.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace labgate::execution {

// Machine-readable reason attached to every rejected `/execute` body.
enum class RejectionCode {
  kInvalidJson,
  kInvalidRequest,
  kUnsupportedExecutionType,
  kUnsupportedModel,
};

std::string_view ToStableCode(RejectionCode code);

// 400 for bodies that are not JSON at all, 422 for well-formed JSON that does
// not satisfy the request contract.
int HttpStatusFor(RejectionCode code);

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct RequestRejection {
  RejectionCode code = RejectionCode::kInvalidRequest;
  std::string message;
  std::vector<ValidationIssue> issues;
};

// Schema layer in front of the router.
//
// Contract:
// - Returns true and fills `request` when the body is a valid execution
//   request. An omitted/null `model` resolves to `settings.default_model`.
// - Returns false and fills `rejection` otherwise; every problem found is
//   listed in `rejection.issues` (paths use `$.field` notation).
// - Unknown `execution_type` values are rejected, never defaulted.
bool ParseExecutionRequest(std::string_view body, const core::config::Settings& settings,
                           ExecutionRequest& request, RequestRejection& rejection);

// `{"error":{"code":...,"message":...,"issues":[...]}}`
std::string ToJson(const RequestRejection& rejection);

} // namespace labgate::execution
