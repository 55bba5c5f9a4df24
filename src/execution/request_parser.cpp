#include "execution/request_parser.hpp"

#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <cctype>
#include <cmath>
#include <sstream>

namespace labgate::execution {

namespace {

using JsonValue = core::json::Value;
using core::json::FindField;
using core::json::IsArray;
using core::json::IsBool;
using core::json::IsNull;
using core::json::IsNumber;
using core::json::IsString;

constexpr double kMinTemperature = 0.0;
constexpr double kMaxTemperature = 1.0;
constexpr std::uint32_t kMinMaxTokens = 16U;
constexpr std::uint32_t kMaxMaxTokens = 4096U;

void AddIssue(std::vector<ValidationIssue>& issues, std::string path, std::string message) {
  issues.push_back({.path = std::move(path), .message = std::move(message)});
}

bool IsBlank(std::string_view text) {
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
  }
  return true;
}

// Absent and explicit null are treated the same for optional fields.
bool IsAbsent(const JsonValue* field) {
  return field == nullptr || IsNull(field);
}

void ReadStringList(const JsonValue& root, std::string_view key, std::vector<std::string>& out,
                    std::vector<ValidationIssue>& issues) {
  const JsonValue* field = FindField(root, key);
  if (IsAbsent(field)) {
    return;
  }
  const std::string path = "$." + std::string(key);
  if (!IsArray(field)) {
    AddIssue(issues, path, "must be an array of strings");
    return;
  }
  for (std::size_t i = 0; i < field->array_value.size(); ++i) {
    const JsonValue& item = field->array_value[i];
    if (item.type != JsonValue::Type::kString || item.string_value.empty()) {
      AddIssue(issues, path + "[" + std::to_string(i) + "]", "must be a non-empty string");
      continue;
    }
    out.push_back(item.string_value);
  }
}

void ReadOptionalBool(const JsonValue& root, std::string_view key, std::optional<bool>& out,
                      std::vector<ValidationIssue>& issues) {
  const JsonValue* field = FindField(root, key);
  if (IsAbsent(field)) {
    return;
  }
  if (!IsBool(field)) {
    AddIssue(issues, "$." + std::string(key), "must be a boolean");
    return;
  }
  out = field->bool_value;
}

void ReadInferenceOptions(const JsonValue& root, InferenceOptions& options,
                          std::vector<ValidationIssue>& issues) {
  const JsonValue* strategy = FindField(root, "strategy");
  if (!IsAbsent(strategy)) {
    if (!IsString(strategy) || strategy->string_value.empty()) {
      AddIssue(issues, "$.strategy", "must be a non-empty string");
    } else {
      options.strategy = strategy->string_value;
    }
  }

  const JsonValue* temperature = FindField(root, "temperature");
  if (!IsAbsent(temperature)) {
    if (!IsNumber(temperature) || temperature->number_value < kMinTemperature ||
        temperature->number_value > kMaxTemperature) {
      AddIssue(issues, "$.temperature", "must be a number between 0 and 1");
    } else {
      options.temperature = temperature->number_value;
    }
  }

  const JsonValue* max_tokens = FindField(root, "max_tokens");
  if (!IsAbsent(max_tokens)) {
    const bool integral =
        IsNumber(max_tokens) && std::floor(max_tokens->number_value) == max_tokens->number_value;
    if (!integral || max_tokens->number_value < kMinMaxTokens ||
        max_tokens->number_value > kMaxMaxTokens) {
      AddIssue(issues, "$.max_tokens",
               "must be an integer between " + std::to_string(kMinMaxTokens) + " and " +
                   std::to_string(kMaxMaxTokens));
    } else {
      options.max_tokens = static_cast<std::uint32_t>(max_tokens->number_value);
    }
  }
}

} // namespace

std::string_view ToStableCode(const RejectionCode code) {
  switch (code) {
  case RejectionCode::kInvalidJson:
    return "invalid_json";
  case RejectionCode::kInvalidRequest:
    return "invalid_request";
  case RejectionCode::kUnsupportedExecutionType:
    return "unsupported_execution_type";
  case RejectionCode::kUnsupportedModel:
    return "unsupported_model";
  }
  return "invalid_request";
}

int HttpStatusFor(const RejectionCode code) {
  return code == RejectionCode::kInvalidJson ? 400 : 422;
}

bool ParseExecutionRequest(std::string_view body, const core::config::Settings& settings,
                           ExecutionRequest& request, RequestRejection& rejection) {
  request = ExecutionRequest{};
  rejection = RequestRejection{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(body, root, parse_error)) {
    rejection.code = RejectionCode::kInvalidJson;
    rejection.message = "request body is not valid JSON";
    AddIssue(rejection.issues, "$", parse_error);
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    rejection.code = RejectionCode::kInvalidRequest;
    rejection.message = "request body must be a JSON object";
    AddIssue(rejection.issues, "$", "must be an object");
    return false;
  }

  std::vector<ValidationIssue>& issues = rejection.issues;
  bool unknown_execution_type = false;
  bool unknown_model = false;

  const JsonValue* prompt = FindField(root, "prompt");
  if (IsAbsent(prompt)) {
    AddIssue(issues, "$.prompt", "is required");
  } else if (!IsString(prompt)) {
    AddIssue(issues, "$.prompt", "must be a string");
  } else if (IsBlank(prompt->string_value)) {
    AddIssue(issues, "$.prompt", "must not be empty");
  } else {
    request.prompt = prompt->string_value;
  }

  const JsonValue* execution_type = FindField(root, "execution_type");
  if (IsAbsent(execution_type)) {
    AddIssue(issues, "$.execution_type", "is required; expected simple|orchestrator");
  } else if (!IsString(execution_type)) {
    AddIssue(issues, "$.execution_type", "must be a string; expected simple|orchestrator");
  } else if (!ParseExecutionType(execution_type->string_value, request.execution_type)) {
    unknown_execution_type = true;
    AddIssue(issues, "$.execution_type",
             "unsupported value '" + execution_type->string_value +
                 "'; expected simple|orchestrator");
  }

  const JsonValue* model = FindField(root, "model");
  if (IsAbsent(model)) {
    request.model = settings.default_model;
  } else if (!IsString(model) || model->string_value.empty()) {
    AddIssue(issues, "$.model", "must be a non-empty string");
  } else if (!settings.IsModelAllowed(model->string_value)) {
    unknown_model = true;
    AddIssue(issues, "$.model", "model '" + model->string_value + "' is not allowed");
  } else {
    request.model = model->string_value;
  }

  ReadStringList(root, "agents", request.agents, issues);
  ReadStringList(root, "tools", request.tools, issues);
  ReadInferenceOptions(root, request.inference, issues);
  ReadOptionalBool(root, "verbose", request.orchestration.verbose, issues);
  ReadOptionalBool(root, "enable_history", request.orchestration.enable_history, issues);
  ReadOptionalBool(root, "retry_on_error", request.orchestration.retry_on_error, issues);

  if (issues.empty()) {
    return true;
  }

  if (unknown_execution_type) {
    rejection.code = RejectionCode::kUnsupportedExecutionType;
    rejection.message = "execution_type is not supported";
  } else if (unknown_model) {
    rejection.code = RejectionCode::kUnsupportedModel;
    rejection.message = "model is not allowed";
  } else {
    rejection.code = RejectionCode::kInvalidRequest;
    rejection.message = "request does not satisfy the execution contract";
  }
  return false;
}

std::string ToJson(const RequestRejection& rejection) {
  std::ostringstream out;
  out << "{\"error\":{"
      << "\"code\":" << core::QuoteJson(ToStableCode(rejection.code)) << ","
      << "\"message\":" << core::QuoteJson(rejection.message) << ","
      << "\"issues\":[";
  for (std::size_t i = 0; i < rejection.issues.size(); ++i) {
    if (i > 0U) {
      out << ',';
    }
    out << "{\"path\":" << core::QuoteJson(rejection.issues[i].path)
        << ",\"message\":" << core::QuoteJson(rejection.issues[i].message) << "}";
  }
  out << "]}}";
  return out.str();
}

} // namespace labgate::execution
