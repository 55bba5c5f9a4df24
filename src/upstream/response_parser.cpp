#include "upstream/response_parser.hpp"

#include "core/json_dom.hpp"

namespace labgate::upstream {

namespace {

using JsonValue = core::json::Value;
using core::json::FindField;
using core::json::IsArray;
using core::json::IsBool;
using core::json::IsNull;
using core::json::IsNumber;
using core::json::IsObject;
using core::json::IsString;

bool ParseRoot(std::string_view body, JsonValue& root, std::string& error) {
  std::string parse_error;
  if (!core::json::Parse(body, root, parse_error)) {
    error = "response body is not valid JSON (" + parse_error + ")";
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "response body must be a JSON object";
    return false;
  }
  return true;
}

// Numeric entries become metrics; `models_used` is the one list-valued entry.
bool ReadMetrics(const JsonValue& root, UpstreamMetrics& metrics,
                 std::vector<std::string>& models_used, std::string& error) {
  const JsonValue* field = FindField(root, "metrics");
  if (field == nullptr || IsNull(field)) {
    return true;
  }
  if (!IsObject(field)) {
    error = "field 'metrics' must be an object";
    return false;
  }
  for (const auto& [name, value] : field->object_value) {
    if (value.type == JsonValue::Type::kNumber) {
      metrics[name] = value.number_value;
    }
  }

  const JsonValue* models = FindField(*field, "models_used");
  if (models == nullptr || IsNull(models)) {
    return true;
  }
  if (!IsArray(models)) {
    error = "field 'metrics.models_used' must be an array of strings";
    return false;
  }
  for (const JsonValue& model : models->array_value) {
    if (model.type != JsonValue::Type::kString) {
      error = "field 'metrics.models_used' must be an array of strings";
      return false;
    }
    models_used.push_back(model.string_value);
  }
  return true;
}

bool ReadSuccessFlag(const JsonValue& root, std::optional<bool>& success, std::string& error) {
  const JsonValue* field = FindField(root, "success");
  if (field == nullptr || IsNull(field)) {
    return true;
  }
  if (!IsBool(field)) {
    error = "field 'success' must be a boolean";
    return false;
  }
  success = field->bool_value;
  return true;
}

bool ReadOptionalNumber(const JsonValue& object, std::string_view key,
                        std::optional<double>& out, std::string_view context,
                        std::string& error) {
  const JsonValue* field = FindField(object, key);
  if (field == nullptr || IsNull(field)) {
    return true;
  }
  if (!IsNumber(field)) {
    error = std::string(context) + "field '" + std::string(key) + "' must be a number";
    return false;
  }
  out = field->number_value;
  return true;
}

// Absent and null both mean "not reported".
bool ReadOptionalString(const JsonValue& object, std::string_view key,
                        std::optional<std::string>& out, std::string_view context,
                        std::string& error) {
  const JsonValue* field = FindField(object, key);
  if (field == nullptr || IsNull(field)) {
    return true;
  }
  if (!IsString(field)) {
    error = std::string(context) + "field '" + std::string(key) + "' must be a string";
    return false;
  }
  out = field->string_value;
  return true;
}

bool ReadNode(const JsonValue& item, std::size_t position, execution::NodeState& node,
              std::string& error) {
  const std::string context = "node[" + std::to_string(position) + "] ";
  if (item.type != JsonValue::Type::kObject) {
    error = context + "must be an object";
    return false;
  }

  node = execution::NodeState{};
  node.position = position;

  if (!ReadOptionalString(item, "id", node.id, context, error) ||
      !ReadOptionalString(item, "type", node.type, context, error) ||
      !ReadOptionalString(item, "error", node.error, context, error) ||
      !ReadOptionalNumber(item, "start_time", node.start_time, context, error) ||
      !ReadOptionalNumber(item, "end_time", node.end_time, context, error)) {
    return false;
  }

  const JsonValue* name = FindField(item, "name");
  if (IsString(name) && !name->string_value.empty()) {
    node.name = name->string_value;
  } else if (name == nullptr && node.id.has_value() && !node.id->empty()) {
    node.name = node.id.value();
  } else {
    error = context + "field 'name' must be a non-empty string";
    return false;
  }

  const JsonValue* status = FindField(item, "status");
  if (!IsString(status)) {
    error = context + "field 'status' must be a string";
    return false;
  }
  if (!execution::ParseNodeStatus(status->string_value, node.status)) {
    error = context + "has unknown status '" + status->string_value + "'";
    return false;
  }

  std::optional<std::string> output;
  if (!ReadOptionalString(item, "output", output, context, error)) {
    return false;
  }
  node.output = output.value_or("");
  return true;
}

} // namespace

bool ParseInferenceResponse(std::string_view body, InferenceResponse& response,
                            std::string& error) {
  response = InferenceResponse{};

  JsonValue root;
  if (!ParseRoot(body, root, error)) {
    return false;
  }

  if (!ReadSuccessFlag(root, response.success, error) ||
      !ReadOptionalString(root, "error", response.error, "", error) ||
      !ReadOptionalString(root, "model", response.model, "", error)) {
    return false;
  }

  const bool reports_failure = ReportsFailure(response.success, response.error);

  const JsonValue* text = FindField(root, "text");
  if (text == nullptr) {
    text = FindField(root, "output");
  }
  if (IsString(text)) {
    response.text = text->string_value;
  } else if (!reports_failure) {
    error = "field 'text' is required and must be a string";
    return false;
  }

  return ReadMetrics(root, response.metrics, response.models_used, error);
}

bool ParseOrchestrationResponse(std::string_view body, OrchestrationResponse& response,
                                std::string& error) {
  response = OrchestrationResponse{};

  JsonValue root;
  if (!ParseRoot(body, root, error)) {
    return false;
  }

  if (!ReadSuccessFlag(root, response.success, error) ||
      !ReadOptionalString(root, "output", response.output, "", error) ||
      !ReadOptionalString(root, "error", response.error, "", error)) {
    return false;
  }
  const bool reports_failure = ReportsFailure(response.success, response.error);

  const JsonValue* nodes = FindField(root, "nodes");
  if (nodes == nullptr) {
    const JsonValue* flow = FindField(root, "flow");
    if (IsObject(flow)) {
      nodes = FindField(*flow, "nodes");
    }
  }

  if (nodes == nullptr || IsNull(nodes)) {
    if (!reports_failure) {
      error = "field 'nodes' is required and must be an array";
      return false;
    }
  } else if (!IsArray(nodes)) {
    error = "field 'nodes' must be an array";
    return false;
  } else {
    response.nodes.reserve(nodes->array_value.size());
    for (std::size_t i = 0; i < nodes->array_value.size(); ++i) {
      execution::NodeState node;
      if (!ReadNode(nodes->array_value[i], i, node, error)) {
        return false;
      }
      response.nodes.push_back(std::move(node));
    }
    if (response.nodes.empty() && !reports_failure) {
      error = "field 'nodes' must not be empty";
      return false;
    }
  }

  return ReadMetrics(root, response.metrics, response.models_used, error);
}

} // namespace labgate::upstream
