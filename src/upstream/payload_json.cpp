#include "upstream/upstream_client.hpp"

#include "core/json_utils.hpp"

#include <sstream>

namespace labgate::upstream {

namespace {

void AppendStringArray(std::ostringstream& out, const std::vector<std::string>& values) {
  out << '[';
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0U) {
      out << ',';
    }
    out << core::QuoteJson(values[i]);
  }
  out << ']';
}

void AppendOptionalBool(std::ostringstream& out, std::string_view key,
                        const std::optional<bool>& value) {
  if (!value.has_value()) {
    return;
  }
  out << ',' << core::QuoteJson(key) << ':' << (value.value() ? "true" : "false");
}

} // namespace

std::string ToJson(const InferencePayload& payload) {
  std::ostringstream out;
  out << "{"
      << "\"prompt\":" << core::QuoteJson(payload.prompt) << ","
      << "\"model\":" << core::QuoteJson(payload.model);
  if (payload.options.strategy.has_value()) {
    out << ",\"strategy\":" << core::QuoteJson(payload.options.strategy.value());
  }
  if (payload.options.temperature.has_value()) {
    out << ",\"temperature\":" << core::FormatJsonNumber(payload.options.temperature.value());
  }
  if (payload.options.max_tokens.has_value()) {
    out << ",\"max_tokens\":" << payload.options.max_tokens.value();
  }
  out << "}";
  return out.str();
}

std::string ToJson(const OrchestrationPayload& payload) {
  std::ostringstream out;
  out << "{"
      << "\"prompt\":" << core::QuoteJson(payload.prompt) << ","
      << "\"model\":" << core::QuoteJson(payload.model) << ","
      << "\"agents\":";
  AppendStringArray(out, payload.agents);
  out << ",\"tools\":";
  AppendStringArray(out, payload.tools);
  AppendOptionalBool(out, "verbose", payload.options.verbose);
  AppendOptionalBool(out, "enable_history", payload.options.enable_history);
  AppendOptionalBool(out, "retry_on_error", payload.options.retry_on_error);
  out << "}";
  return out.str();
}

std::string_view ToString(const ProbeTarget target) {
  switch (target) {
  case ProbeTarget::kInference:
    return "inference";
  case ProbeTarget::kOrchestration:
    return "orchestration";
  }
  return "inference";
}

bool ReportsFailure(const std::optional<bool>& success, const std::optional<std::string>& error) {
  return (success.has_value() && !success.value()) || (error.has_value() && !error->empty());
}

} // namespace labgate::upstream
