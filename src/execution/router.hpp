#pragma once

#include "core/config/settings.hpp"
#include "core/logging/logger.hpp"
#include "events/emitter.hpp"
#include "events/event_sink.hpp"
#include "execution/model.hpp"
#include "upstream/upstream_client.hpp"

#include <string>
#include <string_view>
#include <variant>

namespace labgate::execution {

// Single-shot path: one `/inference/` call.
struct SimplePlan {
  upstream::InferencePayload payload;
};

// Workflow path: one `/orchestrate/` call.
struct OrchestratorPlan {
  upstream::OrchestrationPayload payload;
};

// Closed set of execution paths. Adding a path means adding an alternative
// here; every visitor then fails to compile until it handles it.
using ExecutionPlan = std::variant<SimplePlan, OrchestratorPlan>;

// "simple" or "orchestrator".
std::string_view PathName(const ExecutionPlan& plan);

// Resolves the request discriminant into a plan. Returns false only when the
// discriminant holds a value outside the known set, which the request parser
// should have made impossible.
bool BuildExecutionPlan(const ExecutionRequest& request, std::string_view default_model,
                        ExecutionPlan& plan, std::string& error);

// Dispatches a validated request to the upstream and folds every upstream
// outcome into an `ExecutionResult`.
//
// Contract:
// - Returns true for every upstream outcome, including failures
//   (`result.status == failure` with a kind-specific message in `output`).
// - Returns false only for an internal routing error; `error` describes it
//   and the caller answers HTTP 500.
// - No retries happen here; the upstream client owns connect retries.
// - Writes exactly one request log entry and publishes lifecycle events. A
//   failing event sink never changes the result.
class ExecutionRouter {
public:
  ExecutionRouter(const core::config::Settings& settings, upstream::IUpstreamClient& upstream,
                  core::logging::Logger& logger,
                  events::IEventSink& sink = events::NullSink());

  ExecutionRouter(const ExecutionRouter&) = delete;
  ExecutionRouter& operator=(const ExecutionRouter&) = delete;

  bool Route(const ExecutionRequest& request, std::string_view request_id,
             ExecutionResult& result, std::string& error) const;

private:
  ExecutionResult Dispatch(const ExecutionPlan& plan) const;

  const core::config::Settings& settings_;
  upstream::IUpstreamClient& upstream_;
  core::logging::Logger& logger_;
  events::Emitter emitter_;
};

} // namespace labgate::execution
