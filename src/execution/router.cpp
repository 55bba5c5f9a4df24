#include "execution/router.hpp"

#include "core/time_utils.hpp"
#include "execution/normalizer.hpp"

#include <chrono>
#include <utility>

namespace labgate::execution {

namespace {

template <class... Handlers> struct Overloaded : Handlers... {
  using Handlers::operator()...;
};
template <class... Handlers> Overloaded(Handlers...) -> Overloaded<Handlers...>;

std::string ResolveModel(const ExecutionRequest& request, std::string_view default_model) {
  return request.model.empty() ? std::string(default_model) : request.model;
}

} // namespace

std::string_view PathName(const ExecutionPlan& plan) {
  return std::visit(Overloaded{
                        [](const SimplePlan&) { return ToString(ExecutionType::kSimple); },
                        [](const OrchestratorPlan&) {
                          return ToString(ExecutionType::kOrchestrator);
                        },
                    },
                    plan);
}

bool BuildExecutionPlan(const ExecutionRequest& request, std::string_view default_model,
                        ExecutionPlan& plan, std::string& error) {
  switch (request.execution_type) {
  case ExecutionType::kSimple:
    plan = SimplePlan{.payload = {.prompt = request.prompt,
                                  .model = ResolveModel(request, default_model),
                                  .options = request.inference}};
    return true;
  case ExecutionType::kOrchestrator:
    plan = OrchestratorPlan{.payload = {.prompt = request.prompt,
                                        .model = ResolveModel(request, default_model),
                                        .agents = request.agents,
                                        .tools = request.tools,
                                        .options = request.orchestration}};
    return true;
  }

  error = "execution_type value " + std::to_string(static_cast<int>(request.execution_type)) +
          " has no execution path";
  return false;
}

ExecutionRouter::ExecutionRouter(const core::config::Settings& settings,
                                 upstream::IUpstreamClient& upstream,
                                 core::logging::Logger& logger, events::IEventSink& sink)
    : settings_(settings), upstream_(upstream), logger_(logger), emitter_(sink) {}

ExecutionResult ExecutionRouter::Dispatch(const ExecutionPlan& plan) const {
  return std::visit(
      Overloaded{
          [this](const SimplePlan& simple) {
            upstream::InferenceResponse response;
            upstream::UpstreamFailure failure;
            if (!upstream_.CallInference(simple.payload, response, failure)) {
              return NormalizeFailure("inference", failure);
            }
            return Normalize(response);
          },
          [this](const OrchestratorPlan& orchestrator) {
            upstream::OrchestrationResponse response;
            upstream::UpstreamFailure failure;
            if (!upstream_.CallOrchestrate(orchestrator.payload, response, failure)) {
              return NormalizeFailure("orchestration", failure);
            }
            return Normalize(response);
          },
      },
      plan);
}

bool ExecutionRouter::Route(const ExecutionRequest& request, std::string_view request_id,
                            ExecutionResult& result, std::string& error) const {
  const auto started = std::chrono::steady_clock::now();
  const std::string request_id_text(request_id);

  ExecutionPlan plan;
  if (!BuildExecutionPlan(request, settings_.default_model, plan, error)) {
    std::string event_error;
    if (!emitter_.EmitRoutingError({.ts = std::chrono::system_clock::now(),
                                    .request_id = request_id_text,
                                    .reason = error},
                                   event_error)) {
      logger_.Error("internal routing error",
                    {{"request_id", request_id}, {"error", error}, {"event_error", event_error}});
    } else {
      logger_.Error("internal routing error", {{"request_id", request_id}, {"error", error}});
    }
    return false;
  }

  const std::string path(PathName(plan));
  const std::string model = std::visit([](const auto& p) { return p.payload.model; }, plan);
  std::string started_error;
  const bool started_published =
      emitter_.EmitExecutionStarted({.ts = std::chrono::system_clock::now(),
                                     .request_id = request_id_text,
                                     .path = path,
                                     .model = model},
                                    started_error);

  result = Dispatch(plan);
  const std::chrono::milliseconds elapsed = core::ElapsedSince(started);
  ApplyMeasuredLatency(result, elapsed);
  result.id = request_id_text;
  result.timestamp = std::chrono::system_clock::now();

  std::string completed_error;
  const bool completed_published =
      emitter_.EmitExecutionCompleted({.ts = result.timestamp,
                                       .request_id = request_id_text,
                                       .path = path,
                                       .status = std::string(ToString(result.status)),
                                       .latency_ms = elapsed.count(),
                                       .flow_nodes = result.flow ? result.flow->size() : 0U},
                                      completed_error);

  const std::string latency = std::to_string(elapsed.count());
  const core::logging::LogLevel level = result.status == ExecutionStatus::kFailure
                                            ? core::logging::LogLevel::kWarn
                                            : core::logging::LogLevel::kInfo;
  if (started_published && completed_published) {
    logger_.Log(level, "execution routed",
                {{"request_id", request_id},
                 {"path", path},
                 {"status", ToString(result.status)},
                 {"latency_ms", latency}});
  } else {
    logger_.Log(level, "execution routed",
                {{"request_id", request_id},
                 {"path", path},
                 {"status", ToString(result.status)},
                 {"latency_ms", latency},
                 {"event_error", started_published ? completed_error : started_error}});
  }
  return true;
}

} // namespace labgate::execution
