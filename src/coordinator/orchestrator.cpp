#include "a2a/coordinator/orchestrator.hpp"

#include <spdlog/spdlog.h>

#include "a2a/bus/bus.hpp"

namespace a2a {

namespace {

// Description of a downstream task that ended in a failed terminal state
std::optional<std::string> downstream_failure(const json& result) {
  if (!result.is_object() || !result.contains("status") || !result["status"].is_object()) {
    return std::nullopt;
  }

  const auto& status = result["status"];
  auto state = task_state_from_string(status.value("state", ""));
  if (state != TaskState::Failed && state != TaskState::Rejected && state != TaskState::Canceled) {
    return std::nullopt;
  }

  std::string reason = "downstream task " + to_string(state);
  if (status.contains("message") && status["message"].is_object()) {
    try {
      auto text = Message::from_json(status["message"]).text();
      if (!text.empty()) reason += ": " + text;
    } catch (const std::exception&) {
      // Reason stays without the downstream text
    }
  }
  return reason;
}

}  // namespace

CoordinatorHandler::CoordinatorHandler(std::vector<PipelineStep> steps, DownstreamCallerPtr caller, CoordinatorOptions options)
    : steps_(normalize_pipeline(std::move(steps))), caller_(std::move(caller)), options_(std::move(options)) {}

HandlerResult CoordinatorHandler::handle(const Message& inbound, const Task& task, const HandlerContext& ctx) {
  const auto text = inbound.text();

  json workflow_steps = json::array();
  json completed = json::array();
  json aggregated = json::object();

  for (const auto& step : steps_) {
    workflow_steps.push_back(step.description);
    ctx.progress(step.description);
    spdlog::info("[Coordinator] Task {}: {} ({})", task.id, step.description, step.agent_url);

    auto outcome = run_step(step, text);
    Bus::instance().publish(events::StepFinished{task.id, step.description, outcome.ok()});

    if (outcome.failed()) {
      auto error = "Step '" + step.description + "' failed: " + *outcome.error;
      spdlog::warn("[Coordinator] Task {}: {}", task.id, error);

      json data = aggregated;
      data["workflow_steps"] = workflow_steps;
      data["steps"] = completed;
      data["failed_step"] = step.description;
      data["error"] = error;
      data["status"] = "failed";

      return HandlerResult::failure(error, Message::agent(options_.error_prefix + error, std::move(data)));
    }

    aggregated[step.result_key] = *outcome.value;
    completed.push_back({{"step", step.description}, {"agent", step.agent_url}, {"result", *outcome.value}});
  }

  json data = aggregated;
  data["workflow_steps"] = workflow_steps;
  data["steps"] = completed;
  data["status"] = "completed";

  spdlog::info("[Coordinator] Task {}: {} steps completed", task.id, steps_.size());
  return HandlerResult::success(Message::agent(options_.success_text, std::move(data)));
}

Result<json> CoordinatorHandler::run_step(const PipelineStep& step, const std::string& text) const {
  try {
    auto future = caller_->send_message(step.agent_url, Message::user(step.prompt_prefix + text), step.timeout);
    if (future.wait_for(step.timeout) != std::future_status::ready) {
      return Result<json>::failure("timed out after " + std::to_string(step.timeout.count()) + " ms");
    }

    auto response = future.get();
    if (response.failed()) {
      return Result<json>::failure(*response.error);
    }
    if (!response.value->ok()) {
      const auto& err = response.value->error();
      return Result<json>::failure("agent error " + std::to_string(err.code) + ": " + err.message);
    }

    const auto& result = response.value->result();
    if (auto reason = downstream_failure(result)) {
      return Result<json>::failure(*reason);
    }
    return Result<json>::success(result);
  } catch (const std::exception& e) {
    return Result<json>::failure(e.what());
  }
}

}  // namespace a2a
