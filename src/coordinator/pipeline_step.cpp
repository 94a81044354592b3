#include "a2a/coordinator/pipeline_step.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace a2a {

bool is_reserved_result_key(const std::string& key) {
  static const std::set<std::string> reserved = {"workflow_steps", "steps", "status", "failed_step", "error"};
  return reserved.count(key) > 0;
}

std::vector<PipelineStep> normalize_pipeline(std::vector<PipelineStep> steps) {
  std::set<std::string> taken;
  for (size_t i = 0; i < steps.size(); ++i) {
    auto& key = steps[i].result_key;
    if (!key.empty() && !is_reserved_result_key(key) && !taken.count(key)) {
      taken.insert(key);
      continue;
    }

    std::string replacement = "step_" + std::to_string(i + 1) + "_result";
    while (taken.count(replacement)) {
      replacement += "_";
    }
    if (!key.empty()) {
      spdlog::warn("[Pipeline] Step '{}': result_key '{}' is reserved or already used, using '{}'", steps[i].description, key, replacement);
    }
    key = replacement;
    taken.insert(key);
  }
  return steps;
}

json PipelineStep::to_json() const {
  return {
      {"description", description}, {"agent_url", agent_url}, {"prompt_prefix", prompt_prefix}, {"result_key", result_key}, {"timeout_ms", timeout.count()},
  };
}

PipelineStep PipelineStep::from_json(const json& j) {
  PipelineStep step;
  step.description = j.value("description", "");
  step.agent_url = j.value("agent_url", "");
  step.prompt_prefix = j.value("prompt_prefix", "");
  step.result_key = j.value("result_key", "");
  step.timeout = std::chrono::milliseconds(j.value("timeout_ms", 30000));
  return step;
}

}  // namespace a2a
