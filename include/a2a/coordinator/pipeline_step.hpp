#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "a2a/core/types.hpp"

namespace a2a {

// One downstream call of a coordinator pipeline
struct PipelineStep {
  std::string description;  // e.g. "Checking patient information..."
  std::string agent_url;    // JSON-RPC endpoint of the downstream agent
  std::string prompt_prefix;
  std::string result_key;
  std::chrono::milliseconds timeout{30000};

  json to_json() const;
  static PipelineStep from_json(const json& j);
};

// Keys the coordinator writes into its reply next to the step results
bool is_reserved_result_key(const std::string& key);

// Gives every step a distinct, non-reserved result_key. Empty, reserved or
// repeated keys become "step_<n>_result" (n counts from 1).
std::vector<PipelineStep> normalize_pipeline(std::vector<PipelineStep> steps);

}  // namespace a2a
