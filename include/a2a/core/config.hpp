#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "a2a/card/agent_card.hpp"
#include "a2a/coordinator/pipeline_step.hpp"
#include "a2a/task/task_store.hpp"
#include "a2a/core/types.hpp"

namespace a2a {

// Agent identity section
struct AgentConfig {
  std::string name = "A2A Agent";
  std::string description;
  std::string version = "1.0.0";
  std::vector<AgentSkill> skills;
  std::map<std::string, bool> capabilities;
  std::optional<std::string> documentation_url;
};

// HTTP listener
struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 8000;

  // Advertised card url; defaults to http://localhost:<port>/a2a/v1
  std::optional<std::string> public_url;

  size_t io_threads = 1;
  size_t handler_threads = 4;
  size_t max_body_bytes = 1024 * 1024;
};

// Task table retention
struct TaskConfig {
  int64_t retention_seconds = 3600;
  size_t max_tasks = 10000;
};

// Credential gatekeeper
struct AuthConfig {
  bool enabled = false;
  std::vector<std::string> api_keys;
  std::vector<std::string> bearer_tokens;
};

// Streaming analysis stages
struct StreamConfig {
  std::vector<std::string> stages = {
      "Analyzing patient demographics...", "Processing medical history...", "Evaluating diagnostic patterns...",
      "Generating risk assessment...",     "Finalizing recommendations...",
  };
  int64_t stage_delay_ms = 1000;
};

// Application configuration
struct Config {
  AgentConfig agent;
  ServerConfig server;
  TaskConfig tasks;
  AuthConfig auth;

  // Coordinator steps, in execution order
  std::vector<PipelineStep> pipeline;

  StreamConfig stream;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file; unreadable or malformed files yield defaults
  static Config load(const std::filesystem::path& path);

  // Applies the A2A_* environment overrides to this config
  // Reads: A2A_HOST, A2A_PORT, A2A_PUBLIC_URL, A2A_LOG_LEVEL, A2A_LOG_FILE,
  //        A2A_API_KEYS (comma separated, enables auth)
  void apply_env();

  // Save to file
  void save(const std::filesystem::path& path) const;

  std::string public_url() const;

  AgentIdentity identity() const;

  TaskStoreOptions task_options() const;
};

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();
}  // namespace config_paths

}  // namespace a2a
