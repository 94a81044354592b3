#include "a2a/core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace a2a {

namespace fs = std::filesystem;

namespace {

std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> out;
  std::istringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item.erase(0, item.find_first_not_of(" \t"));
    item.erase(item.find_last_not_of(" \t") + 1);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

std::vector<std::string> string_list(const json& j, const char* key) {
  std::vector<std::string> out;
  if (j.contains(key) && j[key].is_array()) {
    for (const auto& item : j[key]) {
      if (item.is_string()) out.push_back(item.get<std::string>());
    }
  }
  return out;
}

}  // namespace

Config Config::load(const fs::path& path) {
  Config config;

  if (!fs::exists(path)) {
    spdlog::debug("[Config] {} not found, using defaults", path.string());
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("[Config] Cannot open {}, using defaults", path.string());
    return config;
  }

  try {
    json j = json::parse(file);

    // Agent identity
    if (j.contains("agent")) {
      const auto& a = j["agent"];
      config.agent.name = a.value("name", config.agent.name);
      config.agent.description = a.value("description", "");
      config.agent.version = a.value("version", config.agent.version);
      if (a.contains("skills")) {
        for (const auto& skill_json : a["skills"]) {
          config.agent.skills.push_back(AgentSkill::from_json(skill_json));
        }
      }
      if (a.contains("capabilities")) {
        for (auto& [key, value] : a["capabilities"].items()) {
          config.agent.capabilities[key] = value.get<bool>();
        }
      }
      if (a.contains("documentation_url")) {
        config.agent.documentation_url = a["documentation_url"].get<std::string>();
      }
    }

    // Server
    if (j.contains("server")) {
      const auto& s = j["server"];
      config.server.host = s.value("host", config.server.host);
      config.server.port = s.value("port", config.server.port);
      if (s.contains("public_url")) {
        config.server.public_url = s["public_url"].get<std::string>();
      }
      config.server.io_threads = s.value("io_threads", config.server.io_threads);
      config.server.handler_threads = s.value("handler_threads", config.server.handler_threads);
      config.server.max_body_bytes = s.value("max_body_bytes", config.server.max_body_bytes);
    }

    // Task retention
    if (j.contains("tasks")) {
      const auto& t = j["tasks"];
      config.tasks.retention_seconds = t.value("retention_seconds", config.tasks.retention_seconds);
      config.tasks.max_tasks = t.value("max_tasks", config.tasks.max_tasks);
    }

    // Auth
    if (j.contains("auth")) {
      const auto& a = j["auth"];
      config.auth.enabled = a.value("enabled", false);
      config.auth.api_keys = string_list(a, "api_keys");
      config.auth.bearer_tokens = string_list(a, "bearer_tokens");
    }

    // Coordinator pipeline
    if (j.contains("pipeline")) {
      for (const auto& step_json : j["pipeline"]) {
        config.pipeline.push_back(PipelineStep::from_json(step_json));
      }
      config.pipeline = normalize_pipeline(std::move(config.pipeline));
    }

    // Streaming
    if (j.contains("stream")) {
      const auto& s = j["stream"];
      if (s.contains("stages")) {
        config.stream.stages = string_list(s, "stages");
      }
      config.stream.stage_delay_ms = s.value("stage_delay_ms", config.stream.stage_delay_ms);
    }

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }

  } catch (const std::exception& e) {
    spdlog::warn("[Config] Failed to parse {}: {}, using defaults", path.string(), e.what());
    return Config{};
  }

  return config;
}

void Config::apply_env() {
  if (const char* host = std::getenv("A2A_HOST")) {
    server.host = host;
  }

  if (const char* port = std::getenv("A2A_PORT")) {
    try {
      auto value = std::stoi(port);
      if (value < 0 || value > 65535) throw std::out_of_range("port");
      server.port = static_cast<uint16_t>(value);
    } catch (const std::exception&) {
      spdlog::warn("[Config] Ignoring invalid A2A_PORT={}", port);
    }
  }

  if (const char* url = std::getenv("A2A_PUBLIC_URL")) {
    server.public_url = url;
  }

  if (const char* level = std::getenv("A2A_LOG_LEVEL")) {
    log_level = level;
  }

  if (const char* file = std::getenv("A2A_LOG_FILE")) {
    log_file = file;
  }

  if (const char* keys = std::getenv("A2A_API_KEYS")) {
    auto list = split_list(keys);
    if (!list.empty()) {
      auth.enabled = true;
      auth.api_keys = std::move(list);
    }
  }
}

void Config::save(const fs::path& path) const {
  json j;

  // Agent identity
  json a;
  a["name"] = agent.name;
  a["description"] = agent.description;
  a["version"] = agent.version;
  json skills_json = json::array();
  for (const auto& skill : agent.skills) {
    skills_json.push_back(skill.to_json());
  }
  a["skills"] = skills_json;
  a["capabilities"] = agent.capabilities;
  if (agent.documentation_url) {
    a["documentation_url"] = *agent.documentation_url;
  }
  j["agent"] = a;

  // Server
  json s;
  s["host"] = server.host;
  s["port"] = server.port;
  if (server.public_url) {
    s["public_url"] = *server.public_url;
  }
  s["io_threads"] = server.io_threads;
  s["handler_threads"] = server.handler_threads;
  s["max_body_bytes"] = server.max_body_bytes;
  j["server"] = s;

  j["tasks"] = {{"retention_seconds", tasks.retention_seconds}, {"max_tasks", tasks.max_tasks}};
  j["auth"] = {{"enabled", auth.enabled}, {"api_keys", auth.api_keys}, {"bearer_tokens", auth.bearer_tokens}};

  json pipeline_json = json::array();
  for (const auto& step : pipeline) {
    pipeline_json.push_back(step.to_json());
  }
  j["pipeline"] = pipeline_json;

  j["stream"] = {{"stages", stream.stages}, {"stage_delay_ms", stream.stage_delay_ms}};

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  // Write to file
  std::ofstream file(path);
  if (!file.is_open()) {
    spdlog::error("[Config] Cannot write {}", path.string());
    return;
  }
  file << j.dump(2);
}

std::string Config::public_url() const {
  if (server.public_url) return *server.public_url;
  return "http://localhost:" + std::to_string(server.port) + "/a2a/v1";
}

AgentIdentity Config::identity() const {
  AgentIdentity id;
  id.name = agent.name;
  id.description = agent.description;
  id.url = public_url();
  id.version = agent.version;
  id.skills = agent.skills;
  id.capabilities = agent.capabilities;
  id.documentation_url = agent.documentation_url;
  return id;
}

TaskStoreOptions Config::task_options() const {
  TaskStoreOptions options;
  options.retention = std::chrono::seconds(tasks.retention_seconds);
  options.max_tasks = tasks.max_tasks;
  return options;
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "a2a";
}

}  // namespace config_paths

}  // namespace a2a
