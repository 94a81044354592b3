#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "a2a/core/types.hpp"

namespace a2a {

// Static capability metadata, immutable for the process lifetime
struct AgentSkill {
  std::string id;
  std::string name;
  std::string description;
  std::set<std::string> tags;
  std::vector<std::string> examples;
  std::vector<std::string> input_modes;
  std::vector<std::string> output_modes;

  json to_json() const;
  static AgentSkill from_json(const json& j);
};

namespace capability {
constexpr const char* kStreaming = "streaming";
constexpr const char* kPushNotifications = "pushNotifications";
constexpr const char* kStateTransitionHistory = "stateTransitionHistory";
}  // namespace capability

// Everything the discovery document is derived from
struct AgentIdentity {
  std::string name;
  std::string description;
  std::string url;
  std::string version = "1.0.0";
  std::vector<std::string> default_input_modes = {"application/json", "text/plain"};
  std::vector<std::string> default_output_modes = {"application/json", "text/plain"};
  std::vector<AgentSkill> skills;
  std::map<std::string, bool> capabilities;
  std::optional<std::string> documentation_url;
  // scheme name -> OpenAPI-style security scheme object
  std::map<std::string, json> security_schemes;

  bool supports(const std::string& capability_name) const;
};

struct AgentCard {
  std::string name;
  std::string description;
  std::string url;
  std::string version;
  std::vector<std::string> default_input_modes;
  std::vector<std::string> default_output_modes;
  std::vector<AgentSkill> skills;
  std::map<std::string, bool> capabilities;
  std::optional<std::string> documentation_url;
  std::map<std::string, json> security_schemes;

  json to_json() const;
  static AgentCard from_json(const json& j);
};

// Pure function of the identity; identical input yields an identical document
AgentCard build_agent_card(const AgentIdentity& identity);

}  // namespace a2a
