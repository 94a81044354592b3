#include "a2a/card/agent_card.hpp"

namespace a2a {

namespace {

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

json AgentSkill::to_json() const {
  json j;
  j["id"] = id;
  j["name"] = name;
  j["description"] = description;
  j["tags"] = tags;
  if (!examples.empty()) j["examples"] = examples;
  if (!input_modes.empty()) j["inputModes"] = input_modes;
  if (!output_modes.empty()) j["outputModes"] = output_modes;
  return j;
}

AgentSkill AgentSkill::from_json(const json& j) {
  AgentSkill skill;
  skill.id = j.value("id", "");
  skill.name = j.value("name", "");
  skill.description = j.value("description", "");
  for (const auto& tag : string_list(j, "tags")) {
    skill.tags.insert(tag);
  }
  skill.examples = string_list(j, "examples");
  skill.input_modes = string_list(j, "inputModes");
  skill.output_modes = string_list(j, "outputModes");
  return skill;
}

bool AgentIdentity::supports(const std::string& capability_name) const {
  auto it = capabilities.find(capability_name);
  return it != capabilities.end() && it->second;
}

json AgentCard::to_json() const {
  json j;
  j["name"] = name;
  j["description"] = description;
  j["url"] = url;
  j["version"] = version;
  j["defaultInputModes"] = default_input_modes;
  j["defaultOutputModes"] = default_output_modes;

  json skills_json = json::array();
  for (const auto& skill : skills) {
    skills_json.push_back(skill.to_json());
  }
  j["skills"] = skills_json;
  j["capabilities"] = capabilities;

  if (documentation_url) {
    j["documentationUrl"] = *documentation_url;
  }

  if (!security_schemes.empty()) {
    json schemes = json::object();
    json security = json::array();
    for (const auto& [scheme_name, scheme] : security_schemes) {
      schemes[scheme_name] = scheme;
      security.push_back({{scheme_name, json::array()}});
    }
    j["securitySchemes"] = schemes;
    j["security"] = security;
  }

  return j;
}

AgentCard AgentCard::from_json(const json& j) {
  AgentCard card;
  card.name = j.value("name", "");
  card.description = j.value("description", "");
  card.url = j.value("url", "");
  card.version = j.value("version", "");
  card.default_input_modes = string_list(j, "defaultInputModes");
  card.default_output_modes = string_list(j, "defaultOutputModes");

  if (j.contains("skills") && j["skills"].is_array()) {
    for (const auto& skill_json : j["skills"]) {
      card.skills.push_back(AgentSkill::from_json(skill_json));
    }
  }
  if (j.contains("capabilities") && j["capabilities"].is_object()) {
    for (auto& [key, value] : j["capabilities"].items()) {
      if (value.is_boolean()) card.capabilities[key] = value.get<bool>();
    }
  }
  if (j.contains("documentationUrl") && j["documentationUrl"].is_string()) {
    card.documentation_url = j["documentationUrl"].get<std::string>();
  }
  if (j.contains("securitySchemes") && j["securitySchemes"].is_object()) {
    for (auto& [key, value] : j["securitySchemes"].items()) {
      card.security_schemes[key] = value;
    }
  }
  return card;
}

AgentCard build_agent_card(const AgentIdentity& identity) {
  AgentCard card;
  card.name = identity.name;
  card.description = identity.description;
  card.url = identity.url;
  card.version = identity.version;
  card.default_input_modes = identity.default_input_modes;
  card.default_output_modes = identity.default_output_modes;
  card.skills = identity.skills;

  card.capabilities = {
      {capability::kStreaming, false},
      {capability::kPushNotifications, false},
      {capability::kStateTransitionHistory, false},
  };
  for (const auto& [key, value] : identity.capabilities) {
    card.capabilities[key] = value;
  }

  card.documentation_url = identity.documentation_url;
  card.security_schemes = identity.security_schemes;
  return card;
}

}  // namespace a2a
