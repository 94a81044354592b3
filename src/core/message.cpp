#include "a2a/core/message.hpp"

#include <stdexcept>

namespace a2a {

json part_to_json(const Part& part) {
  json j;
  if (auto* text = std::get_if<TextPart>(&part)) {
    j["kind"] = "text";
    j["text"] = text->text;
    if (text->metadata) j["metadata"] = *text->metadata;
  } else if (auto* data = std::get_if<DataPart>(&part)) {
    j["kind"] = "data";
    j["data"] = data->data;
    if (data->metadata) j["metadata"] = *data->metadata;
  }
  return j;
}

Part part_from_json(const json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("part must be an object");
  }

  // Older peers send "type" instead of "kind"
  std::string kind = j.value("kind", j.value("type", ""));

  std::optional<json> metadata;
  if (j.contains("metadata") && !j["metadata"].is_null()) {
    metadata = j["metadata"];
  }

  if (kind == "text") {
    if (!j.contains("text") || !j["text"].is_string()) {
      throw std::invalid_argument("text part without text");
    }
    return TextPart{j["text"].get<std::string>(), std::move(metadata)};
  }
  if (kind == "data") {
    if (!j.contains("data")) {
      throw std::invalid_argument("data part without data");
    }
    return DataPart{j["data"], std::move(metadata)};
  }
  throw std::invalid_argument("unsupported part kind: '" + kind + "'");
}

std::string to_string(Role role) {
  switch (role) {
    case Role::User:
      return "user";
    case Role::Agent:
      return "agent";
  }
  return "user";
}

std::optional<Role> role_from_string(const std::string& str) {
  if (str == "user") return Role::User;
  if (str == "agent") return Role::Agent;
  return std::nullopt;
}

Message::Message(Role role, std::vector<Part> parts) : role_(role), parts_(std::move(parts)) {}

Message Message::user(const std::string& text) {
  return Message(Role::User, {TextPart{text, std::nullopt}});
}

Message Message::agent(const std::string& text) {
  return Message(Role::Agent, {TextPart{text, std::nullopt}});
}

Message Message::agent(const std::string& text, json data) {
  return Message(Role::Agent, {TextPart{text, std::nullopt}, DataPart{std::move(data), std::nullopt}});
}

Message Message::with_task(const TaskId& task_id, const ContextId& context_id) const {
  Message copy = *this;
  copy.task_id_ = task_id;
  copy.context_id_ = context_id;
  return copy;
}

std::string Message::text() const {
  std::string result;
  for (const auto& part : parts_) {
    if (auto* text = std::get_if<TextPart>(&part)) {
      if (!result.empty()) result += "\n";
      result += text->text;
    }
  }
  return result;
}

std::optional<json> Message::data() const {
  for (const auto& part : parts_) {
    if (auto* data = std::get_if<DataPart>(&part)) {
      return data->data;
    }
  }
  return std::nullopt;
}

json Message::to_json() const {
  json j;
  j["kind"] = "message";
  j["role"] = to_string(role_);
  j["messageId"] = id_;

  json parts_json = json::array();
  for (const auto& part : parts_) {
    parts_json.push_back(part_to_json(part));
  }
  j["parts"] = parts_json;

  if (task_id_) j["taskId"] = *task_id_;
  if (context_id_) j["contextId"] = *context_id_;
  if (metadata_) j["metadata"] = *metadata_;

  return j;
}

Message Message::from_json(const json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("message must be an object");
  }

  auto role = role_from_string(j.value("role", ""));
  if (!role) {
    throw std::invalid_argument("message role must be 'user' or 'agent'");
  }

  if (!j.contains("messageId") || !j["messageId"].is_string() || j["messageId"].get<std::string>().empty()) {
    throw std::invalid_argument("message without messageId");
  }

  if (!j.contains("parts") || !j["parts"].is_array()) {
    throw std::invalid_argument("message without parts");
  }

  Message msg;
  msg.id_ = j["messageId"].get<std::string>();
  msg.role_ = *role;
  for (const auto& part_json : j["parts"]) {
    msg.parts_.push_back(part_from_json(part_json));
  }

  if (j.contains("taskId") && j["taskId"].is_string()) {
    msg.task_id_ = j["taskId"].get<std::string>();
  }
  if (j.contains("contextId") && j["contextId"].is_string()) {
    msg.context_id_ = j["contextId"].get<std::string>();
  }
  if (j.contains("metadata") && !j["metadata"].is_null()) {
    msg.metadata_ = j["metadata"];
  }

  return msg;
}

}  // namespace a2a
