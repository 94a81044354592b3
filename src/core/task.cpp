#include "a2a/core/task.hpp"

#include <stdexcept>

namespace a2a {

json TaskStatus::to_json() const {
  json j;
  j["state"] = to_string(state);
  if (message) {
    j["message"] = message->to_json();
  }
  j["timestamp"] = timestamp;
  return j;
}

TaskStatus TaskStatus::from_json(const json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("status must be an object");
  }

  TaskStatus status;
  status.state = task_state_from_string(j.value("state", "unknown"));
  if (j.contains("message") && !j["message"].is_null()) {
    status.message = Message::from_json(j["message"]);
  }
  status.timestamp = j.value("timestamp", "");
  return status;
}

json Task::to_json() const {
  json j;
  j["kind"] = "task";
  j["id"] = id;
  j["contextId"] = context_id;
  j["status"] = status.to_json();

  json history_json = json::array();
  for (const auto& msg : history) {
    history_json.push_back(msg.to_json());
  }
  j["history"] = history_json;

  if (!artifacts.empty()) {
    j["artifacts"] = artifacts;
  }

  return j;
}

Task Task::from_json(const json& j) {
  if (!j.is_object() || !j.contains("id") || !j.contains("contextId") || !j.contains("status")) {
    throw std::invalid_argument("task requires id, contextId and status");
  }

  Task task;
  task.id = j["id"].get<std::string>();
  task.context_id = j["contextId"].get<std::string>();
  task.status = TaskStatus::from_json(j["status"]);

  if (j.contains("history") && j["history"].is_array()) {
    for (const auto& msg_json : j["history"]) {
      task.history.push_back(Message::from_json(msg_json));
    }
  }
  if (j.contains("artifacts") && j["artifacts"].is_array()) {
    for (const auto& artifact : j["artifacts"]) {
      task.artifacts.push_back(artifact);
    }
  }

  return task;
}

json TaskStatusUpdateEvent::to_json() const {
  return {
      {"kind", "status-update"},
      {"taskId", task_id},
      {"contextId", context_id},
      {"status", status.to_json()},
      {"final", final},
  };
}

TaskStatusUpdateEvent TaskStatusUpdateEvent::from_json(const json& j) {
  TaskStatusUpdateEvent event;
  event.task_id = j.value("taskId", "");
  event.context_id = j.value("contextId", "");
  if (j.contains("status")) {
    event.status = TaskStatus::from_json(j["status"]);
  }
  event.final = j.value("final", false);
  return event;
}

}  // namespace a2a
