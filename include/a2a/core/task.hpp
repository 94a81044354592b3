#pragma once

#include <optional>
#include <string>
#include <vector>

#include "a2a/core/message.hpp"
#include "a2a/core/types.hpp"

namespace a2a {

struct TaskStatus {
  TaskState state = TaskState::Submitted;
  std::optional<Message> message;
  std::string timestamp = now_iso8601();

  json to_json() const;
  static TaskStatus from_json(const json& j);
};

struct Task {
  TaskId id;
  ContextId context_id;
  TaskStatus status;
  std::vector<Message> history;
  std::vector<json> artifacts;

  bool is_terminal() const {
    return a2a::is_terminal(status.state);
  }

  json to_json() const;

  // Throws std::invalid_argument when id/contextId/status are missing
  static Task from_json(const json& j);
};

// One event on a message/stream connection
struct TaskStatusUpdateEvent {
  TaskId task_id;
  ContextId context_id;
  TaskStatus status;
  bool final = false;

  json to_json() const;
  static TaskStatusUpdateEvent from_json(const json& j);
};

}  // namespace a2a
