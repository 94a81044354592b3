#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "a2a/core/types.hpp"
#include "a2a/core/uuid.hpp"

namespace a2a {

// Message part types
struct TextPart {
  std::string text;
  std::optional<json> metadata;
};

struct DataPart {
  json data = json::object();
  std::optional<json> metadata;
};

using Part = std::variant<TextPart, DataPart>;

json part_to_json(const Part& part);

// Throws std::invalid_argument on an unknown kind or a malformed part
Part part_from_json(const json& j);

// Message role
enum class Role { User, Agent };

std::string to_string(Role role);

std::optional<Role> role_from_string(const std::string& str);

// Message class
//
// Parts are fixed at construction; the only mutation left is stamping the
// task/context correlation ids, which the task store does exactly once when
// the message enters a task history.
class Message {
 public:
  Message() = default;
  Message(Role role, std::vector<Part> parts);

  // Factory methods
  static Message user(const std::string& text);
  static Message agent(const std::string& text);
  static Message agent(const std::string& text, json data);

  // Accessors
  const MessageId& id() const {
    return id_;
  }

  Role role() const {
    return role_;
  }

  const std::vector<Part>& parts() const {
    return parts_;
  }

  const std::optional<TaskId>& task_id() const {
    return task_id_;
  }

  const std::optional<ContextId>& context_id() const {
    return context_id_;
  }

  const std::optional<json>& metadata() const {
    return metadata_;
  }

  void set_metadata(json metadata) {
    metadata_ = std::move(metadata);
  }

  // Correlation
  Message with_task(const TaskId& task_id, const ContextId& context_id) const;

  // Get text content (concatenated)
  std::string text() const;

  // First data part payload, if any
  std::optional<json> data() const;

  // Serialization
  json to_json() const;

  // Throws std::invalid_argument when role, parts or messageId are missing/invalid
  static Message from_json(const json& j);

  bool operator==(const Message& other) const {
    return id_ == other.id_;
  }

 private:
  MessageId id_ = UUID::generate();
  Role role_ = Role::User;
  std::vector<Part> parts_;

  std::optional<TaskId> task_id_;
  std::optional<ContextId> context_id_;
  std::optional<json> metadata_;
};

}  // namespace a2a
