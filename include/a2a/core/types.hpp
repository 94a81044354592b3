#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace a2a {

using json = nlohmann::json;

// Forward declarations
class Message;

struct Task;

// Type aliases
using TaskId = std::string;
using ContextId = std::string;
using MessageId = std::string;

using Timestamp = std::chrono::system_clock::time_point;

// Transport-level request headers, keys lower-cased
using Headers = std::map<std::string, std::string>;

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(std::string err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// Task lifecycle states
enum class TaskState {
  Submitted,
  Working,
  InputRequired,
  Completed,
  Canceled,
  Failed,
  Rejected,
  AuthRequired,
  Unknown
};

std::string to_string(TaskState state);

TaskState task_state_from_string(const std::string& str);

// completed, canceled, failed and rejected admit no further transitions
bool is_terminal(TaskState state);

// ISO-8601 UTC with millisecond precision, e.g. 2025-01-15T10:00:00.123Z
std::string format_timestamp(Timestamp ts);

std::string now_iso8601();

}  // namespace a2a
