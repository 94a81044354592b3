#include "a2a/core/types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace a2a {

std::string to_string(TaskState state) {
  switch (state) {
    case TaskState::Submitted:
      return "submitted";
    case TaskState::Working:
      return "working";
    case TaskState::InputRequired:
      return "input-required";
    case TaskState::Completed:
      return "completed";
    case TaskState::Canceled:
      return "canceled";
    case TaskState::Failed:
      return "failed";
    case TaskState::Rejected:
      return "rejected";
    case TaskState::AuthRequired:
      return "auth-required";
    case TaskState::Unknown:
      return "unknown";
  }
  return "unknown";
}

TaskState task_state_from_string(const std::string& str) {
  if (str == "submitted") return TaskState::Submitted;
  if (str == "working") return TaskState::Working;
  if (str == "input-required") return TaskState::InputRequired;
  if (str == "completed") return TaskState::Completed;
  if (str == "canceled") return TaskState::Canceled;
  if (str == "failed") return TaskState::Failed;
  if (str == "rejected") return TaskState::Rejected;
  if (str == "auth-required") return TaskState::AuthRequired;
  return TaskState::Unknown;
}

bool is_terminal(TaskState state) {
  switch (state) {
    case TaskState::Completed:
    case TaskState::Canceled:
    case TaskState::Failed:
    case TaskState::Rejected:
      return true;
    default:
      return false;
  }
}

std::string format_timestamp(Timestamp ts) {
  auto since_epoch = ts.time_since_epoch();
  auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - secs).count();

  std::time_t t = static_cast<std::time_t>(secs.count());
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return ss.str();
}

std::string now_iso8601() {
  return format_timestamp(std::chrono::system_clock::now());
}

}  // namespace a2a
