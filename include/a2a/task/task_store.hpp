#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "a2a/core/message.hpp"
#include "a2a/core/task.hpp"
#include "a2a/core/types.hpp"

namespace a2a {

struct TaskStoreOptions {
  // Terminal tasks older than this are evicted; zero keeps them forever
  std::chrono::seconds retention{3600};

  // Upper bound on stored tasks; zero means unbounded. Only terminal tasks
  // are ever evicted, oldest first.
  size_t max_tasks = 10000;

  // Injectable for tests
  std::function<Timestamp()> clock = [] {
    return std::chrono::system_clock::now();
  };
};

// In-memory task table and lifecycle engine.
//
// Transitions:
//   submitted -> completed | failed            (message/send)
//   submitted -> working -> ... -> completed | failed   (message/stream)
// Nothing leaves a terminal state and history is append-only.
// All methods are thread-safe and return snapshots.
class TaskStore {
 public:
  explicit TaskStore(TaskStoreOptions options = {});

  // Allocates a fresh task id, reuses the inbound contextId when present and
  // records the inbound message as the first history entry.
  Task create_task(const Message& inbound);

  Result<Task> complete_task(const TaskId& id, const Message& reply);

  // Uses partial_reply as the reply when given (error text is prepended if
  // missing); otherwise synthesizes an agent message carrying the error.
  Result<Task> fail_task(const TaskId& id, const std::string& error, std::optional<Message> partial_reply = std::nullopt);

  Result<Task> mark_working(const TaskId& id, const Message& progress);

  std::optional<Task> get(const TaskId& id) const;

  size_t size() const;

  // Applies the retention and capacity policy; returns the number evicted
  size_t evict_expired();

 private:
  struct Entry {
    Task task;
    std::optional<Timestamp> terminal_at;
  };

  Result<Task> transition(const TaskId& id, TaskState next, const Message& reply);

  // Caller holds mutex_
  std::vector<TaskId> collect_evictions_locked(Timestamp now);

  void publish_evictions(const std::vector<TaskId>& evicted);

  TaskStoreOptions options_;
  mutable std::mutex mutex_;
  std::map<TaskId, Entry> tasks_;
};

}  // namespace a2a
