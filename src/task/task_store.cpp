#include "a2a/task/task_store.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "a2a/bus/bus.hpp"
#include "a2a/core/uuid.hpp"

namespace a2a {

TaskStore::TaskStore(TaskStoreOptions options) : options_(std::move(options)) {}

Task TaskStore::create_task(const Message& inbound) {
  Task task;
  task.id = UUID::generate();
  task.context_id = inbound.context_id().value_or(UUID::generate());
  task.status.state = TaskState::Submitted;
  task.status.timestamp = format_timestamp(options_.clock());
  task.history.push_back(inbound.with_task(task.id, task.context_id));

  std::vector<TaskId> evicted;
  {
    std::lock_guard lock(mutex_);
    tasks_[task.id] = Entry{task, std::nullopt};
    evicted = collect_evictions_locked(options_.clock());
  }

  spdlog::debug("[TaskStore] Created task {} (context {})", task.id, task.context_id);
  Bus::instance().publish(events::TaskCreated{task.id, task.context_id});
  publish_evictions(evicted);

  return task;
}

Result<Task> TaskStore::complete_task(const TaskId& id, const Message& reply) {
  return transition(id, TaskState::Completed, reply);
}

Result<Task> TaskStore::fail_task(const TaskId& id, const std::string& error, std::optional<Message> partial_reply) {
  if (!partial_reply) {
    return transition(id, TaskState::Failed, Message::agent(error));
  }

  if (partial_reply->text().find(error) != std::string::npos) {
    return transition(id, TaskState::Failed, *partial_reply);
  }

  std::vector<Part> parts;
  parts.push_back(TextPart{error, std::nullopt});
  for (const auto& part : partial_reply->parts()) {
    parts.push_back(part);
  }
  return transition(id, TaskState::Failed, Message(Role::Agent, std::move(parts)));
}

Result<Task> TaskStore::mark_working(const TaskId& id, const Message& progress) {
  return transition(id, TaskState::Working, progress);
}

Result<Task> TaskStore::transition(const TaskId& id, TaskState next, const Message& reply) {
  Task snapshot;
  {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
      return Result<Task>::failure("Task not found: " + id);
    }

    auto& entry = it->second;
    auto& task = entry.task;
    if (task.is_terminal()) {
      return Result<Task>::failure("Task " + id + " is already " + to_string(task.status.state));
    }

    auto now = options_.clock();
    auto stamped = reply.with_task(task.id, task.context_id);
    task.history.push_back(stamped);
    task.status.state = next;
    task.status.message = std::move(stamped);
    task.status.timestamp = format_timestamp(now);

    if (is_terminal(next)) {
      entry.terminal_at = now;
    }
    snapshot = task;
  }

  spdlog::debug("[TaskStore] Task {} -> {}", id, to_string(next));
  Bus::instance().publish(events::TaskUpdated{snapshot.id, to_string(next), snapshot.history.size()});

  return Result<Task>::success(std::move(snapshot));
}

std::optional<Task> TaskStore::get(const TaskId& id) const {
  std::lock_guard lock(mutex_);
  auto it = tasks_.find(id);
  if (it != tasks_.end()) {
    return it->second.task;
  }
  return std::nullopt;
}

size_t TaskStore::size() const {
  std::lock_guard lock(mutex_);
  return tasks_.size();
}

size_t TaskStore::evict_expired() {
  std::vector<TaskId> evicted;
  {
    std::lock_guard lock(mutex_);
    evicted = collect_evictions_locked(options_.clock());
  }
  publish_evictions(evicted);
  return evicted.size();
}

std::vector<TaskId> TaskStore::collect_evictions_locked(Timestamp now) {
  std::vector<TaskId> evicted;

  // Retention
  if (options_.retention.count() > 0) {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
      const auto& terminal_at = it->second.terminal_at;
      if (terminal_at && now - *terminal_at >= options_.retention) {
        evicted.push_back(it->first);
        it = tasks_.erase(it);
      } else {
        ++it;
      }
    }
  }

  // Capacity
  if (options_.max_tasks > 0 && tasks_.size() > options_.max_tasks) {
    std::vector<std::pair<Timestamp, TaskId>> terminal;
    for (const auto& [id, entry] : tasks_) {
      if (entry.terminal_at) {
        terminal.emplace_back(*entry.terminal_at, id);
      }
    }
    std::sort(terminal.begin(), terminal.end());

    for (const auto& [when, id] : terminal) {
      if (tasks_.size() <= options_.max_tasks) break;
      tasks_.erase(id);
      evicted.push_back(id);
    }

    if (tasks_.size() > options_.max_tasks) {
      spdlog::warn("[TaskStore] {} tasks stored (limit {}), remaining tasks are still in flight", tasks_.size(), options_.max_tasks);
    }
  }

  return evicted;
}

void TaskStore::publish_evictions(const std::vector<TaskId>& evicted) {
  for (const auto& id : evicted) {
    spdlog::debug("[TaskStore] Evicted task {}", id);
    Bus::instance().publish(events::TaskEvicted{id});
  }
}

}  // namespace a2a
