#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "a2a/bus/bus.hpp"
#include "a2a/task/task_store.hpp"

using namespace a2a;

namespace {

// 可手动推进的时钟
struct FakeClock {
  Timestamp now = std::chrono::system_clock::now();

  std::function<Timestamp()> fn() {
    return [this] {
      return now;
    };
  }
};

}  // namespace

// --- TaskStoreTest ---

TEST(TaskStoreTest, CreateTask) {
  TaskStore store;
  auto inbound = Message::user("hello");

  auto task = store.create_task(inbound);

  EXPECT_FALSE(task.id.empty());
  EXPECT_FALSE(task.context_id.empty());
  EXPECT_EQ(task.status.state, TaskState::Submitted);
  ASSERT_EQ(task.history.size(), 1u);
  EXPECT_EQ(task.history[0].id(), inbound.id());
  EXPECT_EQ(task.history[0].task_id().value_or(""), task.id);
  EXPECT_EQ(task.history[0].context_id().value_or(""), task.context_id);
  EXPECT_EQ(store.size(), 1u);
}

TEST(TaskStoreTest, ReusesInboundContextId) {
  TaskStore store;
  auto inbound = Message::user("hello").with_task("ignored", "ctx-42");

  auto first = store.create_task(inbound);
  auto second = store.create_task(inbound);

  EXPECT_EQ(first.context_id, "ctx-42");
  EXPECT_EQ(second.context_id, "ctx-42");
  // 任务 ID 总是新分配的
  EXPECT_NE(first.id, "ignored");
  EXPECT_NE(first.id, second.id);
}

TEST(TaskStoreTest, CompleteTask) {
  TaskStore store;
  auto task = store.create_task(Message::user("hi"));

  auto result = store.complete_task(task.id, Message::agent("done"));

  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value->status.state, TaskState::Completed);
  ASSERT_EQ(result.value->history.size(), 2u);
  EXPECT_EQ(result.value->history[1].text(), "done");
  EXPECT_EQ(result.value->history[1].task_id().value_or(""), task.id);
  ASSERT_TRUE(result.value->status.message.has_value());
  EXPECT_EQ(result.value->status.message->text(), "done");

  auto stored = store.get(task.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status.state, TaskState::Completed);
}

TEST(TaskStoreTest, TerminalStateIsFinal) {
  TaskStore store;
  auto task = store.create_task(Message::user("hi"));
  ASSERT_TRUE(store.complete_task(task.id, Message::agent("done")).ok());

  auto again = store.fail_task(task.id, "late failure");
  EXPECT_TRUE(again.failed());
  EXPECT_NE(again.error->find("already completed"), std::string::npos);

  auto working = store.mark_working(task.id, Message::agent("stage"));
  EXPECT_TRUE(working.failed());

  auto stored = store.get(task.id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->status.state, TaskState::Completed);
  EXPECT_EQ(stored->history.size(), 2u);
}

TEST(TaskStoreTest, UnknownTask) {
  TaskStore store;

  auto result = store.complete_task("missing", Message::agent("x"));

  EXPECT_TRUE(result.failed());
  EXPECT_FALSE(store.get("missing").has_value());
}

TEST(TaskStoreTest, FailWithoutPartialReply) {
  TaskStore store;
  auto task = store.create_task(Message::user("hi"));

  auto result = store.fail_task(task.id, "backend unavailable");

  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value->status.state, TaskState::Failed);
  EXPECT_EQ(result.value->status.message->text(), "backend unavailable");
}

TEST(TaskStoreTest, FailKeepsPartialReply) {
  TaskStore store;
  auto task = store.create_task(Message::user("hi"));

  auto partial = Message::agent("step two broke", {{"patient_info", {{"id", "p1"}}}});
  auto result = store.fail_task(task.id, "timeout", partial);

  ASSERT_TRUE(result.ok());
  const auto& reply = *result.value->status.message;
  // 错误文本被加在前面，部分结果保留
  EXPECT_NE(reply.text().find("timeout"), std::string::npos);
  EXPECT_NE(reply.text().find("step two broke"), std::string::npos);
  ASSERT_TRUE(reply.data().has_value());
  EXPECT_EQ((*reply.data())["patient_info"]["id"], "p1");
}

TEST(TaskStoreTest, FailPartialReplyAlreadyMentioningError) {
  TaskStore store;
  auto task = store.create_task(Message::user("hi"));

  auto partial = Message::agent("Error in workflow: timeout");
  auto result = store.fail_task(task.id, "timeout", partial);

  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.value->status.message->text(), "Error in workflow: timeout");
  EXPECT_EQ(result.value->status.message->id(), partial.id());
}

TEST(TaskStoreTest, WorkingThenCompleted) {
  TaskStore store;
  auto task = store.create_task(Message::user("analyze"));

  ASSERT_TRUE(store.mark_working(task.id, Message::agent("stage 1")).ok());
  ASSERT_TRUE(store.mark_working(task.id, Message::agent("stage 2")).ok());
  auto done = store.complete_task(task.id, Message::agent("done"));

  ASSERT_TRUE(done.ok());
  EXPECT_EQ(done.value->history.size(), 4u);
  EXPECT_EQ(done.value->history[1].text(), "stage 1");
  EXPECT_EQ(done.value->history[3].text(), "done");
}

TEST(TaskStoreTest, GetReturnsSnapshot) {
  TaskStore store;
  auto task = store.create_task(Message::user("hi"));

  auto snapshot = store.get(task.id);
  ASSERT_TRUE(snapshot.has_value());
  snapshot->history.clear();

  EXPECT_EQ(store.get(task.id)->history.size(), 1u);
}

TEST(TaskStoreTest, ConcurrentCreateAndComplete) {
  TaskStore store;
  constexpr int kThreads = 8;
  constexpr int kPerThread = 50;

  std::mutex ids_mutex;
  std::set<TaskId> ids;
  std::atomic<int> failures{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kPerThread; ++i) {
        auto task = store.create_task(Message::user("work"));
        if (!store.complete_task(task.id, Message::agent("ok")).ok()) {
          failures++;
        }
        std::lock_guard lock(ids_mutex);
        ids.insert(task.id);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(ids.size(), static_cast<size_t>(kThreads * kPerThread));
  EXPECT_EQ(store.size(), static_cast<size_t>(kThreads * kPerThread));
}

// --- TaskStoreEvictionTest ---

TEST(TaskStoreEvictionTest, RetentionEvictsOnlyTerminalTasks) {
  FakeClock clock;
  TaskStoreOptions options;
  options.retention = std::chrono::seconds(60);
  options.clock = clock.fn();
  TaskStore store(options);

  auto done = store.create_task(Message::user("a"));
  ASSERT_TRUE(store.complete_task(done.id, Message::agent("ok")).ok());
  auto running = store.create_task(Message::user("b"));
  ASSERT_TRUE(store.mark_working(running.id, Message::agent("stage")).ok());

  clock.now += std::chrono::seconds(30);
  EXPECT_EQ(store.evict_expired(), 0u);

  clock.now += std::chrono::seconds(31);
  EXPECT_EQ(store.evict_expired(), 1u);
  EXPECT_FALSE(store.get(done.id).has_value());
  EXPECT_TRUE(store.get(running.id).has_value());
}

TEST(TaskStoreEvictionTest, ZeroRetentionKeepsTasks) {
  FakeClock clock;
  TaskStoreOptions options;
  options.retention = std::chrono::seconds(0);
  options.clock = clock.fn();
  TaskStore store(options);

  auto task = store.create_task(Message::user("a"));
  ASSERT_TRUE(store.complete_task(task.id, Message::agent("ok")).ok());

  clock.now += std::chrono::hours(24 * 365);
  EXPECT_EQ(store.evict_expired(), 0u);
  EXPECT_EQ(store.size(), 1u);
}

TEST(TaskStoreEvictionTest, CapacityEvictsOldestTerminal) {
  FakeClock clock;
  TaskStoreOptions options;
  options.retention = std::chrono::seconds(0);
  options.max_tasks = 2;
  options.clock = clock.fn();
  TaskStore store(options);

  auto first = store.create_task(Message::user("1"));
  ASSERT_TRUE(store.complete_task(first.id, Message::agent("ok")).ok());
  clock.now += std::chrono::seconds(1);

  auto second = store.create_task(Message::user("2"));
  ASSERT_TRUE(store.complete_task(second.id, Message::agent("ok")).ok());
  clock.now += std::chrono::seconds(1);

  auto third = store.create_task(Message::user("3"));

  EXPECT_EQ(store.size(), 2u);
  EXPECT_FALSE(store.get(first.id).has_value());
  EXPECT_TRUE(store.get(second.id).has_value());
  EXPECT_TRUE(store.get(third.id).has_value());
}

TEST(TaskStoreEvictionTest, CapacityNeverEvictsInFlightTasks) {
  TaskStoreOptions options;
  options.max_tasks = 1;
  TaskStore store(options);

  auto a = store.create_task(Message::user("a"));
  auto b = store.create_task(Message::user("b"));

  // 两个任务都未结束，超出上限也不能被淘汰
  EXPECT_EQ(store.size(), 2u);
  EXPECT_TRUE(store.get(a.id).has_value());
  EXPECT_TRUE(store.get(b.id).has_value());
}

// --- TaskStoreEventsTest ---

TEST(TaskStoreEventsTest, PublishesLifecycleEvents) {
  TaskStore store;

  std::mutex mutex;
  std::vector<std::string> created;
  std::vector<std::string> states;

  auto created_sub = Bus::instance().subscribe_scoped<events::TaskCreated>([&](const events::TaskCreated& e) {
    std::lock_guard lock(mutex);
    created.push_back(e.task_id);
  });
  auto updated_sub = Bus::instance().subscribe_scoped<events::TaskUpdated>([&](const events::TaskUpdated& e) {
    std::lock_guard lock(mutex);
    states.push_back(e.task_id + ":" + e.state);
  });

  auto task = store.create_task(Message::user("hi"));
  ASSERT_TRUE(store.complete_task(task.id, Message::agent("ok")).ok());

  created_sub.reset();
  updated_sub.reset();

  std::lock_guard lock(mutex);
  EXPECT_NE(std::find(created.begin(), created.end(), task.id), created.end());
  EXPECT_NE(std::find(states.begin(), states.end(), task.id + ":completed"), states.end());
}
