#include <gtest/gtest.h>

#include <map>
#include <mutex>
#include <vector>

#include "a2a/coordinator/orchestrator.hpp"
#include "a2a/runtime/agent_runtime.hpp"

using namespace a2a;
using namespace std::chrono_literals;

namespace {

// 按 URL 返回预设结果的下游调用桩
class FakeCaller : public DownstreamCaller {
 public:
  enum class Mode { Complete, FailTask, ErrorEnvelope, Transport, Hang };

  void set(const std::string& url, Mode mode) {
    modes_[url] = mode;
  }

  std::future<Result<JsonRpcResponse>> send_message(const std::string& url, const Message& message, std::chrono::milliseconds) override {
    {
      std::lock_guard lock(mutex_);
      calls_.push_back({url, message.text()});
    }

    auto mode = modes_.count(url) ? modes_[url] : Mode::Complete;
    if (mode == Mode::Hang) {
      auto promise = std::make_shared<std::promise<Result<JsonRpcResponse>>>();
      hanging_.push_back(promise);
      return promise->get_future();
    }

    std::promise<Result<JsonRpcResponse>> promise;
    switch (mode) {
      case Mode::Complete:
        promise.set_value(Result<JsonRpcResponse>::success(JsonRpcResponse::success("id", remote_task(url, TaskState::Completed, "ok from " + url))));
        break;
      case Mode::FailTask:
        promise.set_value(Result<JsonRpcResponse>::success(JsonRpcResponse::success("id", remote_task(url, TaskState::Failed, "no slots"))));
        break;
      case Mode::ErrorEnvelope:
        promise.set_value(Result<JsonRpcResponse>::success(JsonRpcResponse::failure("id", JsonRpcError::method_not_found("message/send"))));
        break;
      case Mode::Transport:
        promise.set_value(Result<JsonRpcResponse>::failure("connection refused"));
        break;
      case Mode::Hang:
        break;
    }
    return promise.get_future();
  }

  std::vector<std::pair<std::string, std::string>> calls() {
    std::lock_guard lock(mutex_);
    return calls_;
  }

 private:
  static json remote_task(const std::string& url, TaskState state, const std::string& text) {
    Task task;
    task.id = "remote-" + url;
    task.context_id = "ctx";
    task.status.state = state;
    task.status.message = Message::agent(text);
    return task.to_json();
  }

  std::map<std::string, Mode> modes_;
  std::mutex mutex_;
  std::vector<std::pair<std::string, std::string>> calls_;
  std::vector<std::shared_ptr<std::promise<Result<JsonRpcResponse>>>> hanging_;
};

std::vector<PipelineStep> hospital_steps(std::chrono::milliseconds timeout = 30s) {
  return {
      {"Checking patient information...", "patient", "lookup patient in: ", "patient_info", timeout},
      {"Finding available doctors...", "doctor", "find doctors for: ", "doctor_availability", timeout},
      {"Booking appointment...", "booking", "book appointment: ", "booking_result", timeout},
  };
}

Task run(CoordinatorHandler& handler, const std::string& text, std::vector<std::string>* progress = nullptr) {
  Task task;
  task.id = "coord-task";
  task.context_id = "coord-ctx";
  HandlerContext ctx{task.id, task.context_id, nullptr};
  if (progress) {
    ctx.on_progress = [progress](const std::string& stage) {
      progress->push_back(stage);
    };
  }

  auto result = handler.handle(Message::user(text), task, ctx);
  task.status.state = result.ok() ? TaskState::Completed : TaskState::Failed;
  task.status.message = result.reply;
  return task;
}

}  // namespace

// --- CoordinatorTest ---

TEST(CoordinatorTest, AllStepsSucceed) {
  auto caller = std::make_shared<FakeCaller>();
  CoordinatorHandler handler(hospital_steps(), caller);

  std::vector<std::string> progress;
  auto task = run(handler, "John Doe, cardiology", &progress);

  EXPECT_EQ(task.status.state, TaskState::Completed);
  ASSERT_TRUE(task.status.message.has_value());
  EXPECT_EQ(task.status.message->text(), "Workflow completed successfully!");

  auto data = *task.status.message->data();
  EXPECT_EQ(data["status"], "completed");
  EXPECT_EQ(data["workflow_steps"].size(), 3u);
  EXPECT_EQ(data["steps"].size(), 3u);
  EXPECT_EQ(data["steps"][1]["agent"], "doctor");
  EXPECT_EQ(data["patient_info"]["status"]["state"], "completed");
  EXPECT_EQ(data["doctor_availability"]["id"], "remote-doctor");
  EXPECT_EQ(data["booking_result"]["id"], "remote-booking");

  // 严格按顺序调用，每一步都带上原始请求文本
  auto calls = caller->calls();
  ASSERT_EQ(calls.size(), 3u);
  EXPECT_EQ(calls[0].first, "patient");
  EXPECT_EQ(calls[0].second, "lookup patient in: John Doe, cardiology");
  EXPECT_EQ(calls[1].second, "find doctors for: John Doe, cardiology");
  EXPECT_EQ(calls[2].second, "book appointment: John Doe, cardiology");

  EXPECT_EQ(progress, (std::vector<std::string>{"Checking patient information...", "Finding available doctors...", "Booking appointment..."}));
}

TEST(CoordinatorTest, StopsAtFirstFailedTask) {
  auto caller = std::make_shared<FakeCaller>();
  caller->set("doctor", FakeCaller::Mode::FailTask);
  CoordinatorHandler handler(hospital_steps(), caller);

  auto task = run(handler, "John Doe");

  EXPECT_EQ(task.status.state, TaskState::Failed);
  // 第三步不会被调用
  ASSERT_EQ(caller->calls().size(), 2u);

  auto data = *task.status.message->data();
  EXPECT_EQ(data["status"], "failed");
  EXPECT_EQ(data["failed_step"], "Finding available doctors...");
  EXPECT_TRUE(data.contains("patient_info"));
  EXPECT_FALSE(data.contains("doctor_availability"));
  EXPECT_EQ(data["steps"].size(), 1u);
  EXPECT_NE(data["error"].get<std::string>().find("no slots"), std::string::npos);
  EXPECT_EQ(task.status.message->text().rfind("Error in workflow: ", 0), 0u);
}

TEST(CoordinatorTest, ErrorEnvelopeFailsStep) {
  auto caller = std::make_shared<FakeCaller>();
  caller->set("patient", FakeCaller::Mode::ErrorEnvelope);
  CoordinatorHandler handler(hospital_steps(), caller);

  auto task = run(handler, "x");

  EXPECT_EQ(task.status.state, TaskState::Failed);
  EXPECT_EQ(caller->calls().size(), 1u);
  auto data = *task.status.message->data();
  EXPECT_NE(data["error"].get<std::string>().find("-32601"), std::string::npos);
  EXPECT_EQ(data["steps"].size(), 0u);
}

TEST(CoordinatorTest, TransportErrorFailsStep) {
  auto caller = std::make_shared<FakeCaller>();
  caller->set("booking", FakeCaller::Mode::Transport);
  CoordinatorOptions options;
  options.error_prefix = "Error in appointment booking workflow: ";
  CoordinatorHandler handler(hospital_steps(), caller, options);

  auto task = run(handler, "x");

  EXPECT_EQ(task.status.state, TaskState::Failed);
  auto data = *task.status.message->data();
  EXPECT_EQ(data["failed_step"], "Booking appointment...");
  EXPECT_TRUE(data.contains("patient_info"));
  EXPECT_TRUE(data.contains("doctor_availability"));
  EXPECT_NE(task.status.message->text().find("connection refused"), std::string::npos);
  EXPECT_EQ(task.status.message->text().rfind("Error in appointment booking workflow: ", 0), 0u);
}

TEST(CoordinatorTest, TimeoutFailsStep) {
  auto caller = std::make_shared<FakeCaller>();
  caller->set("patient", FakeCaller::Mode::Hang);
  CoordinatorHandler handler(hospital_steps(50ms), caller);

  auto started = std::chrono::steady_clock::now();
  auto task = run(handler, "x");
  auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_EQ(task.status.state, TaskState::Failed);
  EXPECT_LT(elapsed, 5s);
  EXPECT_EQ(caller->calls().size(), 1u);
  auto data = *task.status.message->data();
  EXPECT_NE(data["error"].get<std::string>().find("timed out after 50 ms"), std::string::npos);
}

TEST(CoordinatorTest, EmptyPipelineCompletes) {
  auto caller = std::make_shared<FakeCaller>();
  CoordinatorHandler handler({}, caller);

  auto task = run(handler, "x");

  EXPECT_EQ(task.status.state, TaskState::Completed);
  EXPECT_TRUE(caller->calls().empty());
}

TEST(CoordinatorTest, RuntimeRecordsPartialFailure) {
  auto caller = std::make_shared<FakeCaller>();
  caller->set("booking", FakeCaller::Mode::FailTask);
  AgentIdentity identity;
  identity.name = "Coordinator";
  AgentRuntime runtime(identity, std::make_shared<CoordinatorHandler>(hospital_steps(), caller));

  JsonRpcRequest request;
  request.id = "c-1";
  request.method = methods::kMessageSend;
  request.params = {{"message", Message::user("Book for John").to_json()}};
  auto dispatch = runtime.dispatch(request.to_json().dump());

  ASSERT_TRUE(dispatch.response->ok());
  auto task = Task::from_json(dispatch.response->result());
  EXPECT_EQ(task.status.state, TaskState::Failed);
  ASSERT_TRUE(task.status.message->data().has_value());
  EXPECT_EQ((*task.status.message->data())["failed_step"], "Booking appointment...");
  EXPECT_EQ(task.history.size(), 2u);
}

// --- PipelineStepTest ---

TEST(PipelineStepTest, JsonRoundTrip) {
  PipelineStep step{"Booking appointment...", "http://localhost:8003/a2a/v1", "book appointment: ", "booking_result", 1500ms};

  auto j = step.to_json();
  EXPECT_EQ(j["timeout_ms"], 1500);

  auto parsed = PipelineStep::from_json(j);
  EXPECT_EQ(parsed.agent_url, step.agent_url);
  EXPECT_EQ(parsed.result_key, "booking_result");
  EXPECT_EQ(parsed.timeout, 1500ms);
}

TEST(PipelineStepTest, DefaultTimeout) {
  auto parsed = PipelineStep::from_json({{"agent_url", "http://x/a2a/v1"}});

  EXPECT_EQ(parsed.timeout, 30000ms);
}

TEST(PipelineStepTest, NormalizeResultKeys) {
  std::vector<PipelineStep> steps = {
      {"a", "u1", "", "", 1s},
      {"b", "u2", "", "status", 1s},
      {"c", "u3", "", "lookup", 1s},
      {"d", "u4", "", "lookup", 1s},
      {"e", "u5", "", "workflow_steps", 1s},
  };

  auto normalized = normalize_pipeline(steps);

  ASSERT_EQ(normalized.size(), 5u);
  EXPECT_EQ(normalized[0].result_key, "step_1_result");
  EXPECT_EQ(normalized[1].result_key, "step_2_result");
  EXPECT_EQ(normalized[2].result_key, "lookup");
  EXPECT_EQ(normalized[3].result_key, "step_4_result");
  EXPECT_EQ(normalized[4].result_key, "step_5_result");
  EXPECT_TRUE(is_reserved_result_key("failed_step"));
  EXPECT_TRUE(is_reserved_result_key("error"));
  EXPECT_FALSE(is_reserved_result_key("booking_result"));
}

TEST(CoordinatorTest, StepResultsNeverOverwriteSummary) {
  auto caller = std::make_shared<FakeCaller>();
  CoordinatorHandler handler({{"First", "patient", "", "", 30s}, {"Second", "doctor", "", "", 30s}, {"Third", "booking", "", "status", 30s}}, caller);

  auto task = run(handler, "hi");

  ASSERT_EQ(task.status.state, TaskState::Completed);
  auto data = *task.status.message->data();
  EXPECT_EQ(data["status"], "completed");
  EXPECT_EQ(data["steps"].size(), 3u);
  EXPECT_EQ(data["step_1_result"]["id"], "remote-patient");
  EXPECT_EQ(data["step_2_result"]["id"], "remote-doctor");
  EXPECT_EQ(data["step_3_result"]["id"], "remote-booking");
  EXPECT_EQ(handler.steps()[2].result_key, "step_3_result");
}
