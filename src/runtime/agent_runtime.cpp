#include "a2a/runtime/agent_runtime.hpp"

#include <spdlog/spdlog.h>

namespace a2a {

namespace {

// Extracts params.message; nullopt carries the error response instead
std::optional<Message> extract_message(const JsonRpcRequest& request, std::optional<JsonRpcResponse>& rejection) {
  if (!request.params.is_object() || !request.params.contains("message")) {
    rejection = JsonRpcResponse::failure(request.id, JsonRpcError::internal("missing params.message"));
    return std::nullopt;
  }

  try {
    return Message::from_json(request.params["message"]);
  } catch (const std::exception& e) {
    rejection = JsonRpcResponse::failure(request.id, JsonRpcError::internal(std::string("invalid message: ") + e.what()));
    return std::nullopt;
  }
}

JsonRpcResponse status_event(const json& request_id, const Task& task, bool final) {
  TaskStatusUpdateEvent event{task.id, task.context_id, task.status, final};
  return JsonRpcResponse::success(request_id, event.to_json());
}

}  // namespace

AgentRuntime::AgentRuntime(AgentIdentity identity, CapabilityHandlerPtr handler, TaskStoreOptions task_options)
    : identity_(std::move(identity)), card_(build_agent_card(identity_)), handler_(std::move(handler)), tasks_(std::move(task_options)) {}

void AgentRuntime::add_interceptor(RequestInterceptorPtr interceptor) {
  std::lock_guard lock(interceptors_mutex_);
  spdlog::info("[Runtime] {}: added interceptor {}", identity_.name, interceptor->name());
  interceptors_.push_back(std::move(interceptor));
}

Dispatch AgentRuntime::dispatch(const std::string& payload, const Headers& headers) {
  auto decoded = decode_request(payload);
  if (!decoded.ok()) {
    spdlog::warn("[Runtime] Rejected payload: {}", decoded.rejection->error_message());
    return Dispatch{decoded.rejection, std::nullopt};
  }
  const auto& request = *decoded.request;

  std::vector<RequestInterceptorPtr> chain;
  {
    std::lock_guard lock(interceptors_mutex_);
    chain = interceptors_;
  }
  for (const auto& interceptor : chain) {
    if (auto error = interceptor->intercept(request, headers)) {
      spdlog::warn("[Runtime] {} rejected by {}: {}", request.method, interceptor->name(), error->message);
      return Dispatch{JsonRpcResponse::failure(request.id, std::move(*error)), std::nullopt};
    }
  }

  bool is_send = request.method == methods::kMessageSend;
  bool is_stream = request.method == methods::kMessageStream && streaming_enabled();
  if (!is_send && !is_stream) {
    spdlog::warn("[Runtime] Method not found: {}", request.method);
    return Dispatch{JsonRpcResponse::failure(request.id, JsonRpcError::method_not_found(request.method)), std::nullopt};
  }

  std::optional<JsonRpcResponse> rejection;
  auto inbound = extract_message(request, rejection);
  if (!inbound) {
    spdlog::warn("[Runtime] {}: {}", request.method, rejection->error_message());
    return Dispatch{std::move(rejection), std::nullopt};
  }

  if (is_stream) {
    return Dispatch{std::nullopt, StreamJob{request, std::move(*inbound)}};
  }
  return Dispatch{handle_send(request, *inbound), std::nullopt};
}

JsonRpcResponse AgentRuntime::handle_send(const JsonRpcRequest& request, const Message& inbound) {
  auto task = tasks_.create_task(inbound);
  spdlog::info("[Runtime] {}: message/send -> task {}", identity_.name, task.id);

  HandlerContext ctx{task.id, task.context_id, nullptr};
  auto outcome = invoke_handler(task.history.front(), task, ctx);
  auto finished = finish_task(task, std::move(outcome));

  return JsonRpcResponse::success(request.id, finished.to_json());
}

void AgentRuntime::run_stream(const StreamJob& job, const StreamSink& sink) {
  auto task = tasks_.create_task(job.inbound);
  spdlog::info("[Runtime] {}: message/stream -> task {}", identity_.name, task.id);

  bool connected = true;
  auto emit = [&](const Task& snapshot, bool final) {
    if (!connected) return;
    connected = sink(status_event(job.request.id, snapshot, final));
    if (!connected) {
      spdlog::warn("[Runtime] Stream for task {} disconnected, continuing without client", snapshot.id);
    }
  };

  auto accepted = tasks_.mark_working(task.id, Message::agent("Task accepted"));
  if (accepted.ok()) {
    emit(*accepted.value, false);
  }

  HandlerContext ctx{task.id, task.context_id, [&](const std::string& stage) {
                       auto progressed = tasks_.mark_working(task.id, Message::agent(stage));
                       if (progressed.ok()) {
                         emit(*progressed.value, false);
                       } else {
                         spdlog::warn("[Runtime] Dropped progress for task {}: {}", task.id, *progressed.error);
                       }
                     }};

  auto outcome = invoke_handler(task.history.front(), task, ctx);
  auto finished = finish_task(task, std::move(outcome));
  emit(finished, true);
}

HandlerResult AgentRuntime::invoke_handler(const Message& inbound, const Task& task, const HandlerContext& ctx) {
  try {
    return handler_->handle(inbound, task, ctx);
  } catch (const std::exception& e) {
    spdlog::error("[Runtime] Handler threw for task {}: {}", task.id, e.what());
    return HandlerResult::failure(e.what());
  } catch (...) {
    spdlog::error("[Runtime] Handler threw a non-standard exception for task {}", task.id);
    return HandlerResult::failure("Handler failed with an unknown error");
  }
}

Task AgentRuntime::finish_task(const Task& task, HandlerResult outcome) {
  Result<Task> result;
  if (outcome.ok()) {
    result = tasks_.complete_task(task.id, outcome.reply ? std::move(*outcome.reply) : Message::agent(""));
  } else {
    spdlog::warn("[Runtime] Task {} failed: {}", task.id, *outcome.error);
    result = tasks_.fail_task(task.id, *outcome.error, std::move(outcome.reply));
  }

  if (result.ok()) {
    return std::move(*result.value);
  }

  spdlog::error("[Runtime] Could not finish task {}: {}", task.id, *result.error);
  return tasks_.get(task.id).value_or(task);
}

}  // namespace a2a
