#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "a2a/card/agent_card.hpp"
#include "a2a/core/envelope.hpp"
#include "a2a/core/message.hpp"
#include "a2a/core/types.hpp"
#include "a2a/runtime/handler.hpp"
#include "a2a/runtime/interceptor.hpp"
#include "a2a/task/task_store.hpp"

namespace a2a {

// An accepted message/stream request, ready to be driven by run_stream()
struct StreamJob {
  JsonRpcRequest request;
  Message inbound;
};

// Routing outcome for one payload: a complete response, or a stream job
struct Dispatch {
  std::optional<JsonRpcResponse> response;
  std::optional<StreamJob> stream;

  bool is_stream() const {
    return stream.has_value();
  }
};

// Receives each event envelope of a stream; returns false once the peer is gone
using StreamSink = std::function<bool(const JsonRpcResponse& event)>;

// Agent runtime
//
// Binds one capability handler to envelope dispatch and the task lifecycle.
// Transport-agnostic: the HTTP server feeds it raw bodies and headers.
class AgentRuntime {
 public:
  AgentRuntime(AgentIdentity identity, CapabilityHandlerPtr handler, TaskStoreOptions task_options = {});

  // Interceptors run in registration order
  void add_interceptor(RequestInterceptorPtr interceptor);

  const AgentCard& card() const {
    return card_;
  }

  const AgentIdentity& identity() const {
    return identity_;
  }

  TaskStore& tasks() {
    return tasks_;
  }

  const TaskStore& tasks() const {
    return tasks_;
  }

  bool streaming_enabled() const {
    return identity_.supports(capability::kStreaming);
  }

  // Decode, intercept and route one inbound payload
  Dispatch dispatch(const std::string& payload, const Headers& headers = {});

  // Synchronous path: one task, at most one transition
  JsonRpcResponse handle_send(const JsonRpcRequest& request, const Message& inbound);

  // Streaming path: emits the acceptance event, one event per handler stage,
  // then exactly one final event. Runs the task to completion even if the
  // sink reports a disconnect.
  void run_stream(const StreamJob& job, const StreamSink& sink);

 private:
  // Runs the handler, converting exceptions into a failure
  HandlerResult invoke_handler(const Message& inbound, const Task& task, const HandlerContext& ctx);

  // Applies the handler outcome to the task store
  Task finish_task(const Task& task, HandlerResult outcome);

  AgentIdentity identity_;
  AgentCard card_;
  CapabilityHandlerPtr handler_;
  TaskStore tasks_;

  std::mutex interceptors_mutex_;
  std::vector<RequestInterceptorPtr> interceptors_;
};

}  // namespace a2a
