#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "a2a/core/message.hpp"
#include "a2a/core/task.hpp"
#include "a2a/core/types.hpp"

namespace a2a {

// Handler execution context
struct HandlerContext {
  TaskId task_id;
  ContextId context_id;

  // Progress callback; on message/stream every call becomes one
  // working status-update, on message/send it is a no-op
  std::function<void(const std::string& stage)> on_progress;

  void progress(const std::string& stage) const {
    if (on_progress) on_progress(stage);
  }
};

// Handler outcome: a reply, or a domain error with an optional partial reply
struct HandlerResult {
  std::optional<Message> reply;
  std::optional<std::string> error;

  bool ok() const {
    return !error.has_value();
  }

  static HandlerResult success(Message reply) {
    return HandlerResult{std::move(reply), std::nullopt};
  }

  static HandlerResult failure(std::string error, std::optional<Message> partial_reply = std::nullopt) {
    return HandlerResult{std::move(partial_reply), std::move(error)};
  }
};

// Capability handler
//
// Invoked once per accepted message/send or message/stream request, possibly
// from several handler threads at once. Implementations guard their own state.
// A thrown std::exception is treated the same as a returned failure.
class CapabilityHandler {
 public:
  virtual ~CapabilityHandler() = default;

  virtual HandlerResult handle(const Message& inbound, const Task& task, const HandlerContext& ctx) = 0;
};

using CapabilityHandlerPtr = std::shared_ptr<CapabilityHandler>;

// Adapter for lambdas and tests
class FunctionHandler : public CapabilityHandler {
 public:
  using Fn = std::function<HandlerResult(const Message&, const Task&, const HandlerContext&)>;

  explicit FunctionHandler(Fn fn) : fn_(std::move(fn)) {}

  HandlerResult handle(const Message& inbound, const Task& task, const HandlerContext& ctx) override {
    return fn_(inbound, task, ctx);
  }

 private:
  Fn fn_;
};

}  // namespace a2a
