#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <string>

#include "a2a/core/envelope.hpp"
#include "a2a/core/message.hpp"
#include "a2a/core/types.hpp"

namespace a2a {

// Outbound message/send seam. The future resolves to the decoded response
// envelope; transport failures, timeouts, non-2xx statuses and undecodable
// bodies resolve to an error.
class DownstreamCaller {
 public:
  virtual ~DownstreamCaller() = default;

  virtual std::future<Result<JsonRpcResponse>> send_message(const std::string& url, const Message& message,
                                                            std::chrono::milliseconds timeout) = 0;
};

using DownstreamCallerPtr = std::shared_ptr<DownstreamCaller>;

}  // namespace a2a
