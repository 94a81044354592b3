#pragma once

#include <memory>
#include <optional>
#include <string>

#include "a2a/core/envelope.hpp"
#include "a2a/core/types.hpp"

namespace a2a {

// Request middleware run after envelope decode and before method routing.
// Returning an error short-circuits the request; no task is created.
class RequestInterceptor {
 public:
  virtual ~RequestInterceptor() = default;

  virtual std::string name() const = 0;

  virtual std::optional<JsonRpcError> intercept(const JsonRpcRequest& request, const Headers& headers) = 0;
};

using RequestInterceptorPtr = std::shared_ptr<RequestInterceptor>;

}  // namespace a2a
