#pragma once

#include <optional>
#include <string>
#include <variant>

#include "a2a/core/types.hpp"

namespace a2a {

constexpr const char* kJsonRpcVersion = "2.0";

namespace methods {
constexpr const char* kMessageSend = "message/send";
constexpr const char* kMessageStream = "message/stream";
}  // namespace methods

// HTTP routes every agent serves
namespace paths {
constexpr const char* kAgentCard = "/.well-known/agent.json";
constexpr const char* kRpc = "/a2a/v1";
constexpr const char* kHealth = "/health";
}  // namespace paths

namespace error_codes {
constexpr int kMethodNotFound = -32601;
constexpr int kInternalError = -32603;
// Agent-defined; returned by credential interceptors
constexpr int kAuthRequired = -32001;
}  // namespace error_codes

struct JsonRpcError {
  int code = error_codes::kInternalError;
  std::string message;
  std::optional<json> data;

  json to_json() const;
  static JsonRpcError from_json(const json& j);

  static JsonRpcError method_not_found(const std::string& method);
  static JsonRpcError internal(const std::string& detail);
};

// Request envelope: {jsonrpc, id, method, params}
struct JsonRpcRequest {
  json id;  // string or integer, echoed verbatim
  std::string method;
  json params = json::object();

  json to_json() const;
};

// Response envelope. Success and failure are mutually exclusive: a response is
// only constructed through success() or failure().
class JsonRpcResponse {
 public:
  static JsonRpcResponse success(json id, json result);
  static JsonRpcResponse failure(json id, JsonRpcError error);

  const json& id() const {
    return id_;
  }

  bool ok() const {
    return std::holds_alternative<json>(body_);
  }

  // Precondition: ok()
  const json& result() const {
    return std::get<json>(body_);
  }

  // Precondition: !ok()
  const JsonRpcError& error() const {
    return std::get<JsonRpcError>(body_);
  }

  // Empty when ok()
  std::string error_message() const;

  json to_json() const;

  // Throws std::invalid_argument when neither or both of result/error are present
  static JsonRpcResponse from_json(const json& j);

 private:
  JsonRpcResponse(json id, std::variant<json, JsonRpcError> body) : id_(std::move(id)), body_(std::move(body)) {}

  json id_;
  std::variant<json, JsonRpcError> body_;
};

// Outcome of decoding one inbound payload: either a request or a ready-made
// error response that still carries whatever id could be read.
struct DecodedRequest {
  std::optional<JsonRpcRequest> request;
  std::optional<JsonRpcResponse> rejection;

  bool ok() const {
    return request.has_value();
  }
};

DecodedRequest decode_request(const std::string& payload);

}  // namespace a2a
