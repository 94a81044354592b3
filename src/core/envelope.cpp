#include "a2a/core/envelope.hpp"

#include <stdexcept>

namespace a2a {

namespace {

bool is_valid_id(const json& id) {
  return id.is_string() || id.is_number_integer();
}

DecodedRequest reject(json id, const std::string& detail) {
  return DecodedRequest{std::nullopt, JsonRpcResponse::failure(std::move(id), JsonRpcError::internal(detail))};
}

}  // namespace

json JsonRpcError::to_json() const {
  json j;
  j["code"] = code;
  j["message"] = message;
  if (data) {
    j["data"] = *data;
  }
  return j;
}

JsonRpcError JsonRpcError::from_json(const json& j) {
  JsonRpcError error;
  error.code = j.value("code", error_codes::kInternalError);
  error.message = j.value("message", "");
  if (j.contains("data") && !j["data"].is_null()) {
    error.data = j["data"];
  }
  return error;
}

JsonRpcError JsonRpcError::method_not_found(const std::string& method) {
  return JsonRpcError{error_codes::kMethodNotFound, "Method not found", json{{"method", method}}};
}

JsonRpcError JsonRpcError::internal(const std::string& detail) {
  return JsonRpcError{error_codes::kInternalError, "Internal error: " + detail, std::nullopt};
}

json JsonRpcRequest::to_json() const {
  return {
      {"jsonrpc", kJsonRpcVersion},
      {"id", id},
      {"method", method},
      {"params", params},
  };
}

JsonRpcResponse JsonRpcResponse::success(json id, json result) {
  return JsonRpcResponse(std::move(id), std::variant<json, JsonRpcError>(std::in_place_type<json>, std::move(result)));
}

JsonRpcResponse JsonRpcResponse::failure(json id, JsonRpcError error) {
  return JsonRpcResponse(std::move(id), std::variant<json, JsonRpcError>(std::in_place_type<JsonRpcError>, std::move(error)));
}

std::string JsonRpcResponse::error_message() const {
  if (ok()) return "";
  const auto& err = error();
  if (!err.message.empty()) return err.message;
  return err.to_json().dump();
}

json JsonRpcResponse::to_json() const {
  json j;
  j["jsonrpc"] = kJsonRpcVersion;
  j["id"] = id_;
  if (ok()) {
    j["result"] = result();
  } else {
    j["error"] = error().to_json();
  }
  return j;
}

JsonRpcResponse JsonRpcResponse::from_json(const json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("response must be an object");
  }

  json id = j.contains("id") ? j["id"] : json(nullptr);
  bool has_result = j.contains("result");
  bool has_error = j.contains("error") && !j["error"].is_null();

  if (has_result == has_error) {
    throw std::invalid_argument("response must carry exactly one of result or error");
  }

  if (has_error) {
    return failure(std::move(id), JsonRpcError::from_json(j["error"]));
  }
  return success(std::move(id), j["result"]);
}

DecodedRequest decode_request(const std::string& payload) {
  json j;
  try {
    j = json::parse(payload);
  } catch (const json::parse_error& e) {
    return reject(nullptr, std::string("malformed JSON: ") + e.what());
  }

  if (!j.is_object()) {
    return reject(nullptr, "request must be a JSON object");
  }

  json id = j.contains("id") ? j["id"] : json(nullptr);
  if (!is_valid_id(id)) {
    return reject(nullptr, "missing or invalid request id");
  }

  if (!j.contains("method") || !j["method"].is_string()) {
    return reject(id, "missing method");
  }

  JsonRpcRequest request;
  request.id = id;
  request.method = j["method"].get<std::string>();
  if (j.contains("params") && !j["params"].is_null()) {
    request.params = j["params"];
  }

  return DecodedRequest{std::move(request), std::nullopt};
}

}  // namespace a2a
