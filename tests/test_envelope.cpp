#include <gtest/gtest.h>

#include "a2a/core/envelope.hpp"

using namespace a2a;

// --- DecodeRequestTest ---

TEST(DecodeRequestTest, ValidRequest) {
  auto decoded = decode_request(R"({"jsonrpc":"2.0","id":"req-1","method":"message/send","params":{"message":{}}})");

  ASSERT_TRUE(decoded.ok());
  EXPECT_EQ(decoded.request->id, "req-1");
  EXPECT_EQ(decoded.request->method, methods::kMessageSend);
  EXPECT_TRUE(decoded.request->params.contains("message"));
}

TEST(DecodeRequestTest, IntegerIdIsKept) {
  auto decoded = decode_request(R"({"jsonrpc":"2.0","id":42,"method":"message/send"})");

  ASSERT_TRUE(decoded.ok());
  EXPECT_EQ(decoded.request->id, 42);
  // 缺省 params 为空对象
  EXPECT_TRUE(decoded.request->params.is_object());
}

TEST(DecodeRequestTest, MalformedJson) {
  auto decoded = decode_request("{not json");

  ASSERT_FALSE(decoded.ok());
  ASSERT_TRUE(decoded.rejection.has_value());
  EXPECT_FALSE(decoded.rejection->ok());
  EXPECT_EQ(decoded.rejection->error().code, error_codes::kInternalError);
  EXPECT_TRUE(decoded.rejection->id().is_null());
}

TEST(DecodeRequestTest, NonObjectPayload) {
  auto decoded = decode_request("[1,2,3]");

  ASSERT_FALSE(decoded.ok());
  EXPECT_EQ(decoded.rejection->error().code, error_codes::kInternalError);
}

TEST(DecodeRequestTest, MissingMethodEchoesId) {
  auto decoded = decode_request(R"({"jsonrpc":"2.0","id":"abc"})");

  ASSERT_FALSE(decoded.ok());
  EXPECT_EQ(decoded.rejection->id(), "abc");
  EXPECT_EQ(decoded.rejection->error().code, error_codes::kInternalError);
}

TEST(DecodeRequestTest, InvalidId) {
  auto decoded = decode_request(R"({"jsonrpc":"2.0","id":{"x":1},"method":"message/send"})");

  ASSERT_FALSE(decoded.ok());
  EXPECT_TRUE(decoded.rejection->id().is_null());
}

// --- JsonRpcResponseTest ---

TEST(JsonRpcResponseTest, SuccessShape) {
  auto response = JsonRpcResponse::success("req-1", {{"kind", "task"}});

  auto j = response.to_json();
  EXPECT_EQ(j["jsonrpc"], "2.0");
  EXPECT_EQ(j["id"], "req-1");
  EXPECT_EQ(j["result"]["kind"], "task");
  EXPECT_FALSE(j.contains("error"));
}

TEST(JsonRpcResponseTest, FailureShape) {
  auto response = JsonRpcResponse::failure(7, JsonRpcError::method_not_found("tasks/get"));

  auto j = response.to_json();
  EXPECT_EQ(j["id"], 7);
  EXPECT_FALSE(j.contains("result"));
  EXPECT_EQ(j["error"]["code"], -32601);
  EXPECT_EQ(j["error"]["message"], "Method not found");
  EXPECT_EQ(j["error"]["data"]["method"], "tasks/get");
  EXPECT_EQ(response.error_message(), "Method not found");
}

TEST(JsonRpcResponseTest, FromJsonRequiresExactlyOneBody) {
  EXPECT_THROW(JsonRpcResponse::from_json({{"jsonrpc", "2.0"}, {"id", 1}}), std::invalid_argument);
  EXPECT_THROW(JsonRpcResponse::from_json({{"jsonrpc", "2.0"}, {"id", 1}, {"result", 1}, {"error", {{"code", 1}}}}), std::invalid_argument);

  auto error = JsonRpcResponse::from_json({{"jsonrpc", "2.0"}, {"id", 1}, {"error", {{"code", -32001}, {"message", "Authentication required"}}}});
  EXPECT_FALSE(error.ok());
  EXPECT_EQ(error.error().code, error_codes::kAuthRequired);

  auto ok = JsonRpcResponse::from_json({{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"kind", "task"}}}});
  EXPECT_TRUE(ok.ok());
  EXPECT_EQ(ok.error_message(), "");
}

TEST(JsonRpcErrorTest, InternalErrorMessage) {
  auto error = JsonRpcError::internal("missing params.message");

  EXPECT_EQ(error.code, -32603);
  EXPECT_EQ(error.message, "Internal error: missing params.message");
  EXPECT_FALSE(error.data.has_value());
}

TEST(JsonRpcRequestTest, ToJson) {
  JsonRpcRequest request;
  request.id = "r";
  request.method = methods::kMessageStream;

  auto j = request.to_json();
  EXPECT_EQ(j["jsonrpc"], "2.0");
  EXPECT_EQ(j["method"], "message/stream");
  EXPECT_TRUE(j["params"].is_object());
}
