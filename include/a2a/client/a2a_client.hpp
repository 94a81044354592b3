#pragma once

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <thread>

#include "a2a/card/agent_card.hpp"
#include "a2a/client/downstream_caller.hpp"
#include "a2a/core/envelope.hpp"
#include "a2a/core/message.hpp"
#include "a2a/core/types.hpp"
#include "a2a/net/http_client.hpp"

namespace a2a {

struct ClientOptions {
  std::chrono::milliseconds timeout{30000};

  // Sent with every request, e.g. X-API-Key
  std::map<std::string, std::string> headers;
};

// A2A client over HTTP. Owns an io_context driven by one background thread.
class A2AClient : public DownstreamCaller {
 public:
  explicit A2AClient(ClientOptions options = {});

  ~A2AClient() override;

  A2AClient(const A2AClient&) = delete;
  A2AClient& operator=(const A2AClient&) = delete;

  std::future<Result<JsonRpcResponse>> send_message(const std::string& url, const Message& message, std::chrono::milliseconds timeout) override;

  std::future<Result<JsonRpcResponse>> send_message(const std::string& url, const Message& message) {
    return send_message(url, message, options_.timeout);
  }

  // GET <base_url>/.well-known/agent.json
  std::future<Result<AgentCard>> get_agent_card(const std::string& base_url);

  // message/stream: on_event receives every decoded event envelope in order,
  // on_complete receives an empty string on a clean end of stream
  void stream_message(const std::string& url, const Message& message, std::function<void(const JsonRpcResponse&)> on_event,
                      std::function<void(const std::string& error)> on_complete);

  static JsonRpcRequest make_request(const std::string& method, const Message& message);

 private:
  ClientOptions options_;
  asio::io_context io_ctx_;
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  net::HttpClient http_;
  std::thread io_thread_;
};

// "http://host:8001/a2a/v1" -> "http://host:8001"
std::string base_url_of(const std::string& rpc_url);

}  // namespace a2a
