#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "a2a/core/types.hpp"
#include "a2a/net/http_server.hpp"
#include "a2a/runtime/agent_runtime.hpp"

namespace a2a {

// HTTP binding of an AgentRuntime:
//   GET  /.well-known/agent.json  -> AgentCard
//   GET  /health                  -> {"status":"ok", ...}
//   POST /a2a/v1                  -> JSON-RPC (or SSE for message/stream)
class AgentServer {
 public:
  AgentServer(std::shared_ptr<AgentRuntime> runtime, net::HttpServerOptions options);

  Result<uint16_t> start();

  void stop();

  uint16_t port() const {
    return server_.port();
  }

  AgentRuntime& runtime() {
    return *runtime_;
  }

 private:
  void handle(const net::HttpRequest& request, net::HttpExchange& exchange);

  void handle_rpc(const net::HttpRequest& request, net::HttpExchange& exchange);

  std::shared_ptr<AgentRuntime> runtime_;
  net::HttpServer server_;
};

}  // namespace a2a
