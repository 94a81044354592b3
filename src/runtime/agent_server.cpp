#include "a2a/runtime/agent_server.hpp"

#include <spdlog/spdlog.h>

#include "a2a/net/sse.hpp"

namespace a2a {

namespace {

constexpr const char* kJson = "application/json";

void respond_json(net::HttpExchange& exchange, int status, const json& body) {
  exchange.respond(status, kJson, body.dump());
}

}  // namespace

AgentServer::AgentServer(std::shared_ptr<AgentRuntime> runtime, net::HttpServerOptions options)
    : runtime_(std::move(runtime)), server_(std::move(options), [this](const net::HttpRequest& request, net::HttpExchange& exchange) {
        handle(request, exchange);
      }) {}

Result<uint16_t> AgentServer::start() {
  auto started = server_.start();
  if (started.ok()) {
    spdlog::info("[AgentServer] {} serving on port {}", runtime_->card().name, *started.value);
  }
  return started;
}

void AgentServer::stop() {
  server_.stop();
}

void AgentServer::handle(const net::HttpRequest& request, net::HttpExchange& exchange) {
  spdlog::debug("[AgentServer] {} {}", request.method, request.path);

  if (request.path == paths::kAgentCard) {
    if (request.method != "GET") {
      respond_json(exchange, 405, {{"error", "Method not allowed"}});
      return;
    }
    respond_json(exchange, 200, runtime_->card().to_json());
  } else if (request.path == paths::kHealth) {
    respond_json(exchange, 200, {{"status", "ok"}, {"agent", runtime_->card().name}, {"tasks", runtime_->tasks().size()}});
  } else if (request.path == paths::kRpc) {
    if (request.method != "POST") {
      respond_json(exchange, 405, {{"error", "Method not allowed"}});
      return;
    }
    handle_rpc(request, exchange);
  } else {
    respond_json(exchange, 404, {{"error", "Not found"}, {"path", request.path}});
  }
}

void AgentServer::handle_rpc(const net::HttpRequest& request, net::HttpExchange& exchange) {
  auto dispatch = runtime_->dispatch(request.body, request.headers);

  if (!dispatch.is_stream()) {
    respond_json(exchange, 200, dispatch.response->to_json());
    return;
  }

  bool open = exchange.start_stream("text/event-stream");
  runtime_->run_stream(*dispatch.stream, [&](const JsonRpcResponse& event) {
    if (!open) return false;
    open = exchange.write(net::format_sse_event(event.to_json().dump()));
    return open;
  });
}

}  // namespace a2a
