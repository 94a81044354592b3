#include "a2a/client/a2a_client.hpp"

#include <spdlog/spdlog.h>

#include "a2a/core/uuid.hpp"
#include "a2a/net/sse.hpp"

namespace a2a {

namespace {

std::string strip_trailing_slash(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

Result<JsonRpcResponse> decode_response(const net::HttpResponse& response) {
  if (!response.error.empty()) {
    return Result<JsonRpcResponse>::failure(response.error);
  }
  if (!response.ok()) {
    return Result<JsonRpcResponse>::failure("HTTP " + std::to_string(response.status_code) + ": " + response.body);
  }

  try {
    return Result<JsonRpcResponse>::success(JsonRpcResponse::from_json(json::parse(response.body)));
  } catch (const std::exception& e) {
    return Result<JsonRpcResponse>::failure(std::string("Invalid response envelope: ") + e.what());
  }
}

}  // namespace

A2AClient::A2AClient(ClientOptions options) : options_(std::move(options)), work_(asio::make_work_guard(io_ctx_)), http_(io_ctx_) {
  io_thread_ = std::thread([this] {
    io_ctx_.run();
  });
}

A2AClient::~A2AClient() {
  work_.reset();
  io_ctx_.stop();
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
}

JsonRpcRequest A2AClient::make_request(const std::string& method, const Message& message) {
  JsonRpcRequest request;
  request.id = UUID::generate();
  request.method = method;
  request.params = {{"message", message.to_json()}};
  return request;
}

std::future<Result<JsonRpcResponse>> A2AClient::send_message(const std::string& url, const Message& message, std::chrono::milliseconds timeout) {
  auto request = make_request(methods::kMessageSend, message);

  net::HttpOptions http_options;
  http_options.method = "POST";
  http_options.headers = options_.headers;
  http_options.headers["Content-Type"] = "application/json";
  http_options.body = request.to_json().dump();
  http_options.timeout = timeout;

  spdlog::debug("[A2AClient] message/send {} (id {})", url, request.id.get<std::string>());

  auto promise = std::make_shared<std::promise<Result<JsonRpcResponse>>>();
  auto future = promise->get_future();

  http_.request(url, http_options, [promise, url](net::HttpResponse response) {
    auto result = decode_response(response);
    if (result.failed()) {
      spdlog::warn("[A2AClient] message/send {} failed: {}", url, *result.error);
    }
    promise->set_value(std::move(result));
  });

  return future;
}

std::future<Result<AgentCard>> A2AClient::get_agent_card(const std::string& base_url) {
  auto url = strip_trailing_slash(base_url) + paths::kAgentCard;

  net::HttpOptions http_options;
  http_options.headers = options_.headers;
  http_options.timeout = options_.timeout;

  auto promise = std::make_shared<std::promise<Result<AgentCard>>>();
  auto future = promise->get_future();

  http_.request(url, http_options, [promise, url](net::HttpResponse response) {
    if (!response.ok()) {
      auto error = response.error.empty() ? "HTTP " + std::to_string(response.status_code) : response.error;
      spdlog::warn("[A2AClient] Discovery {} failed: {}", url, error);
      promise->set_value(Result<AgentCard>::failure(error));
      return;
    }

    try {
      promise->set_value(Result<AgentCard>::success(AgentCard::from_json(json::parse(response.body))));
    } catch (const std::exception& e) {
      promise->set_value(Result<AgentCard>::failure(std::string("Invalid agent card: ") + e.what()));
    }
  });

  return future;
}

void A2AClient::stream_message(const std::string& url, const Message& message, std::function<void(const JsonRpcResponse&)> on_event,
                               std::function<void(const std::string& error)> on_complete) {
  auto request = make_request(methods::kMessageStream, message);

  net::HttpOptions http_options;
  http_options.method = "POST";
  http_options.headers = options_.headers;
  http_options.headers["Content-Type"] = "application/json";
  http_options.headers["Accept"] = "text/event-stream";
  http_options.body = request.to_json().dump();
  http_options.timeout = options_.timeout;

  // A non-streaming agent answers with a plain JSON-RPC error body; the parser
  // only sees "data:" lines, so that body is kept aside and decoded at the end
  auto raw = std::make_shared<std::string>();
  auto parser = std::make_shared<net::SseParser>([on_event](const net::SseEvent& event) {
    try {
      on_event(JsonRpcResponse::from_json(json::parse(event.data)));
    } catch (const std::exception& e) {
      spdlog::warn("[A2AClient] Skipping undecodable stream event: {}", e.what());
    }
  });

  http_.request_stream(
      url, http_options,
      [parser, raw](const std::string& chunk) {
        if (raw->size() < 64 * 1024) *raw += chunk;
        parser->feed(chunk);
      },
      [parser, raw, on_event, on_complete](int status_code, const std::string& error) {
        parser->finish();
        if (!error.empty()) {
          on_complete(error);
          return;
        }

        if (!raw->empty() && raw->front() == '{') {
          try {
            on_event(JsonRpcResponse::from_json(json::parse(*raw)));
          } catch (const std::exception& e) {
            on_complete(std::string("Invalid response envelope: ") + e.what());
            return;
          }
        }
        spdlog::debug("[A2AClient] Stream closed (HTTP {})", status_code);
        on_complete("");
      });
}

std::string base_url_of(const std::string& rpc_url) {
  auto parsed = net::ParsedUrl::parse(rpc_url);
  if (!parsed) return strip_trailing_slash(rpc_url);

  std::string base = parsed->scheme + "://" + parsed->host;
  if (!parsed->port.empty()) {
    base += ":" + parsed->port;
  }
  return base;
}

}  // namespace a2a
