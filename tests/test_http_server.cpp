#include <gtest/gtest.h>

#include <array>
#include <asio.hpp>
#include <atomic>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include "a2a/client/a2a_client.hpp"
#include "a2a/net/http_client.hpp"
#include "a2a/plugin/credential_gatekeeper.hpp"
#include "a2a/runtime/agent_server.hpp"

using namespace a2a;
using namespace std::chrono_literals;

namespace {

// 在回环地址的临时端口上运行一个 Agent
class AgentServerTest : public ::testing::Test {
 protected:
  void start_agent(bool streaming, size_t max_body_bytes = 1024 * 1024, bool with_auth = false) {
    AgentIdentity identity;
    identity.name = "Loopback Agent";
    identity.description = "HTTP integration test agent";
    identity.capabilities[capability::kStreaming] = streaming;

    std::shared_ptr<plugin::CredentialGatekeeper> gatekeeper;
    if (with_auth) {
      gatekeeper = std::make_shared<plugin::CredentialGatekeeper>();
      gatekeeper->register_scheme(std::make_shared<plugin::ApiKeyScheme>(std::set<std::string>{"secret"}));
      identity.security_schemes = gatekeeper->security_schemes();
    }

    auto handler = std::make_shared<FunctionHandler>([](const Message& inbound, const Task&, const HandlerContext& ctx) {
      ctx.progress("Processing...");
      ctx.progress("Almost done...");
      return HandlerResult::success(Message::agent("echo: " + inbound.text(), {{"length", inbound.text().size()}}));
    });

    runtime_ = std::make_shared<AgentRuntime>(identity, handler);
    if (gatekeeper) runtime_->add_interceptor(gatekeeper);

    net::HttpServerOptions options;
    options.host = "127.0.0.1";
    options.port = 0;
    options.max_body_bytes = max_body_bytes;
    options.io_threads = io_threads_;
    options.read_timeout = read_timeout_;
    server_ = std::make_unique<AgentServer>(runtime_, options);

    auto started = server_->start();
    ASSERT_TRUE(started.ok()) << started.error.value_or("");
    base_url_ = "http://127.0.0.1:" + std::to_string(*started.value);
    rpc_url_ = base_url_ + paths::kRpc;
  }

  void TearDown() override {
    if (server_) server_->stop();
  }

  net::HttpResponse raw_request(const std::string& path, const std::string& method, const std::string& body = "") {
    asio::io_context io_ctx;
    net::HttpClient client(io_ctx);

    net::HttpOptions options;
    options.method = method;
    options.body = body;
    options.timeout = 5000ms;
    if (!body.empty()) options.headers["Content-Type"] = "application/json";

    auto future = client.request(base_url_ + path, options);
    io_ctx.run();
    return future.get();
  }

  size_t io_threads_ = 1;
  std::chrono::milliseconds read_timeout_ = 30000ms;
  std::shared_ptr<AgentRuntime> runtime_;
  std::unique_ptr<AgentServer> server_;
  std::string base_url_;
  std::string rpc_url_;
};

}  // namespace

// --- AgentServerTest ---

TEST_F(AgentServerTest, ServesAgentCard) {
  start_agent(false);
  A2AClient client;

  auto card = client.get_agent_card(base_url_).get();

  ASSERT_TRUE(card.ok()) << card.error.value_or("");
  EXPECT_EQ(card.value->name, "Loopback Agent");
  EXPECT_FALSE(card.value->capabilities.at("streaming"));
}

TEST_F(AgentServerTest, Health) {
  start_agent(false);

  auto response = raw_request(paths::kHealth, "GET");

  ASSERT_TRUE(response.ok()) << response.error;
  auto body = json::parse(response.body);
  EXPECT_EQ(body["status"], "ok");
  EXPECT_EQ(body["agent"], "Loopback Agent");
}

TEST_F(AgentServerTest, UnknownPathAndWrongMethod) {
  start_agent(false);

  EXPECT_EQ(raw_request("/nope", "GET").status_code, 404);
  EXPECT_EQ(raw_request(paths::kRpc, "GET").status_code, 405);
  EXPECT_EQ(raw_request(paths::kAgentCard, "POST", "{}").status_code, 405);
}

TEST_F(AgentServerTest, SendMessage) {
  start_agent(false);
  A2AClient client;

  auto result = client.send_message(rpc_url_, Message::user("hello")).get();

  ASSERT_TRUE(result.ok()) << result.error.value_or("");
  ASSERT_TRUE(result.value->ok());
  auto task = Task::from_json(result.value->result());
  EXPECT_EQ(task.status.state, TaskState::Completed);
  EXPECT_EQ(task.status.message->text(), "echo: hello");
  EXPECT_EQ((*task.status.message->data())["length"], 5);
  EXPECT_EQ(runtime_->tasks().size(), 1u);
}

TEST_F(AgentServerTest, MalformedBodyGetsEnvelopeError) {
  start_agent(false);

  auto response = raw_request(paths::kRpc, "POST", "{oops");

  ASSERT_EQ(response.status_code, 200);
  auto envelope = JsonRpcResponse::from_json(json::parse(response.body));
  EXPECT_FALSE(envelope.ok());
  EXPECT_EQ(envelope.error().code, error_codes::kInternalError);
}

TEST_F(AgentServerTest, OversizedBodyRejected) {
  start_agent(false, 256);

  auto response = raw_request(paths::kRpc, "POST", std::string(300, 'x'));

  EXPECT_EQ(response.status_code, 413);
  EXPECT_EQ(runtime_->tasks().size(), 0u);
}

TEST_F(AgentServerTest, ConcurrentSends) {
  start_agent(false);
  A2AClient client;

  std::vector<std::future<Result<JsonRpcResponse>>> futures;
  for (int i = 0; i < 8; ++i) {
    futures.push_back(client.send_message(rpc_url_, Message::user("msg " + std::to_string(i))));
  }

  for (auto& future : futures) {
    auto result = future.get();
    ASSERT_TRUE(result.ok()) << result.error.value_or("");
    EXPECT_EQ(Task::from_json(result.value->result()).status.state, TaskState::Completed);
  }
  EXPECT_EQ(runtime_->tasks().size(), 8u);
}

TEST_F(AgentServerTest, SendsFromManyThreads) {
  io_threads_ = 2;
  start_agent(false);
  A2AClient client;

  // 多个线程共用同一个客户端并发发起请求
  std::atomic<int> completed{0};
  std::vector<std::thread> senders;
  for (int t = 0; t < 4; ++t) {
    senders.emplace_back([&, t] {
      for (int i = 0; i < 4; ++i) {
        auto result = client.send_message(rpc_url_, Message::user("thread " + std::to_string(t) + " msg " + std::to_string(i))).get();
        if (result.ok() && result.value->ok() && Task::from_json(result.value->result()).status.state == TaskState::Completed) {
          completed++;
        }
      }
    });
  }
  for (auto& sender : senders) {
    sender.join();
  }

  EXPECT_EQ(completed.load(), 16);
  EXPECT_EQ(runtime_->tasks().size(), 16u);
}

TEST_F(AgentServerTest, IdleConnectionClosedAfterReadTimeout) {
  io_threads_ = 2;
  read_timeout_ = 200ms;
  start_agent(false);

  asio::io_context io_ctx;
  asio::ip::tcp::socket socket(io_ctx);
  socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), server_->port()));
  asio::write(socket, asio::buffer(std::string("POST /a2a/v1 HTTP/1.1\r\n")));

  // 服务端超时后关闭连接，读取应返回错误而不是数据
  std::array<char, 64> scratch{};
  asio::error_code ec;
  auto n = socket.read_some(asio::buffer(scratch), ec);
  EXPECT_TRUE(ec);
  EXPECT_EQ(n, 0u);

  // 超时不影响正常请求
  A2AClient client;
  auto result = client.send_message(rpc_url_, Message::user("after timeout")).get();
  ASSERT_TRUE(result.ok()) << result.error.value_or("");
  EXPECT_EQ(Task::from_json(result.value->result()).status.state, TaskState::Completed);
}

TEST_F(AgentServerTest, AuthRequired) {
  start_agent(false, 1024 * 1024, true);

  A2AClient anonymous;
  auto rejected = anonymous.send_message(rpc_url_, Message::user("hi")).get();
  ASSERT_TRUE(rejected.ok()) << rejected.error.value_or("");
  ASSERT_FALSE(rejected.value->ok());
  EXPECT_EQ(rejected.value->error().code, error_codes::kAuthRequired);

  ClientOptions options;
  options.headers["X-API-Key"] = "secret";
  A2AClient authorized(options);
  auto accepted = authorized.send_message(rpc_url_, Message::user("hi")).get();
  ASSERT_TRUE(accepted.ok());
  EXPECT_TRUE(accepted.value->ok());

  // 发现文档无需认证，并公布认证方案
  auto card = anonymous.get_agent_card(base_url_).get();
  ASSERT_TRUE(card.ok());
  EXPECT_EQ(card.value->security_schemes.count("apiKey"), 1u);
}

TEST_F(AgentServerTest, StreamMessage) {
  start_agent(true);

  std::vector<TaskStatusUpdateEvent> updates;
  std::promise<std::string> done;
  A2AClient client;
  client.stream_message(
      rpc_url_, Message::user("analyze"),
      [&](const JsonRpcResponse& event) {
        if (event.ok()) updates.push_back(TaskStatusUpdateEvent::from_json(event.result()));
      },
      [&](const std::string& error) {
        done.set_value(error);
      });

  auto future = done.get_future();
  ASSERT_EQ(future.wait_for(10s), std::future_status::ready);
  EXPECT_EQ(future.get(), "");

  ASSERT_EQ(updates.size(), 4u);
  EXPECT_EQ(updates[0].status.message->text(), "Task accepted");
  EXPECT_EQ(updates[1].status.message->text(), "Processing...");
  EXPECT_EQ(updates[2].status.message->text(), "Almost done...");
  EXPECT_TRUE(updates[3].final);
  EXPECT_EQ(updates[3].status.state, TaskState::Completed);
  EXPECT_EQ(updates[3].status.message->text(), "echo: analyze");
}

TEST_F(AgentServerTest, StreamRejectedByNonStreamingAgent) {
  start_agent(false);

  std::vector<JsonRpcResponse> events;
  std::promise<std::string> done;
  A2AClient client;
  client.stream_message(
      rpc_url_, Message::user("analyze"),
      [&](const JsonRpcResponse& event) {
        events.push_back(event);
      },
      [&](const std::string& error) {
        done.set_value(error);
      });

  auto future = done.get_future();
  ASSERT_EQ(future.wait_for(10s), std::future_status::ready);

  ASSERT_EQ(events.size(), 1u);
  EXPECT_FALSE(events[0].ok());
  EXPECT_EQ(events[0].error().code, error_codes::kMethodNotFound);
  EXPECT_EQ(runtime_->tasks().size(), 0u);
}

// --- HttpClientTest ---

TEST(HttpClientTest, ShortBodyIsAnError) {
  asio::io_context server_ctx;
  asio::ip::tcp::acceptor acceptor(server_ctx, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  auto port = acceptor.local_endpoint().port();

  // 声明 100 字节，只发送 10 字节后关闭
  std::thread peer([&] {
    asio::ip::tcp::socket socket(server_ctx);
    acceptor.accept(socket);
    asio::streambuf request;
    asio::error_code ec;
    asio::read_until(socket, request, "\r\n\r\n", ec);
    std::string reply = "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 100\r\n\r\n0123456789";
    asio::write(socket, asio::buffer(reply), ec);
    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket.close(ec);
  });

  asio::io_context io_ctx;
  net::HttpClient client(io_ctx);
  net::HttpOptions options;
  options.method = "GET";
  options.timeout = 5000ms;
  auto future = client.request("http://127.0.0.1:" + std::to_string(port) + "/", options);
  io_ctx.run();
  auto response = future.get();
  peer.join();

  EXPECT_EQ(response.status_code, 200);
  EXPECT_EQ(response.body, "0123456789");
  EXPECT_FALSE(response.ok());
  EXPECT_NE(response.error.find("truncated"), std::string::npos) << response.error;
}

// --- BaseUrlTest ---

TEST(BaseUrlTest, StripsPath) {
  EXPECT_EQ(base_url_of("http://localhost:8001/a2a/v1"), "http://localhost:8001");
  EXPECT_EQ(base_url_of("https://agents.example.org/a2a/v1"), "https://agents.example.org");
}
