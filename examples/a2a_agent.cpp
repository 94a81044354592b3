// a2a_agent: runs one hospital agent until SIGINT/SIGTERM
//
//   a2a_agent <coordinator|patient|secure-patient|doctor|booking|analysis>
//             [--config FILE] [--port N] [--log-level L]

#include <asio.hpp>
#include <csignal>
#include <iostream>
#include <optional>
#include <set>
#include <string>

#include "a2a/a2a.hpp"
#include "a2a/version.hpp"
#include "hospital/hospital_agents.hpp"
#include "spdlog/cfg/env.h"
#include "spdlog/spdlog.h"

using namespace a2a;

static void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " <coordinator|patient|secure-patient|doctor|booking|analysis> [--config FILE] [--port N] [--log-level L]\n";
}

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  std::string role = argv[1];
  auto defaults = hospital::default_config(role);
  if (!defaults) {
    std::cerr << "Unknown agent role: " << role << "\n";
    print_usage(argv[0]);
    return 1;
  }

  std::optional<std::string> config_file;
  std::optional<std::string> port_arg;
  std::optional<std::string> level_arg;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (i + 1 >= argc) {
      print_usage(argv[0]);
      return 1;
    }
    if (arg == "--config") {
      config_file = argv[++i];
    } else if (arg == "--port") {
      port_arg = argv[++i];
    } else if (arg == "--log-level") {
      level_arg = argv[++i];
    } else {
      print_usage(argv[0]);
      return 1;
    }
  }

  // Role defaults, replaced by a config file, then env, then flags
  Config config = config_file ? Config::load(*config_file) : *defaults;
  config.apply_env();
  if (port_arg) {
    try {
      config.server.port = static_cast<uint16_t>(std::stoi(*port_arg));
    } catch (const std::exception&) {
      std::cerr << "Invalid port: " << *port_arg << "\n";
      return 1;
    }
  }
  if (level_arg) config.log_level = *level_arg;

  a2a::init(config, true);
  spdlog::cfg::load_env_levels();

  std::cout << config.agent.name << " (a2a " << A2A_VERSION_STRING << ")\n";

  // Coordinator forwards the first configured API key downstream
  ClientOptions client_options;
  if (!config.auth.api_keys.empty()) {
    client_options.headers["X-API-Key"] = config.auth.api_keys.front();
  }
  auto client = std::make_shared<A2AClient>(client_options);

  auto handler = hospital::make_handler(role, config, client);
  auto identity = config.identity();

  std::shared_ptr<plugin::CredentialGatekeeper> gatekeeper;
  if (config.auth.enabled && config.auth.api_keys.empty() && config.auth.bearer_tokens.empty()) {
    std::cerr << "Authentication is enabled but no API keys or bearer tokens are configured (set A2A_API_KEYS)\n";
    return 1;
  }
  if (config.auth.enabled) {
    gatekeeper = std::make_shared<plugin::CredentialGatekeeper>();
    if (!config.auth.api_keys.empty()) {
      gatekeeper->register_scheme(std::make_shared<plugin::ApiKeyScheme>(
          std::set<std::string>(config.auth.api_keys.begin(), config.auth.api_keys.end())));
    }
    if (!config.auth.bearer_tokens.empty()) {
      gatekeeper->register_scheme(std::make_shared<plugin::BearerScheme>(
          std::set<std::string>(config.auth.bearer_tokens.begin(), config.auth.bearer_tokens.end())));
    }
    identity.security_schemes = gatekeeper->security_schemes();
  }

  auto runtime = std::make_shared<AgentRuntime>(identity, handler, config.task_options());
  if (gatekeeper) runtime->add_interceptor(gatekeeper);

  auto task_log = Bus::instance().subscribe_scoped<events::TaskUpdated>([](const events::TaskUpdated& e) {
    if (is_terminal(task_state_from_string(e.state))) {
      spdlog::info("[Main] Task {} {} ({} messages)", e.task_id, e.state, e.history_size);
    }
  });
  auto step_log = Bus::instance().subscribe_scoped<events::StepFinished>([](const events::StepFinished& e) {
    spdlog::info("[Main] Task {}: step '{}' {}", e.coordinator_task_id, e.step, e.success ? "ok" : "failed");
  });

  net::HttpServerOptions server_options;
  server_options.host = config.server.host;
  server_options.port = config.server.port;
  server_options.io_threads = config.server.io_threads;
  server_options.handler_threads = config.server.handler_threads;
  server_options.max_body_bytes = config.server.max_body_bytes;

  AgentServer server(runtime, server_options);
  auto started = server.start();
  if (!started.ok()) {
    std::cerr << "Failed to start: " << started.error.value_or("unknown error") << "\n";
    return 1;
  }

  std::cout << "Listening on " << config.server.host << ":" << *started.value << "\n";
  std::cout << "Agent card: http://localhost:" << *started.value << paths::kAgentCard << "\n";

  asio::io_context signal_ctx;
  asio::signal_set signals(signal_ctx, SIGINT, SIGTERM);
  signals.async_wait([&](const asio::error_code& ec, int signal_number) {
    if (!ec) {
      spdlog::info("[Main] Received signal {}, shutting down", signal_number);
    }
  });
  signal_ctx.run();

  server.stop();
  std::cout << "Stopped.\n";
  return 0;
}
