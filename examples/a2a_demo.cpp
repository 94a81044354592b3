// a2a_demo: drives a running set of hospital agents end to end
//
//   a2a_demo [--coordinator URL] [--patient URL] [--doctor URL]
//            [--booking URL] [--analysis URL]
//
// Discovers every agent card, registers a patient, searches doctors, runs the
// coordinator workflow and, when an analysis agent answers, a streaming run.

#include <future>
#include <iostream>
#include <map>
#include <string>

#include "a2a/a2a.hpp"
#include "a2a/version.hpp"
#include "spdlog/cfg/env.h"

using namespace a2a;

static void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [--coordinator URL] [--patient URL] [--doctor URL] [--booking URL] [--analysis URL]\n";
}

// Prints the task carried by a message/send result
static void print_task(const std::string& title, const Result<JsonRpcResponse>& result) {
  std::cout << "\n=== " << title << " ===\n";
  if (result.failed()) {
    std::cout << "[Transport error: " << *result.error << "]\n";
    return;
  }

  const auto& response = *result.value;
  if (!response.ok()) {
    std::cout << "[Agent error " << response.error().code << ": " << response.error().message << "]\n";
    return;
  }

  try {
    auto task = Task::from_json(response.result());
    std::cout << "Task " << task.id << " -> " << to_string(task.status.state) << "\n";
    if (task.status.message) {
      std::cout << task.status.message->text() << "\n";
      if (auto data = task.status.message->data()) {
        std::cout << data->dump(2) << "\n";
      }
    }
  } catch (const std::exception& e) {
    std::cout << "[Unexpected result: " << e.what() << "]\n";
  }
}

int main(int argc, char* argv[]) {
  std::cout << "a2a " << A2A_VERSION_STRING << " - Hospital Demo\n";
  std::cout << "================================\n";

  spdlog::cfg::load_env_levels();

  std::map<std::string, std::string> agents = {
      {"coordinator", "http://localhost:8000"}, {"patient", "http://localhost:8001"}, {"doctor", "http://localhost:8002"},
      {"booking", "http://localhost:8003"},     {"analysis", "http://localhost:8005"},
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.rfind("--", 0) != 0 || i + 1 >= argc || !agents.count(arg.substr(2))) {
      print_usage(argv[0]);
      return 1;
    }
    agents[arg.substr(2)] = argv[++i];
  }

  A2AClient client;

  // Discovery
  std::cout << "\n=== Discovery ===\n";
  std::map<std::string, AgentCard> cards;
  for (const auto& [role, base_url] : agents) {
    auto card = client.get_agent_card(base_url).get();
    if (card.failed()) {
      std::cout << role << ": unreachable (" << *card.error << ")\n";
      continue;
    }
    std::cout << role << ": " << card.value->name << " v" << card.value->version << " (" << card.value->skills.size() << " skills)\n";
    cards[role] = *card.value;
  }

  auto rpc_url = [&](const std::string& role) {
    auto it = cards.find(role);
    return it != cards.end() ? it->second.url : agents[role] + paths::kRpc;
  };

  if (cards.count("patient")) {
    auto text =
        "Register a new patient:\n"
        "name: John Doe\n"
        "email: john.doe@email.com\n"
        "phone: 555-123-4567";
    print_task("Patient registration", client.send_message(rpc_url("patient"), Message::user(text)).get());
    print_task("Patient lookup", client.send_message(rpc_url("patient"), Message::user("lookup patient john.doe@email.com")).get());
  }

  if (cards.count("doctor")) {
    print_task("Doctor search", client.send_message(rpc_url("doctor"), Message::user("find cardiology doctors")).get());
  }

  if (cards.count("coordinator")) {
    auto request = Message::user("Book appointment for john.doe@email.com with cardiology");
    print_task("Coordinator workflow", client.send_message(rpc_url("coordinator"), request).get());
  }

  if (cards.count("analysis")) {
    if (!cards["analysis"].capabilities["streaming"]) {
      std::cout << "\n[Analysis agent does not advertise streaming]\n";
      return 0;
    }

    std::cout << "\n=== Streaming analysis ===\n";
    std::promise<std::string> done;
    client.stream_message(
        rpc_url("analysis"), Message::user("Analyze patient medical history"),
        [](const JsonRpcResponse& event) {
          if (!event.ok()) {
            std::cout << "[Agent error " << event.error().code << ": " << event.error().message << "]\n";
            return;
          }
          try {
            auto update = TaskStatusUpdateEvent::from_json(event.result());
            std::cout << "[" << to_string(update.status.state) << (update.final ? ", final" : "") << "] "
                      << (update.status.message ? update.status.message->text() : "") << "\n";
          } catch (const std::exception& e) {
            std::cout << "[Unexpected event: " << e.what() << "]\n";
          }
        },
        [&done](const std::string& error) {
          done.set_value(error);
        });

    auto error = done.get_future().get();
    if (!error.empty()) {
      std::cout << "[Stream error: " << error << "]\n";
    }
  }

  return 0;
}
