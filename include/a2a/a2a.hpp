#pragma once

// Core types
#include "a2a/core/config.hpp"
#include "a2a/core/envelope.hpp"
#include "a2a/core/message.hpp"
#include "a2a/core/task.hpp"
#include "a2a/core/types.hpp"
#include "a2a/core/uuid.hpp"

// Event bus
#include "a2a/bus/bus.hpp"

// Capability document
#include "a2a/card/agent_card.hpp"

// Task lifecycle
#include "a2a/task/task_store.hpp"

// Runtime
#include "a2a/runtime/agent_runtime.hpp"
#include "a2a/runtime/agent_server.hpp"
#include "a2a/runtime/handler.hpp"
#include "a2a/runtime/interceptor.hpp"

// Network
#include "a2a/net/http_client.hpp"
#include "a2a/net/http_server.hpp"
#include "a2a/net/sse.hpp"

// Outbound client and orchestration
#include "a2a/client/a2a_client.hpp"
#include "a2a/coordinator/orchestrator.hpp"

// Plugins
#include "a2a/plugin/credential_gatekeeper.hpp"

namespace a2a {

// Initialize logging from the config (level, file, optional stderr echo)
void init(const Config& config, bool console_log = false);

// Get version string
std::string version();

}  // namespace a2a
