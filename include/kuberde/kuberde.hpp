#pragma once

// Core types
#include "core/config.hpp"
#include "core/identity.hpp"
#include "core/route.hpp"
#include "core/types.hpp"

// Components
#include "agent/tunnel_agent.hpp"
#include "controller/controller.hpp"
#include "relay/relay_server.hpp"

namespace kuberde {

// Installs the process-wide logger for one binary (kuberde-server, kuberde-agent, ...)
void init(const std::string& name, const LogConfig& log = {});

// Get version string
std::string version();

}  // namespace kuberde
