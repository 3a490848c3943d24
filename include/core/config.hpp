#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace sandtimer::core {

struct BackendConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{61420};
  std::chrono::milliseconds timeout{5000};
};

struct ServerConfig {
  BackendConfig backend{};
  std::string protocol_version{"2024-05-14"};
  bool debug{false};
};

ServerConfig load_server_config(const std::string& path);

// SANDTIMER_HOST, SANDTIMER_PORT, SANDTIMER_TIMEOUT_MS, SANDTIMER_MCP_DEBUG.
void apply_env_overrides(ServerConfig& config);

}  // namespace sandtimer::core
