#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include "backend/timer_client.hpp"
#include "core/config.hpp"
#include "mcp/server.hpp"

namespace {

std::string format_config_settings(const sandtimer::core::ServerConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[sandtimer-mcp] loaded config from " << (config_path.empty() ? "<defaults>" : config_path)
         << " | backend_address=" << config.backend.host << ':' << config.backend.port
         << " | backend_timeout_ms=" << config.backend.timeout.count()
         << " | protocol_version=" << config.protocol_version
         << " | debug=" << (config.debug ? "true" : "false");
  return output.str();
}

}  // namespace

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "";

  sandtimer::core::ServerConfig config{};
  try {
    if (!config_path.empty()) {
      config = sandtimer::core::load_server_config(config_path);
    }
    sandtimer::core::apply_env_overrides(config);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  auto backend = sandtimer::backend::make_tcp_timer_client(sandtimer::backend::TimerClientOptions{
      .host = config.backend.host, .port = config.backend.port, .timeout = config.backend.timeout});

  sandtimer::mcp::Server server(std::move(backend), sandtimer::mcp::ServerOptions{
                                                        .protocol_version = config.protocol_version,
                                                        .debug = config.debug});
  return server.run(std::cin, std::cout, std::cerr);
}
