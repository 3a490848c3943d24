#pragma once

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include "backend/timer_client.hpp"
#include "mcp/output_writer.hpp"
#include "mcp/tools.hpp"

namespace sandtimer::mcp {

constexpr const char* kServerName = "sandtimer-mcp";
constexpr const char* kServerVersion = "0.1.0";
constexpr const char* kDefaultProtocolVersion = "2024-05-14";
constexpr const char* kReadyNotification = "notifications/server/ready";

struct ServerOptions {
  std::string protocol_version{kDefaultProtocolVersion};
  bool debug{false};
};

// Uninitialized until the first `initialize`; there is no way back.
struct SessionState {
  bool initialized{false};
  std::string protocol_version{};
};

class Server {
 public:
  explicit Server(std::unique_ptr<backend::TimerBackend> backend, ServerOptions options = {});

  // Serves newline-delimited JSON-RPC from `in` until end of input.
  int run(std::istream& in, std::ostream& out, std::ostream& err);

  void register_tool(Tool tool);

  const ToolRegistry& tools() const { return tools_; }
  const SessionState& session() const { return session_; }

 private:
  std::optional<nlohmann::json> handle_message(const nlohmann::json& message, OutputWriter& writer,
                                               std::ostream& err);
  nlohmann::json handle_initialize(const nlohmann::json& params, OutputWriter& writer);
  nlohmann::json handle_tools_list() const;
  nlohmann::json handle_tools_call(const nlohmann::json& id, const nlohmann::json& params, std::ostream& err) const;
  ToolResult call_tool(const nlohmann::json& params) const;

  std::unique_ptr<backend::TimerBackend> backend_;
  ServerOptions options_;
  ToolRegistry tools_{};
  SessionState session_{};
};

}  // namespace sandtimer::mcp
