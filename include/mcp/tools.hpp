#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace sandtimer::backend {
class TimerBackend;
}  // namespace sandtimer::backend

namespace sandtimer::mcp {

// Raised by tool handlers for invalid arguments or an unreachable backend.
class ToolExecutionError : public std::runtime_error {
 public:
  explicit ToolExecutionError(const std::string& message) : std::runtime_error(message) {}
};

struct Tool {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
  std::function<std::string(const nlohmann::json&)> handler;
};

enum class ToolFailureKind { execution, internal };

struct ToolFailure {
  ToolFailureKind kind;
  std::string message;
};

using ToolResult = std::variant<std::string, ToolFailure>;

// Runs the handler and folds its exceptions into a ToolResult.
ToolResult invoke_tool(const Tool& tool, const nlohmann::json& arguments);

class ToolRegistry {
 public:
  // Re-registering a name replaces the tool but keeps its original position.
  void register_tool(Tool tool);

  [[nodiscard]] const Tool* find(const std::string& name) const;
  [[nodiscard]] nlohmann::json list() const;

  std::size_t size() const { return tools_.size(); }

 private:
  std::vector<Tool> tools_{};
  std::unordered_map<std::string, std::size_t> index_{};
};

void register_timer_tools(ToolRegistry& registry, backend::TimerBackend& backend);

}  // namespace sandtimer::mcp
