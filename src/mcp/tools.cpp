#include "mcp/tools.hpp"

#include <exception>
#include <utility>

namespace sandtimer::mcp {

ToolResult invoke_tool(const Tool& tool, const nlohmann::json& arguments) {
  try {
    return tool.handler(arguments);
  } catch (const ToolExecutionError& ex) {
    return ToolFailure{.kind = ToolFailureKind::execution, .message = ex.what()};
  } catch (const std::exception& ex) {
    return ToolFailure{.kind = ToolFailureKind::internal, .message = std::string("Unexpected error: ") + ex.what()};
  }
}

void ToolRegistry::register_tool(Tool tool) {
  if (const auto it = index_.find(tool.name); it != index_.end()) {
    tools_[it->second] = std::move(tool);
    return;
  }
  index_.emplace(tool.name, tools_.size());
  tools_.push_back(std::move(tool));
}

const Tool* ToolRegistry::find(const std::string& name) const {
  const auto it = index_.find(name);
  if (it == index_.end()) {
    return nullptr;
  }
  return &tools_[it->second];
}

nlohmann::json ToolRegistry::list() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto& tool : tools_) {
    tools.push_back({{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}});
  }
  return tools;
}

}  // namespace sandtimer::mcp
