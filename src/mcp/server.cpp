#include "mcp/server.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "core/strings.hpp"
#include "mcp/jsonrpc.hpp"

namespace sandtimer::mcp {

namespace {

nlohmann::json capabilities() {
  return nlohmann::json{{"tools", {{"list", true}, {"call", true}}}};
}

double epoch_seconds_now() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(now).count();
}

ToolResult execution_failure(std::string message) {
  return ToolFailure{.kind = ToolFailureKind::execution, .message = std::move(message)};
}

}  // namespace

Server::Server(std::unique_ptr<backend::TimerBackend> backend, ServerOptions options)
    : backend_(std::move(backend)), options_(std::move(options)) {
  if (backend_ == nullptr) {
    throw std::invalid_argument("timer backend must not be null");
  }
  register_timer_tools(tools_, *backend_);
}

void Server::register_tool(Tool tool) { tools_.register_tool(std::move(tool)); }

int Server::run(std::istream& in, std::ostream& out, std::ostream& err) {
  OutputWriter writer(out, options_.debug ? &err : nullptr);

  std::string line;
  while (std::getline(in, line)) {
    const std::string payload = core::trim(line);
    if (payload.empty()) {
      continue;
    }

    nlohmann::json message;
    try {
      message = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error& ex) {
      err << "[mcp] rejected malformed line: " << ex.what() << '\n';
      writer.write(make_error_response(nullptr, JsonRpcError{.code = error_code::kParseError, .message = "Parse error"}));
      continue;
    }

    try {
      if (const auto response = handle_message(message, writer, err); response.has_value()) {
        writer.write(*response);
      }
    } catch (const std::exception& ex) {
      err << "[mcp] failed to process request: " << ex.what() << '\n';
      if (const auto id = find_request_id(message); id.has_value()) {
        writer.write(make_error_response(
            *id, JsonRpcError{.code = error_code::kUnexpected, .message = std::string("Unexpected error: ") + ex.what()}));
      }
    }
  }

  err << "[mcp] end of input; serve loop finished\n";
  return 0;
}

std::optional<nlohmann::json> Server::handle_message(const nlohmann::json& message, OutputWriter& writer,
                                                     std::ostream& err) {
  JsonRpcMessage parsed;
  try {
    parsed = parse_message(message);
  } catch (const std::invalid_argument& ex) {
    const JsonRpcError error{.code = error_code::kInvalidRequest, .message = ex.what()};
    if (!message.is_object()) {
      return make_error_response(nullptr, error);
    }
    if (const auto id = find_request_id(message); id.has_value()) {
      return make_error_response(*id, error);
    }
    return std::nullopt;
  }

  // Replies and notifications from the peer carry no method.
  if (parsed.method.empty()) {
    return std::nullopt;
  }

  if (options_.debug) {
    err << "[mcp] <- " << parsed.method << (parsed.is_request() ? "" : " (notification)") << '\n';
  }

  const auto& method = parsed.method;
  const nlohmann::json id = parsed.id.value_or(nullptr);

  if (method == "initialize") {
    const auto result = handle_initialize(parsed.params, writer);
    if (!parsed.is_request()) {
      return std::nullopt;
    }
    return make_result_response(id, result);
  }
  if (method == "tools/list") {
    if (!parsed.is_request()) {
      return std::nullopt;
    }
    return make_result_response(id, handle_tools_list());
  }
  if (method == "tools/call") {
    if (!parsed.is_request()) {
      return std::nullopt;
    }
    return handle_tools_call(id, parsed.params, err);
  }
  if (method == "ping") {
    if (!parsed.is_request()) {
      return std::nullopt;
    }
    return make_result_response(id, nlohmann::json{{"time", epoch_seconds_now()}});
  }
  if (method == "shutdown") {
    err << "[mcp] shutdown requested; serving until end of input\n";
    if (!parsed.is_request()) {
      return std::nullopt;
    }
    return make_result_response(id, nlohmann::json::object());
  }
  if (method.rfind("notifications/", 0) == 0) {
    return std::nullopt;
  }

  if (!parsed.is_request()) {
    return std::nullopt;
  }
  return make_error_response(
      id, JsonRpcError{.code = error_code::kMethodNotFound, .message = "Method '" + method + "' not found"});
}

nlohmann::json Server::handle_initialize(const nlohmann::json& params, OutputWriter& writer) {
  std::string protocol_version = options_.protocol_version;
  if (const auto it = params.find("protocolVersion"); it != params.end() && it->is_string() &&
                                                      !it->get_ref<const std::string&>().empty()) {
    protocol_version = it->get<std::string>();
  }

  session_.initialized = true;
  session_.protocol_version = protocol_version;

  writer.defer(make_notification(kReadyNotification,
                                 nlohmann::json{{"protocolVersion", protocol_version}, {"capabilities", capabilities()}}));

  return nlohmann::json{{"protocolVersion", protocol_version},
                        {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}},
                        {"capabilities", capabilities()}};
}

nlohmann::json Server::handle_tools_list() const { return nlohmann::json{{"tools", tools_.list()}}; }

nlohmann::json Server::handle_tools_call(const nlohmann::json& id, const nlohmann::json& params,
                                         std::ostream& err) const {
  const auto result = call_tool(params);
  if (const auto* text = std::get_if<std::string>(&result); text != nullptr) {
    return make_result_response(
        id, nlohmann::json{{"content", nlohmann::json::array({{{"type", "text"}, {"text", *text}}})}});
  }

  const auto& failure = std::get<ToolFailure>(result);
  const int code = failure.kind == ToolFailureKind::execution ? error_code::kToolExecution : error_code::kUnexpected;
  err << "[mcp] tools/call failed (" << code << "): " << failure.message << '\n';
  return make_error_response(id, JsonRpcError{.code = code, .message = failure.message});
}

ToolResult Server::call_tool(const nlohmann::json& params) const {
  if (!session_.initialized) {
    return execution_failure("Server has not been initialized yet.");
  }

  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    return execution_failure("Invalid tool name.");
  }
  const auto name = name_it->get<std::string>();

  nlohmann::json arguments = nlohmann::json::object();
  if (const auto args_it = params.find("arguments"); args_it != params.end() && !args_it->is_null()) {
    if (!args_it->is_object()) {
      return execution_failure("Tool arguments must be an object.");
    }
    arguments = *args_it;
  }

  const Tool* tool = tools_.find(name);
  if (tool == nullptr) {
    return execution_failure("Tool '" + name + "' is not available.");
  }
  return invoke_tool(*tool, arguments);
}

}  // namespace sandtimer::mcp
