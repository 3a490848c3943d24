#include "mcp/jsonrpc.hpp"

#include <stdexcept>
#include <string>

namespace sandtimer::mcp {

namespace {

// A method that is null, false, 0, "" or an empty container marks a reply.
bool is_truthy(const nlohmann::json& value) {
  if (value.is_null()) {
    return false;
  }
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_number()) {
    return value.get<double>() != 0.0;
  }
  if (value.is_string()) {
    return !value.get_ref<const std::string&>().empty();
  }
  if (value.is_array() || value.is_object()) {
    return !value.empty();
  }
  return true;
}

}  // namespace

std::optional<nlohmann::json> find_request_id(const nlohmann::json& message) {
  if (!message.is_object()) {
    return std::nullopt;
  }
  const auto id_it = message.find("id");
  if (id_it == message.end() || id_it->is_null()) {
    return std::nullopt;
  }
  return *id_it;
}

JsonRpcMessage parse_message(const nlohmann::json& message) {
  if (!message.is_object()) {
    throw std::invalid_argument("Invalid request");
  }

  JsonRpcMessage parsed{.method = {}, .params = nlohmann::json::object(), .id = find_request_id(message)};

  const auto method_it = message.find("method");
  if (method_it == message.end() || !is_truthy(*method_it)) {
    return parsed;
  }
  if (!method_it->is_string()) {
    throw std::invalid_argument("Invalid request");
  }
  parsed.method = method_it->get<std::string>();

  const auto params_it = message.find("params");
  if (params_it != message.end() && params_it->is_object()) {
    parsed.params = *params_it;
  }

  return parsed;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion},
                        {"id", id},
                        {"error", {{"code", error.code}, {"message", error.message}}}};
}

nlohmann::json make_notification(const std::string& method, const nlohmann::json& params) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"method", method}, {"params", params}};
}

}  // namespace sandtimer::mcp
