#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace sandtimer::mcp {

constexpr const char* kJsonRpcVersion = "2.0";

namespace error_code {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kToolExecution = -32002;
constexpr int kUnexpected = -32099;
}  // namespace error_code

struct JsonRpcError {
  int code;
  std::string message;
};

// Inbound message after shape inspection. `method` is empty for replies from
// the peer; `params` is always an object.
struct JsonRpcMessage {
  std::string method;
  nlohmann::json params;
  std::optional<nlohmann::json> id;

  [[nodiscard]] bool is_request() const { return id.has_value(); }
};

// Returns the id of `message` if it is an object carrying a non-null id.
std::optional<nlohmann::json> find_request_id(const nlohmann::json& message);

// Throws std::invalid_argument when `message` is not an object or carries a
// non-string method.
JsonRpcMessage parse_message(const nlohmann::json& message);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);
nlohmann::json make_notification(const std::string& method, const nlohmann::json& params);

}  // namespace sandtimer::mcp
