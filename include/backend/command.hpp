#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace sandtimer::backend {

enum class CommandKind { start, reset, cancel };

// One message for the timer service. `seconds` is only set for start.
struct Command {
  CommandKind kind{CommandKind::start};
  std::string label{};
  std::optional<std::int64_t> seconds{};
};

const char* to_string(CommandKind kind);

Command make_start_command(std::string label, std::int64_t seconds);
Command make_reset_command(std::string label);
Command make_cancel_command(std::string label);

nlohmann::json encode_command(const Command& command);

}  // namespace sandtimer::backend
