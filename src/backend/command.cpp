#include "backend/command.hpp"

#include <utility>

namespace sandtimer::backend {

const char* to_string(const CommandKind kind) {
  switch (kind) {
    case CommandKind::start:
      return "start";
    case CommandKind::reset:
      return "reset";
    case CommandKind::cancel:
      return "cancel";
  }
  return "start";
}

Command make_start_command(std::string label, const std::int64_t seconds) {
  return Command{.kind = CommandKind::start, .label = std::move(label), .seconds = seconds};
}

Command make_reset_command(std::string label) {
  return Command{.kind = CommandKind::reset, .label = std::move(label), .seconds = std::nullopt};
}

Command make_cancel_command(std::string label) {
  return Command{.kind = CommandKind::cancel, .label = std::move(label), .seconds = std::nullopt};
}

nlohmann::json encode_command(const Command& command) {
  nlohmann::json payload{{"cmd", to_string(command.kind)}, {"label", command.label}};
  if (command.kind == CommandKind::start && command.seconds.has_value()) {
    payload["time"] = *command.seconds;
  }
  return payload;
}

}  // namespace sandtimer::backend
