#include "mcp/tools.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

#include "backend/timer_client.hpp"
#include "core/strings.hpp"

namespace sandtimer::mcp {

namespace {

std::string validate_label(const nlohmann::json& arguments) {
  const auto label_it = arguments.find("label");
  if (label_it == arguments.end() || !label_it->is_string()) {
    throw ToolExecutionError("'label' must be a non-empty string.");
  }
  std::string label = core::trim(label_it->get<std::string>());
  if (label.empty()) {
    throw ToolExecutionError("'label' must be a non-empty string.");
  }
  return label;
}

// Fractional durations are truncated toward zero before the sign check.
std::int64_t validate_seconds(const nlohmann::json& arguments) {
  const auto time_it = arguments.find("time");
  if (time_it == arguments.end() || !time_it->is_number()) {
    throw ToolExecutionError("'time' must be a number of seconds.");
  }

  std::int64_t seconds = 0;
  if (time_it->is_number_unsigned()) {
    const auto value = time_it->get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      throw ToolExecutionError("'time' is out of range.");
    }
    seconds = static_cast<std::int64_t>(value);
  } else if (time_it->is_number_integer()) {
    seconds = time_it->get<std::int64_t>();
  } else {
    const double truncated = std::trunc(time_it->get<double>());
    if (truncated >= 9.2e18 || truncated <= -9.2e18) {
      throw ToolExecutionError("'time' is out of range.");
    }
    seconds = static_cast<std::int64_t>(truncated);
  }

  if (seconds <= 0) {
    throw ToolExecutionError("'time' must be greater than zero.");
  }
  return seconds;
}

template <typename Call>
void forward_to_backend(Call&& call) {
  try {
    call();
  } catch (const backend::BackendUnavailableError& ex) {
    throw ToolExecutionError(std::string("Failed to reach sandtimer service: ") + ex.what());
  }
}

nlohmann::json label_schema(const char* description) {
  return nlohmann::json{{"type", "string"}, {"description", description}};
}

}  // namespace

void register_timer_tools(ToolRegistry& registry, backend::TimerBackend& backend) {
  registry.register_tool(Tool{
      .name = "start_timer",
      .description = "Start or restart a named sand timer.",
      .input_schema =
          nlohmann::json{{"type", "object"},
                         {"properties",
                          {{"label", label_schema("Human readable timer name.")},
                           {"time",
                            {{"type", "number"}, {"description", "Duration of the timer in seconds."}, {"minimum", 1}}}}},
                         {"required", nlohmann::json::array({"label", "time"})}},
      .handler = [&backend](const nlohmann::json& arguments) {
        const auto label = validate_label(arguments);
        const auto seconds = validate_seconds(arguments);
        forward_to_backend([&] { backend.start(label, seconds); });
        return "Timer '" + label + "' started for " + std::to_string(seconds) + " seconds.";
      }});

  registry.register_tool(Tool{
      .name = "reset_timer",
      .description = "Reset an existing sand timer to its original duration.",
      .input_schema = nlohmann::json{{"type", "object"},
                                     {"properties", {{"label", label_schema("Timer name to reset.")}}},
                                     {"required", nlohmann::json::array({"label"})}},
      .handler = [&backend](const nlohmann::json& arguments) {
        const auto label = validate_label(arguments);
        forward_to_backend([&] { backend.reset(label); });
        return "Timer '" + label + "' reset.";
      }});

  registry.register_tool(Tool{
      .name = "cancel_timer",
      .description = "Cancel and close a sand timer window.",
      .input_schema = nlohmann::json{{"type", "object"},
                                     {"properties", {{"label", label_schema("Timer name to cancel.")}}},
                                     {"required", nlohmann::json::array({"label"})}},
      .handler = [&backend](const nlohmann::json& arguments) {
        const auto label = validate_label(arguments);
        forward_to_backend([&] { backend.cancel(label); });
        return "Timer '" + label + "' canceled.";
      }});
}

}  // namespace sandtimer::mcp
