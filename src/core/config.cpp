#include "core/config.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/strings.hpp"

namespace sandtimer::core {
namespace {

// A day is far beyond any useful backend round trip.
constexpr std::int64_t kMaxTimeoutMs = 24LL * 60 * 60 * 1000;

struct ConfigLine {
  std::size_t depth{0};
  std::string key;
  std::string value;
};

// '#' opens a comment at the start of a line or after whitespace.
std::string strip_comment(const std::string& line) {
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (line[i] == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

std::optional<ConfigLine> parse_config_line(const std::string& raw) {
  const std::string line = strip_comment(raw);
  const std::string stripped = trim(line);
  const auto colon_pos = stripped.find(':');
  if (stripped.empty() || colon_pos == std::string::npos) {
    return std::nullopt;
  }

  const auto indent = line.find_first_not_of(' ');
  return ConfigLine{
      .depth = indent / 2,
      .key = trim(stripped.substr(0, colon_pos)),
      .value = trim(stripped.substr(colon_pos + 1)),
  };
}

bool parse_bool(const std::string& value) {
  const std::string lower = to_lower(value);
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::uint16_t parse_port(const std::string& value, const std::string& key) {
  std::size_t used = 0;
  const long parsed = std::stol(value, &used);
  if (used != value.size() || parsed <= 0 || parsed > 65535) {
    throw std::runtime_error(key + " must be a port in range 1..65535");
  }
  return static_cast<std::uint16_t>(parsed);
}

std::chrono::milliseconds checked_timeout(const std::int64_t millis, const std::string& key) {
  if (millis <= 0 || millis > kMaxTimeoutMs) {
    throw std::runtime_error(key + " must be between 1 ms and 24 h");
  }
  return std::chrono::milliseconds(millis);
}

// Accepts host, host:port, [v6] and [v6]:port. A bare v6 literal is ambiguous.
void apply_address(BackendConfig& backend, const std::string& value) {
  if (!value.empty() && value.front() == '[') {
    const auto close = value.find(']');
    if (close == std::string::npos || close == 1) {
      throw std::runtime_error("backend.address has an unterminated '[' host");
    }
    const std::string rest = value.substr(close + 1);
    if (!rest.empty() && rest.front() != ':') {
      throw std::runtime_error("backend.address expects ':' after ']'");
    }
    backend.host = value.substr(1, close - 1);
    if (!rest.empty()) {
      backend.port = parse_port(rest.substr(1), "backend.address");
    }
    return;
  }

  const auto split = value.find(':');
  if (split == std::string::npos) {
    backend.host = value;
    return;
  }
  if (value.find(':', split + 1) != std::string::npos) {
    throw std::runtime_error("backend.address IPv6 hosts must be written as [addr]:port");
  }
  if (split == 0) {
    throw std::runtime_error("backend.address host must not be empty");
  }
  backend.host = value.substr(0, split);
  backend.port = parse_port(value.substr(split + 1), "backend.address");
}

void apply_key_value(ServerConfig& config, const std::string& key, const std::string& value) {
  if (key == "backend.host") {
    if (value.empty()) {
      throw std::runtime_error("backend.host must not be empty");
    }
    config.backend.host = value;
  } else if (key == "backend.port") {
    config.backend.port = parse_port(value, key);
  } else if (key == "backend.address") {
    apply_address(config.backend, value);
  } else if (key == "backend.timeout_s") {
    const double seconds = std::stod(value);
    if (!std::isfinite(seconds) || seconds <= 0.0 || seconds * 1000.0 > static_cast<double>(kMaxTimeoutMs)) {
      throw std::runtime_error("backend.timeout_s must be greater than 0 and at most 86400");
    }
    config.backend.timeout = checked_timeout(static_cast<std::int64_t>(std::ceil(seconds * 1000.0)), key);
  } else if (key == "protocol_version") {
    if (value.empty()) {
      throw std::runtime_error("protocol_version must not be empty");
    }
    config.protocol_version = value;
  } else if (key == "log.debug") {
    config.debug = parse_bool(value);
  }
}

std::string join_key(const std::vector<std::string>& sections, const std::string& key) {
  std::string full;
  for (const auto& section : sections) {
    full += section;
    full += '.';
  }
  return full + key;
}

}  // namespace

ServerConfig load_server_config(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  ServerConfig config{};
  std::vector<std::string> sections;
  std::string raw;
  std::size_t line_number = 0;
  while (std::getline(input, raw)) {
    ++line_number;
    const auto line = parse_config_line(raw);
    if (!line) {
      continue;
    }

    sections.resize(std::min(sections.size(), line->depth));
    if (line->value.empty()) {
      // Section header; skipped indentation levels collapse onto the deepest known one.
      sections.push_back(line->key);
      continue;
    }

    try {
      apply_key_value(config, join_key(sections, line->key), unquote(line->value));
    } catch (const std::exception& ex) {
      throw std::runtime_error(path + ":" + std::to_string(line_number) + ": " + ex.what());
    }
  }

  return config;
}

void apply_env_overrides(ServerConfig& config) {
  if (const char* host = std::getenv("SANDTIMER_HOST"); host != nullptr && *host != '\0') {
    config.backend.host = host;
  }

  if (const char* port = std::getenv("SANDTIMER_PORT"); port != nullptr) {
    try {
      config.backend.port = parse_port(port, "SANDTIMER_PORT");
    } catch (const std::logic_error&) {
      throw std::runtime_error("SANDTIMER_PORT must be in range 1..65535");
    }
  }

  if (const char* timeout = std::getenv("SANDTIMER_TIMEOUT_MS"); timeout != nullptr) {
    std::int64_t millis = 0;
    try {
      millis = std::stoll(timeout);
    } catch (const std::logic_error&) {
      throw std::runtime_error("SANDTIMER_TIMEOUT_MS must be an integer");
    }
    config.backend.timeout = checked_timeout(millis, "SANDTIMER_TIMEOUT_MS");
  }

  if (const char* debug = std::getenv("SANDTIMER_MCP_DEBUG"); debug != nullptr && *debug != '\0') {
    config.debug = parse_bool(debug);
  }
}

}  // namespace sandtimer::core
