#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <ostream>

#include <nlohmann/json.hpp>

namespace sandtimer::mcp {

// Serialises outgoing messages one per line onto a single stream. Deferred
// notifications are emitted right after the next write, inside the same lock,
// so nothing can interleave between a response and what it armed.
class OutputWriter {
 public:
  explicit OutputWriter(std::ostream& out, std::ostream* trace = nullptr);

  void write(const nlohmann::json& message);

  // Queues `notification` for delivery after the next write. A queued
  // notification with the same method is replaced in place.
  void defer(nlohmann::json notification);

  std::size_t pending() const;

 private:
  void emit_locked(const nlohmann::json& message);

  std::ostream& out_;
  std::ostream* trace_;
  mutable std::mutex mutex_;
  std::deque<nlohmann::json> deferred_{};
};

}  // namespace sandtimer::mcp
