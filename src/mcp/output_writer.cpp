#include "mcp/output_writer.hpp"

#include <string>
#include <utility>

namespace sandtimer::mcp {

OutputWriter::OutputWriter(std::ostream& out, std::ostream* trace) : out_(out), trace_(trace) {}

void OutputWriter::write(const nlohmann::json& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  emit_locked(message);
  while (!deferred_.empty()) {
    const nlohmann::json notification = std::move(deferred_.front());
    deferred_.pop_front();
    emit_locked(notification);
  }
}

void OutputWriter::defer(nlohmann::json notification) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto method = notification.value("method", std::string{});
  for (auto& queued : deferred_) {
    if (queued.value("method", std::string{}) == method) {
      queued = std::move(notification);
      return;
    }
  }
  deferred_.push_back(std::move(notification));
}

std::size_t OutputWriter::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return deferred_.size();
}

void OutputWriter::emit_locked(const nlohmann::json& message) {
  const std::string line = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  out_ << line << '\n';
  out_.flush();
  if (trace_ != nullptr) {
    *trace_ << "[mcp] -> " << line << '\n';
  }
}

}  // namespace sandtimer::mcp
