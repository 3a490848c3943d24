#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include "backend/command.hpp"

namespace sandtimer::backend {

// Raised for any resolve, connect, timeout or send failure.
class BackendUnavailableError : public std::runtime_error {
 public:
  explicit BackendUnavailableError(const std::string& message) : std::runtime_error(message) {}
};

struct TimerClientOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{61420};
  std::chrono::milliseconds timeout{5000};
};

class TimerBackend {
 public:
  virtual void start(const std::string& label, std::int64_t seconds) = 0;
  virtual void reset(const std::string& label) = 0;
  virtual void cancel(const std::string& label) = 0;
  virtual ~TimerBackend() = default;
};

// Fire-and-forget client: one short-lived TCP connection per command, nothing
// is read back from the service.
class TcpTimerClient final : public TimerBackend {
 public:
  explicit TcpTimerClient(TimerClientOptions options = {});

  void start(const std::string& label, std::int64_t seconds) override;
  void reset(const std::string& label) override;
  void cancel(const std::string& label) override;

  void send(const Command& command) const;

  const TimerClientOptions& options() const { return options_; }

 private:
  TimerClientOptions options_;
};

std::unique_ptr<TimerBackend> make_tcp_timer_client(TimerClientOptions options);

}  // namespace sandtimer::backend
