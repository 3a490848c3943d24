#include "backend/timer_client.hpp"

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

namespace sandtimer::backend {
namespace {

struct AddrInfoDeleter {
  void operator()(addrinfo* info) const {
    if (info != nullptr) {
      freeaddrinfo(info);
    }
  }
};

using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

class SocketHandle {
 public:
  explicit SocketHandle(int fd) : fd_(fd) {}
  ~SocketHandle() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  SocketHandle(const SocketHandle&) = delete;
  SocketHandle& operator=(const SocketHandle&) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

 private:
  int fd_;
};

std::string errno_message(const std::string& prefix, const int error) {
  return prefix + ": " + std::strerror(error);
}

void apply_timeouts(const int fd, const std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  // SO_SNDTIMEO also bounds connect() on Linux.
  if (::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0 ||
      ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
    throw BackendUnavailableError(errno_message("setsockopt failed", errno));
  }
}

bool send_all(const int fd, const std::string& message, std::string& error_message) {
  const char* data = message.data();
  std::size_t remaining = message.size();
  while (remaining > 0) {
    const ssize_t sent = ::send(fd, data, remaining, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) {
        continue;
      }
      error_message = errno_message("send failed", errno);
      return false;
    }
    data += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

}  // namespace

TcpTimerClient::TcpTimerClient(TimerClientOptions options) : options_(std::move(options)) {}

void TcpTimerClient::start(const std::string& label, const std::int64_t seconds) {
  send(make_start_command(label, seconds));
}

void TcpTimerClient::reset(const std::string& label) { send(make_reset_command(label)); }

void TcpTimerClient::cancel(const std::string& label) { send(make_cancel_command(label)); }

void TcpTimerClient::send(const Command& command) const {
  const std::string message = encode_command(command).dump();

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  const std::string port = std::to_string(options_.port);
  addrinfo* raw = nullptr;
  if (const int status = ::getaddrinfo(options_.host.c_str(), port.c_str(), &hints, &raw); status != 0) {
    throw BackendUnavailableError(std::string("cannot resolve ") + options_.host + ": " + gai_strerror(status));
  }
  const AddrInfoPtr addresses(raw);

  std::string error_message;
  for (const addrinfo* entry = addresses.get(); entry != nullptr; entry = entry->ai_next) {
    SocketHandle handle(::socket(entry->ai_family, entry->ai_socktype, entry->ai_protocol));
    if (!handle.valid()) {
      error_message = errno_message("socket failed", errno);
      continue;
    }

    apply_timeouts(handle.get(), options_.timeout);

    if (::connect(handle.get(), entry->ai_addr, entry->ai_addrlen) != 0) {
      const int error = errno;
      if (error == EINPROGRESS || error == EAGAIN) {
        error_message = "connect to " + options_.host + ":" + port + " timed out";
      } else {
        error_message = errno_message("connect to " + options_.host + ":" + port + " failed", error);
      }
      continue;
    }

    // Only connect failures fall through to the next address; a payload is sent at most once.
    if (!send_all(handle.get(), message, error_message)) {
      throw BackendUnavailableError(error_message);
    }
    return;
  }

  if (error_message.empty()) {
    error_message = "no usable address for " + options_.host + ":" + port;
  }
  throw BackendUnavailableError(error_message);
}

std::unique_ptr<TimerBackend> make_tcp_timer_client(TimerClientOptions options) {
  return std::make_unique<TcpTimerClient>(std::move(options));
}

}  // namespace sandtimer::backend
