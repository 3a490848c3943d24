#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include "backend/command.hpp"
#include "backend/timer_client.hpp"

using sandtimer::backend::BackendUnavailableError;
using sandtimer::backend::TcpTimerClient;
using sandtimer::backend::TimerClientOptions;
using sandtimer::backend::encode_command;

namespace {

void set_receive_timeout(const int fd, const std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

// Accepts one connection on 127.0.0.1 and collects bytes until the peer closes.
// accept() and recv() give up after a few seconds so a client that never
// connects fails the test instead of hanging it.
class LoopbackListener {
 public:
  explicit LoopbackListener(const int backlog = 1) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (fd_ < 0 || ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(fd_, backlog) != 0) {
      return;
    }
    set_receive_timeout(fd_, kIoTimeout);
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
      port_ = ntohs(addr.sin_port);
    }
  }

  ~LoopbackListener() {
    if (worker_.joinable()) {
      worker_.join();
    }
    close();
  }

  LoopbackListener(const LoopbackListener&) = delete;
  LoopbackListener& operator=(const LoopbackListener&) = delete;

  bool ready() const { return port_ != 0; }
  std::uint16_t port() const { return port_; }

  void accept_one() {
    worker_ = std::thread([this] {
      const int client = ::accept(fd_, nullptr, nullptr);
      if (client < 0) {
        return;
      }
      ++accepted_;
      set_receive_timeout(client, kIoTimeout);
      char buffer[512];
      while (true) {
        const ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
        if (n <= 0) {
          break;
        }
        payload_.append(buffer, static_cast<std::size_t>(n));
      }
      ::close(client);
    });
  }

  // Reads one byte, then closes with unread data pending so the peer sees a
  // reset mid-send. Any follow-up connection within the grace period is counted.
  void accept_then_reset() {
    worker_ = std::thread([this] {
      const int client = ::accept(fd_, nullptr, nullptr);
      if (client < 0) {
        return;
      }
      ++accepted_;
      char first = 0;
      (void)::recv(client, &first, 1, 0);
      const linger abort_close{.l_onoff = 1, .l_linger = 0};
      ::setsockopt(client, SOL_SOCKET, SO_LINGER, &abort_close, sizeof(abort_close));
      ::close(client);

      pollfd pending{.fd = fd_, .events = POLLIN, .revents = 0};
      if (::poll(&pending, 1, 500) > 0) {
        const int again = ::accept(fd_, nullptr, nullptr);
        if (again >= 0) {
          ++accepted_;
          ::close(again);
        }
      }
    });
  }

  void join() {
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  int accepted() const { return accepted_.load(); }

  const std::string& wait_payload() {
    if (worker_.joinable()) {
      worker_.join();
    }
    return payload_;
  }

  void close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  static constexpr std::chrono::milliseconds kIoTimeout{3000};

  int fd_{-1};
  std::uint16_t port_{0};
  std::atomic<int> accepted_{0};
  std::thread worker_{};
  std::string payload_{};
};

TimerClientOptions loopback_options(std::uint16_t port) {
  return TimerClientOptions{.host = "127.0.0.1", .port = port, .timeout = std::chrono::milliseconds(2000)};
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

int test_encode_command_shapes() {
  const auto start = encode_command(sandtimer::backend::make_start_command("tea", 180)).dump();
  const auto reset = encode_command(sandtimer::backend::make_reset_command("tea")).dump();
  const auto cancel = encode_command(sandtimer::backend::make_cancel_command("tea")).dump();

  if (start != R"({"cmd":"start","label":"tea","time":180})") {
    return fail("test_encode_command_shapes", "start payload mismatch");
  }
  if (reset != R"({"cmd":"reset","label":"tea"})" || cancel != R"({"cmd":"cancel","label":"tea"})") {
    return fail("test_encode_command_shapes", "reset/cancel payloads must not carry time");
  }

  return 0;
}

int test_start_sends_single_payload() {
  LoopbackListener listener;
  if (!listener.ready()) {
    return fail("test_start_sends_single_payload", "unable to bind loopback listener");
  }
  listener.accept_one();

  TcpTimerClient client(loopback_options(listener.port()));
  try {
    client.start("tea", 180);
  } catch (const BackendUnavailableError& ex) {
    std::cerr << ex.what() << '\n';
    return fail("test_start_sends_single_payload", "start should reach the listener");
  }

  if (listener.wait_payload() != R"({"cmd":"start","label":"tea","time":180})") {
    return fail("test_start_sends_single_payload", "listener received an unexpected payload");
  }

  return 0;
}

int test_cancel_keeps_utf8_label() {
  LoopbackListener listener;
  if (!listener.ready()) {
    return fail("test_cancel_keeps_utf8_label", "unable to bind loopback listener");
  }
  listener.accept_one();

  TcpTimerClient client(loopback_options(listener.port()));
  try {
    client.cancel("\xe8\x8c\xb6");
  } catch (const BackendUnavailableError&) {
    return fail("test_cancel_keeps_utf8_label", "cancel should reach the listener");
  }

  if (listener.wait_payload() != "{\"cmd\":\"cancel\",\"label\":\"\xe8\x8c\xb6\"}") {
    return fail("test_cancel_keeps_utf8_label", "non-ASCII label should be sent as raw UTF-8");
  }

  return 0;
}

int test_refused_connection_is_unavailable() {
  std::uint16_t port = 0;
  {
    LoopbackListener reserved;
    if (!reserved.ready()) {
      return fail("test_refused_connection_is_unavailable", "unable to reserve a loopback port");
    }
    port = reserved.port();
  }

  TcpTimerClient client(loopback_options(port));
  bool threw = false;
  try {
    client.reset("tea");
  } catch (const BackendUnavailableError& ex) {
    threw = std::string(ex.what()).find("127.0.0.1") != std::string::npos;
  }

  if (!threw) {
    return fail("test_refused_connection_is_unavailable", "closed port should raise BackendUnavailableError");
  }

  return 0;
}

int test_send_failure_after_connect_is_not_resent() {
  LoopbackListener listener;
  if (!listener.ready()) {
    return fail("test_send_failure_after_connect_is_not_resent", "unable to bind loopback listener");
  }
  listener.accept_then_reset();

  // Larger than the loopback socket buffers so the reset lands mid-send.
  const std::string label(32 * 1024 * 1024, 'x');
  TcpTimerClient client(loopback_options(listener.port()));
  std::string message;
  try {
    client.start(label, 60);
  } catch (const BackendUnavailableError& ex) {
    message = ex.what();
  }
  listener.join();

  if (message.find("send failed") == std::string::npos) {
    return fail("test_send_failure_after_connect_is_not_resent", "reset during send should raise a send failure");
  }
  if (listener.accepted() != 1) {
    return fail("test_send_failure_after_connect_is_not_resent", "payload must not be sent on a second connection");
  }

  return 0;
}

int test_connect_timeout_is_unavailable() {
  // Backlog 0 with a queued connection nobody accepts drops every further SYN.
  LoopbackListener listener(0);
  if (!listener.ready()) {
    return fail("test_connect_timeout_is_unavailable", "unable to bind loopback listener");
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(listener.port());
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  std::vector<int> fillers;
  for (int i = 0; i < 2; ++i) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
      continue;
    }
    ::fcntl(fd, F_SETFL, O_NONBLOCK);
    (void)::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    fillers.push_back(fd);
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  TcpTimerClient client(TimerClientOptions{
      .host = "127.0.0.1", .port = listener.port(), .timeout = std::chrono::milliseconds(200)});
  const auto began = std::chrono::steady_clock::now();
  std::string message;
  try {
    client.start("tea", 60);
  } catch (const BackendUnavailableError& ex) {
    message = ex.what();
  }
  const auto elapsed = std::chrono::steady_clock::now() - began;

  for (const int fd : fillers) {
    ::close(fd);
  }

  if (message.find("timed out") == std::string::npos) {
    return fail("test_connect_timeout_is_unavailable", "full accept queue should surface as a connect timeout");
  }
  if (elapsed > std::chrono::seconds(2)) {
    return fail("test_connect_timeout_is_unavailable", "connect should give up after the configured timeout");
  }

  return 0;
}

int test_default_options() {
  const TcpTimerClient client;
  if (client.options().host != "127.0.0.1" || client.options().port != 61420 ||
      client.options().timeout != std::chrono::milliseconds(5000)) {
    return fail("test_default_options", "defaults should be 127.0.0.1:61420 with a 5s timeout");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_encode_command_shapes(); rc != 0) return rc;
  if (int rc = test_start_sends_single_payload(); rc != 0) return rc;
  if (int rc = test_cancel_keeps_utf8_label(); rc != 0) return rc;
  if (int rc = test_refused_connection_is_unavailable(); rc != 0) return rc;
  if (int rc = test_send_failure_after_connect_is_not_resent(); rc != 0) return rc;
  if (int rc = test_connect_timeout_is_unavailable(); rc != 0) return rc;
  if (int rc = test_default_options(); rc != 0) return rc;

  std::cout << "[PASS] backend unit tests\n";
  return 0;
}
