#include "micbridge.hpp"

#include <cstring>

#include <arpa/inet.h>
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <functional>
#include <mutex>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace micbridge;
using json = nlohmann::json;
using std::chrono::milliseconds;

// ============================================================================
// Fake device (raw POSIX listener on an ephemeral loopback port)
// ============================================================================

class FakeDevice {
 public:
  FakeDevice() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    int reuse = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    addr.sin_addr.s_addr = inet_addr("127.0.0.1");
    if (::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0 &&
        ::listen(listen_fd_, 8) == 0) {
      socklen_t len = sizeof(addr);
      getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len);
      port_ = ntohs(addr.sin_port);
    }
  }

  ~FakeDevice() {
    for (int fd : peers_) {
      ::close(fd);
    }
    if (listen_fd_ >= 0) {
      ::close(listen_fd_);
    }
  }

  uint16_t port() const { return port_; }

  // Next host connection, or -1 when none arrives in time
  int accept_peer(int timeout_ms = 2000) {
    struct pollfd pfd{listen_fd_, POLLIN, 0};
    if (::poll(&pfd, 1, timeout_ms) <= 0) {
      return -1;
    }
    int fd = ::accept(listen_fd_, nullptr, nullptr);
    if (fd >= 0) {
      peers_.push_back(fd);
    }
    return fd;
  }

  static bool send_all(int fd, const std::string& bytes) {
    size_t sent = 0;
    while (sent < bytes.size()) {
      ssize_t n = ::send(fd, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
      if (n <= 0) {
        return false;
      }
      sent += static_cast<size_t>(n);
    }
    return true;
  }

  // One '\n'-terminated line without the terminator; empty on timeout or EOF
  static std::string read_line(int fd, int timeout_ms = 2000) {
    std::string line;
    auto deadline = std::chrono::steady_clock::now() + milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
      struct pollfd pfd{fd, POLLIN, 0};
      if (::poll(&pfd, 1, 50) <= 0) {
        continue;
      }
      char c = 0;
      if (::recv(fd, &c, 1, 0) != 1) {
        return {};
      }
      if (c == '\n') {
        return line;
      }
      line.push_back(c);
    }
    return {};
  }

  // True when the host closed its side within timeout
  static bool wait_for_eof(int fd, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + milliseconds(timeout_ms);
    char buf[256];
    while (std::chrono::steady_clock::now() < deadline) {
      struct pollfd pfd{fd, POLLIN, 0};
      if (::poll(&pfd, 1, 50) <= 0) {
        continue;
      }
      ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
      if (n <= 0) {
        return true;
      }
    }
    return false;
  }

 private:
  int listen_fd_ = -1;
  uint16_t port_ = 0;
  std::vector<int> peers_;
};

static std::string audio_frame(const Payload& payload) {
  return "{\"type\":\"audio-chunk\",\"payload_length\":" + std::to_string(payload.size()) + "}\n" +
         std::string(payload.begin(), payload.end());
}

static bool wait_until(const std::function<bool()>& pred, int timeout_ms = 2000) {
  auto deadline = std::chrono::steady_clock::now() + milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(milliseconds(5));
  }
  return pred();
}

// ============================================================================
// Recording collaborators
// ============================================================================

class RecordingHandler : public MessageHandler {
 public:
  void handle_message(const Message& msg) override {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(msg);
  }

  std::vector<Message> messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
  }

  size_t count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Message> messages_;
};

class RecordingObserver : public ConnectionObserver {
 public:
  void on_connection_state_changed(bool connected) override {
    std::lock_guard<std::mutex> lock(mutex_);
    changes_.push_back(connected);
  }

  std::vector<bool> changes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return changes_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<bool> changes_;
};

class CollectingConsumer : public PipelineConsumer {
 public:
  void run_pipeline(AudioChunkSource& source) override {
    while (auto chunk = source.next_chunk()) {
      std::lock_guard<std::mutex> lock(mutex_);
      chunks_.push_back(chunk.value());
    }
  }

  std::vector<Payload> chunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Payload> chunks_;
};

// ============================================================================
// Test helper: run the connection manager in a background thread
// ============================================================================

static BridgeConfig loopback_config(uint16_t port) {
  BridgeConfig config;
  config.host = "127.0.0.1";
  config.port = port;
  config.connect_timeout_ms = 1000;
  config.reconnect_backoff_ms = 50;
  return config;
}

struct ManagerFixture {
  RecordingHandler handler;
  RecordingObserver observer;
  ConnectionManager manager;
  std::thread run_thread;

  explicit ManagerFixture(const BridgeConfig& config) : manager(config, handler, &observer) {}

  void start() {
    run_thread = std::thread([this]() { manager.run(); });
  }

  void stop() {
    manager.close();
    if (run_thread.joinable()) {
      run_thread.join();
    }
  }

  ~ManagerFixture() { stop(); }
};

// ============================================================================
// ConnectionManager
// ============================================================================

TEST_CASE("Integration - messages are delivered in order", "[integration]") {
  FakeDevice device;
  ManagerFixture fixture(loopback_config(device.port()));
  fixture.start();

  int peer = device.accept_peer();
  REQUIRE(peer >= 0);
  REQUIRE(FakeDevice::send_all(peer, "{\"type\":\"client-info\",\"data\":{\"uuid\":\"dev-1\"}}\n"
                                     "{\"type\":\"ping\"}\n" +
                                         audio_frame(Payload{1, 2, 3, 4})));

  REQUIRE(wait_until([&]() { return fixture.handler.count() == 3; }));
  auto messages = fixture.handler.messages();
  REQUIRE(messages[0].type() == MessageType::kClientInfo);
  REQUIRE(messages[0].data()["uuid"] == "dev-1");
  REQUIRE(messages[1].type() == MessageType::kPing);
  REQUIRE(messages[2].type() == MessageType::kAudioChunk);
  REQUIRE(messages[2].payload() == Payload{1, 2, 3, 4});

  REQUIRE(fixture.manager.is_connected());
  REQUIRE(fixture.observer.changes() == std::vector<bool>{true});
}

TEST_CASE("Integration - five bad messages force one reconnect", "[integration]") {
  FakeDevice device;
  ManagerFixture fixture(loopback_config(device.port()));
  fixture.start();

  int first = device.accept_peer();
  REQUIRE(first >= 0);
  std::string bad;
  for (int i = 0; i < 5; ++i) {
    bad += "not json " + std::to_string(i) + "\n";
  }
  REQUIRE(FakeDevice::send_all(first, bad));

  int second = device.accept_peer();
  REQUIRE(second >= 0);
  REQUIRE(FakeDevice::wait_for_eof(first));

  REQUIRE(wait_until([&]() { return fixture.observer.changes().size() == 3; }));
  REQUIRE(fixture.observer.changes() == std::vector<bool>{true, false, true});
  const auto& stats = fixture.manager.stats();
  REQUIRE(stats.forced_reconnects.load() == 1);
  REQUIRE(stats.bad_messages.load() == 5);
  REQUIRE(stats.connects.load() == 2);

  // The new connection works
  REQUIRE(FakeDevice::send_all(second, "{\"type\":\"ping\"}\n"));
  REQUIRE(wait_until([&]() { return fixture.handler.count() == 1; }));
}

TEST_CASE("Integration - a good message resets the bad message count", "[integration]") {
  FakeDevice device;
  ManagerFixture fixture(loopback_config(device.port()));
  fixture.start();

  int peer = device.accept_peer();
  REQUIRE(peer >= 0);
  REQUIRE(FakeDevice::send_all(peer, "bad\nbad\nbad\nbad\n{\"type\":\"ping\"}\nbad\nbad\nbad\nbad\n"));

  REQUIRE(wait_until([&]() { return fixture.manager.stats().bad_messages.load() == 8; }));
  REQUIRE(device.accept_peer(300) < 0);
  REQUIRE(fixture.manager.stats().forced_reconnects.load() == 0);
  REQUIRE(fixture.manager.stats().connects.load() == 1);
  REQUIRE(fixture.handler.count() == 1);
}

TEST_CASE("Integration - watchdog declares a silent device dead", "[integration]") {
  FakeDevice device;
  BridgeConfig config = loopback_config(device.port());
  config.watchdog_timeout_ms = 200;
  ManagerFixture fixture(config);
  fixture.start();

  int first = device.accept_peer();
  REQUIRE(first >= 0);

  auto start = std::chrono::steady_clock::now();
  int second = device.accept_peer(3000);
  REQUIRE(second >= 0);
  REQUIRE(std::chrono::steady_clock::now() - start >= milliseconds(150));

  REQUIRE(fixture.manager.stats().watchdog_timeouts.load() >= 1);
  auto changes = fixture.observer.changes();
  REQUIRE(changes.size() >= 2);
  REQUIRE(changes[0] == true);
  REQUIRE(changes[1] == false);
}

TEST_CASE("Integration - pings keep the watchdog quiet", "[integration]") {
  FakeDevice device;
  BridgeConfig config = loopback_config(device.port());
  config.watchdog_timeout_ms = 300;
  ManagerFixture fixture(config);
  fixture.start();

  int peer = device.accept_peer();
  REQUIRE(peer >= 0);
  for (int i = 0; i < 8; ++i) {
    REQUIRE(FakeDevice::send_all(peer, "{\"type\":\"ping\"}\n"));
    std::this_thread::sleep_for(milliseconds(100));
  }
  REQUIRE(fixture.manager.stats().watchdog_timeouts.load() == 0);
  REQUIRE(fixture.manager.is_connected());
}

TEST_CASE("Integration - end of stream leads to reconnect", "[integration]") {
  FakeDevice device;
  ManagerFixture fixture(loopback_config(device.port()));
  fixture.start();

  int first = device.accept_peer();
  REQUIRE(first >= 0);
  ::shutdown(first, SHUT_WR);

  int second = device.accept_peer();
  REQUIRE(second >= 0);
  REQUIRE(fixture.manager.stats().sessions.load() >= 1);
  REQUIRE(wait_until([&]() { return fixture.manager.stats().connects.load() == 2; }));
}

TEST_CASE("Integration - queued messages are sent in order", "[integration]") {
  FakeDevice device;
  ManagerFixture fixture(loopback_config(device.port()));

  // Queued before any connection exists
  fixture.manager.enqueue_send(make_play_tts("http://host/one.mp3"));
  fixture.start();

  int peer = device.accept_peer();
  REQUIRE(peer >= 0);
  fixture.manager.enqueue_send(make_play_tts("http://host/two.mp3"));

  json first = json::parse(FakeDevice::read_line(peer));
  json second = json::parse(FakeDevice::read_line(peer));
  REQUIRE(first["type"] == "play-tts");
  REQUIRE(first["data"]["url"] == "http://host/one.mp3");
  REQUIRE(second["data"]["url"] == "http://host/two.mp3");
  REQUIRE(wait_until([&]() { return fixture.manager.outbox_size() == 0; }));
}

TEST_CASE("Integration - outbox overflow keeps the newest message", "[integration]") {
  FakeDevice device;
  BridgeConfig config = loopback_config(device.port());
  config.outbox_capacity = 2;
  ManagerFixture fixture(config);

  fixture.manager.enqueue_send(make_play_tts("http://host/a.mp3"));
  fixture.manager.enqueue_send(make_play_tts("http://host/b.mp3"));
  fixture.manager.enqueue_send(make_play_tts("http://host/c.mp3"));
  REQUIRE(fixture.manager.outbox_size() == 1);
  REQUIRE(fixture.manager.stats().outbox_overflows.load() == 1);
  REQUIRE(fixture.manager.stats().outbox_dropped.load() == 2);

  fixture.start();
  int peer = device.accept_peer();
  REQUIRE(peer >= 0);
  json only = json::parse(FakeDevice::read_line(peer));
  REQUIRE(only["data"]["url"] == "http://host/c.mp3");
}

TEST_CASE("Integration - synchronous send", "[integration]") {
  FakeDevice device;
  RecordingHandler handler;
  ConnectionManager manager(loopback_config(device.port()), handler);

  auto dead = manager.send(json{{"type", "ping"}});
  REQUIRE_FALSE(dead.has_value());
  REQUIRE(dead.get_error() == ErrorCode::kInvalidState);

  manager.reconnect();
  REQUIRE(manager.is_connected());
  int peer = device.accept_peer();
  REQUIRE(peer >= 0);

  REQUIRE(manager.send(make_play_tts("http://host/now.mp3")).has_value());
  json line = json::parse(FakeDevice::read_line(peer));
  REQUIRE(line["data"]["url"] == "http://host/now.mp3");
}

TEST_CASE("Integration - unreachable device keeps retrying", "[integration]") {
  uint16_t port = 0;
  {
    FakeDevice closed;
    port = closed.port();
  }
  ManagerFixture fixture(loopback_config(port));
  fixture.start();

  REQUIRE(wait_until([&]() { return fixture.manager.stats().connect_failures.load() >= 2; }));
  REQUIRE_FALSE(fixture.manager.is_connected());
  REQUIRE(fixture.observer.changes().empty());
}

TEST_CASE("Integration - close is idempotent", "[integration]") {
  FakeDevice device;
  ManagerFixture fixture(loopback_config(device.port()));
  fixture.start();

  int peer = device.accept_peer();
  REQUIRE(peer >= 0);
  REQUIRE(wait_until([&]() { return fixture.manager.is_connected(); }));

  fixture.manager.close();
  fixture.manager.close();
  REQUIRE(fixture.manager.state() == ConnectionState::kDisconnected);
  REQUIRE(FakeDevice::wait_for_eof(peer));
  REQUIRE(fixture.observer.changes() == std::vector<bool>{true, false});

  fixture.stop();
  REQUIRE(device.accept_peer(200) < 0);
}

// ============================================================================
// MicBridge facade
// ============================================================================

TEST_CASE("Integration - bridge forwards audio and TTS requests", "[integration]") {
  FakeDevice device;
  CollectingConsumer consumer;
  RecordingObserver observer;
  MicBridge bridge(loopback_config(device.port()), consumer);
  REQUIRE(bridge.add_state_observer(&observer));
  REQUIRE(bridge.start().has_value());
  REQUIRE_FALSE(bridge.start().has_value());

  int peer = device.accept_peer();
  REQUIRE(peer >= 0);
  REQUIRE(FakeDevice::send_all(peer, "{\"type\":\"client-info\",\"data\":{\"uuid\":\"mic-7\"}}\n" +
                                         audio_frame(Payload{10, 20}) + audio_frame(Payload{30})));

  REQUIRE(wait_until([&]() { return consumer.chunks().size() == 2; }));
  REQUIRE(consumer.chunks()[0] == Payload{10, 20});
  REQUIRE(consumer.chunks()[1] == Payload{30});
  REQUIRE(bridge.client_info()["uuid"] == "mic-7");
  REQUIRE(observer.changes() == std::vector<bool>{true});

  bridge.play_tts("http://hass.local:8123", "/api/tts_proxy/abc.mp3");
  json line = json::parse(FakeDevice::read_line(peer));
  REQUIRE(line["type"] == "play-tts");
  REQUIRE(line["data"]["url"] == "http://hass.local:8123/api/tts_proxy/abc.mp3");

  bridge.stop();
  bridge.stop();
  REQUIRE_FALSE(bridge.is_running());
  REQUIRE(observer.changes() == std::vector<bool>{true, false});
}

TEST_CASE("Integration - play_tts needs base and path", "[integration]") {
  CollectingConsumer consumer;
  MicBridge bridge(loopback_config(1), consumer);
  bridge.play_tts("", "/x.mp3");
  bridge.play_tts("http://hass.local:8123", "");
  REQUIRE(bridge.connection().outbox_size() == 0);
}

TEST_CASE("Integration - bridge rejects invalid configuration", "[integration]") {
  CollectingConsumer consumer;
  BridgeConfig config;
  MicBridge bridge(config, consumer);
  auto started = bridge.start();
  REQUIRE_FALSE(started.has_value());
  REQUIRE(started.get_error() == ErrorCode::kInvalidConfig);
}

// ============================================================================
// Validation handshake
// ============================================================================

TEST_CASE("Integration - validation returns the device uuid", "[integration]") {
  FakeDevice device;
  std::thread responder([&]() {
    int peer = device.accept_peer();
    if (peer >= 0) {
      FakeDevice::send_all(peer, "{\"type\":\"client-info\",\"data\":{\"uuid\":\"abc-123\"}}\n");
    }
  });

  auto uuid = MicBridge::validate_target("127.0.0.1", device.port(), milliseconds(1000));
  responder.join();
  REQUIRE(uuid.has_value());
  REQUIRE(uuid.value() == "abc-123");
}

TEST_CASE("Integration - validation stringifies a non-string uuid", "[integration]") {
  FakeDevice device;
  std::thread responder([&]() {
    int peer = device.accept_peer();
    if (peer >= 0) {
      FakeDevice::send_all(peer, "{\"type\":\"client-info\",\"data\":{\"uuid\":42}}\n");
    }
  });

  auto uuid = MicBridge::validate_target("127.0.0.1", device.port(), milliseconds(1000));
  responder.join();
  REQUIRE(uuid.has_value());
  REQUIRE(uuid.value() == "42");
}

TEST_CASE("Integration - validation failures", "[integration]") {
  FakeDevice device;
  std::string reply;

  SECTION("wrong first message") { reply = "{\"type\":\"ping\"}\n"; }
  SECTION("client info without uuid") { reply = "{\"type\":\"client-info\",\"data\":{}}\n"; }
  SECTION("malformed first message") { reply = "hello\n"; }
  SECTION("silent device") { reply = ""; }

  std::thread responder([&]() {
    int peer = device.accept_peer();
    if (peer >= 0 && !reply.empty()) {
      FakeDevice::send_all(peer, reply);
    }
  });

  auto uuid = MicBridge::validate_target("127.0.0.1", device.port(), milliseconds(300));
  responder.join();
  REQUIRE_FALSE(uuid.has_value());
  REQUIRE(uuid.get_error() == ErrorCode::kHandshakeFailed);
}

TEST_CASE("Integration - validation of a closed port", "[integration]") {
  uint16_t port = 0;
  {
    FakeDevice closed;
    port = closed.port();
  }
  auto uuid = MicBridge::validate_target("127.0.0.1", port, milliseconds(300));
  REQUIRE_FALSE(uuid.has_value());
  REQUIRE(uuid.get_error() == ErrorCode::kSocketError);
}
