// Simulated microphone device
// Accepts one host at a time, introduces itself with client-info, then
// streams a 440 Hz tone as 20 ms audio chunks with a ping every few seconds.
// play-tts requests from the host are printed.
//
// Usage: ./fake_mic_device [port] [uuid]

#include "micbridge.hpp"

#include <poll.h>
#include <sys/socket.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sockpp/tcp_acceptor.h>
#include <string>
#include <vector>

namespace {

constexpr uint16_t kDefaultPort = 11700;
constexpr uint32_t kChunkMs = 20;
constexpr uint32_t kPingIntervalMs = 5000;
constexpr double kToneHz = 440.0;
constexpr double kTwoPi = 6.283185307179586;

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop.store(true); }

using DeviceClock = std::chrono::steady_clock;

bool write_all(sockpp::tcp_socket& sock, const uint8_t* data, size_t len) {
  while (len > 0) {
    ssize_t n = ::send(sock.handle(), data, len, MSG_NOSIGNAL);
    if (n <= 0) {
      return false;
    }
    data += n;
    len -= static_cast<size_t>(n);
  }
  return true;
}

bool send_frame(sockpp::tcp_socket& sock, nlohmann::json header, const micbridge::Payload& payload = {}) {
  if (!payload.empty()) {
    header["payload_length"] = payload.size();
  }
  std::string line = micbridge::encode_message(header);
  if (!write_all(sock, reinterpret_cast<const uint8_t*>(line.data()), line.size())) {
    return false;
  }
  return payload.empty() || write_all(sock, payload.data(), payload.size());
}

// 16-bit little-endian mono samples of a sine tone
micbridge::Payload make_tone_chunk(uint64_t* phase) {
  constexpr uint32_t kSamples = micbridge::AudioFormat::kSampleRate * kChunkMs / 1000;
  micbridge::Payload out(kSamples * 2);
  for (uint32_t i = 0; i < kSamples; ++i) {
    double t = static_cast<double>((*phase)++) / micbridge::AudioFormat::kSampleRate;
    auto sample = static_cast<int16_t>(std::sin(kTwoPi * kToneHz * t) * 8000.0);
    out[2 * i] = static_cast<uint8_t>(sample & 0xff);
    out[2 * i + 1] = static_cast<uint8_t>((sample >> 8) & 0xff);
  }
  return out;
}

// Returns when the host disconnects or the device is stopped
void serve_host(sockpp::tcp_socket& sock, const std::string& uuid) {
  nlohmann::json info = {{"type", "client-info"}, {"data", {{"uuid", uuid}, {"version", "fake-1"}}}};
  if (!send_frame(sock, info)) {
    std::cerr << "Failed to send client-info" << std::endl;
    return;
  }

  micbridge::MessageDecoder decoder{micbridge::CodecLimits()};
  uint64_t phase = 0;
  auto next_chunk = DeviceClock::now();
  auto next_ping = DeviceClock::now() + std::chrono::milliseconds(kPingIntervalMs);
  uint8_t buf[4096];

  while (!g_stop.load()) {
    auto now = DeviceClock::now();
    if (now >= next_chunk) {
      if (!send_frame(sock, {{"type", "audio-chunk"}}, make_tone_chunk(&phase))) {
        break;
      }
      next_chunk += std::chrono::milliseconds(kChunkMs);
    }
    if (now >= next_ping) {
      if (!send_frame(sock, {{"type", "ping"}})) {
        break;
      }
      next_ping += std::chrono::milliseconds(kPingIntervalMs);
    }

    struct pollfd pfd;
    pfd.fd = sock.handle();
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ret = ::poll(&pfd, 1, micbridge::millis_until(std::min(next_chunk, next_ping), DeviceClock::now()));
    if (ret <= 0) {
      continue;
    }

    ssize_t n = sock.read(buf, sizeof(buf));
    if (n <= 0) {
      break;
    }
    decoder.feed(buf, static_cast<size_t>(n));
    while (true) {
      auto result = decoder.next(DeviceClock::now());
      if (!result) {
        std::cerr << "Bad message from host: " << result.get_error().to_string() << std::endl;
        continue;
      }
      if (!result.value().has_value()) {
        break;
      }
      const auto& msg = result.value().value();
      if (msg.type() == micbridge::MessageType::kPlayTts) {
        std::cout << "play-tts: " << msg.data().value("url", std::string("<no url>")) << std::endl;
      } else {
        std::cout << "Host sent " << msg.describe() << std::endl;
      }
    }
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  uint16_t port = kDefaultPort;
  if (argc > 1) {
    port = static_cast<uint16_t>(std::atoi(argv[1]));
  }
  std::string uuid = (argc > 2) ? argv[2] : "fake-mic-0001";

  // No SA_RESTART, so Ctrl+C interrupts a blocking accept()
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = on_signal;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  sockpp::tcp_acceptor acceptor(port);
  if (!acceptor) {
    std::cerr << "Error creating the acceptor: " << acceptor.last_error_str() << std::endl;
    return 1;
  }
  std::cout << "Fake mic device " << uuid << " listening on port " << port << std::endl;

  while (!g_stop.load()) {
    sockpp::inet_address peer;
    sockpp::tcp_socket sock = acceptor.accept(&peer);
    if (!sock) {
      if (!g_stop.load()) {
        std::cerr << "Error accepting host: " << acceptor.last_error_str() << std::endl;
      }
      continue;
    }
    std::cout << "Host connected from " << peer.to_string() << std::endl;
    serve_host(sock, uuid);
    std::cout << "Host disconnected" << std::endl;
  }
  return 0;
}
