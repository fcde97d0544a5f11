// micbridge command-line host
// Connects to one device, logs connection changes and optionally records the
// microphone stream as raw 16 kHz mono s16le PCM.
//
// Usage: ./micbridge_cli host port [--validate] [--pcm-out PATH]
//                        [--watchdog-ms N] [--backoff-ms N] [--verbose]

#include "micbridge.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop.store(true); }

// ============================================================================
// Pipeline consumer writing PCM to a file
// ============================================================================

class PcmFileSink : public micbridge::PipelineConsumer {
 public:
  // One run covers this much audio, then the runner starts a new one
  static constexpr uint64_t kBytesPerRun = micbridge::AudioFormat::kBytesPerSecond * 10;

  explicit PcmFileSink(const std::string& path) : path_(path) {
    if (!path_.empty()) {
      out_.open(path_, std::ios::binary | std::ios::trunc);
      if (!out_) {
        MICBRIDGE_LOG_ERROR("Cannot open " + path_ + " for writing; audio will be discarded");
      }
    }
  }

  void run_pipeline(micbridge::AudioChunkSource& source) override {
    uint64_t bytes = 0;
    while (bytes < kBytesPerRun) {
      auto chunk = source.next_chunk();
      if (!chunk) {
        break;
      }
      const auto& data = chunk.value();
      bytes += data.size();
      if (out_.is_open()) {
        out_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!out_) {
          MICBRIDGE_LOG_ERROR("Write to " + path_ + " failed; closing it");
          out_.close();
        }
      }
    }
    total_ += bytes;
    MICBRIDGE_LOG_INFO("Pipeline run consumed " + std::to_string(bytes) + " bytes (" +
                       std::to_string(bytes * 1000 / micbridge::AudioFormat::kBytesPerSecond) + " ms of audio)");
  }

  uint64_t total() const { return total_; }

 private:
  std::string path_;
  std::ofstream out_;
  uint64_t total_ = 0;
};

// ============================================================================
// Observer printing connection changes
// ============================================================================

class StatePrinter : public micbridge::ConnectionObserver {
 public:
  void on_connection_state_changed(bool connected) override {
    std::cout << "Device " << (connected ? "connected" : "disconnected") << std::endl;
  }
};

void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog
            << " host port [--validate] [--pcm-out PATH] [--watchdog-ms N] [--backoff-ms N] [--verbose]"
            << std::endl;
}

bool parse_u32(const char* text, uint32_t* out) {
  char* end = nullptr;
  unsigned long value = std::strtoul(text, &end, 10);
  if (end == text || *end != '\0' || value > 0xffffffffUL) {
    return false;
  }
  *out = static_cast<uint32_t>(value);
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 3) {
    print_usage(argv[0]);
    return 2;
  }

  micbridge::BridgeConfig config;
  config.host = argv[1];
  uint32_t port = 0;
  if (!parse_u32(argv[2], &port) || port > 65535) {
    std::cerr << "Invalid port: " << argv[2] << std::endl;
    return 2;
  }
  config.port = static_cast<uint16_t>(port);

  bool validate = false;
  std::string pcm_out;
  for (int i = 3; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--validate") {
      validate = true;
    } else if (arg == "--verbose") {
      micbridge::Logger::set_level(micbridge::Logger::Level::kDebug);
    } else if (arg == "--pcm-out" && i + 1 < argc) {
      pcm_out = argv[++i];
    } else if (arg == "--watchdog-ms" && i + 1 < argc) {
      if (!parse_u32(argv[++i], &config.watchdog_timeout_ms)) {
        std::cerr << "Invalid --watchdog-ms value" << std::endl;
        return 2;
      }
    } else if (arg == "--backoff-ms" && i + 1 < argc) {
      if (!parse_u32(argv[++i], &config.reconnect_backoff_ms)) {
        std::cerr << "Invalid --backoff-ms value" << std::endl;
        return 2;
      }
    } else {
      print_usage(argv[0]);
      return 2;
    }
  }

  if (!micbridge::validate_config(config)) {
    return 2;
  }

  if (validate) {
    auto uuid = micbridge::MicBridge::validate_target(config.host, config.port,
                                                      std::chrono::milliseconds(config.handshake_timeout_ms), config);
    if (!uuid) {
      std::cerr << "Validation failed: " << micbridge::error_code_name(uuid.get_error()) << std::endl;
      return 1;
    }
    std::cout << "Device uuid: " << uuid.value() << std::endl;
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  PcmFileSink sink(pcm_out);
  StatePrinter printer;
  micbridge::MicBridge bridge(config, sink);
  bridge.add_state_observer(&printer);

  auto started = bridge.start();
  if (!started) {
    std::cerr << "Failed to start: " << micbridge::error_code_name(started.get_error()) << std::endl;
    return 1;
  }

  while (!g_stop.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  bridge.stop();

  const auto& stats = bridge.stats();
  std::cout << "Messages in:      " << stats.messages_in.load() << "\n"
            << "Audio chunks:     " << stats.audio_chunks_in.load() << "\n"
            << "Bad messages:     " << stats.bad_messages.load() << "\n"
            << "Reconnects:       " << stats.connects.load() << "\n"
            << "Watchdog expired: " << stats.watchdog_timeouts.load() << "\n"
            << "PCM bytes:        " << sink.total() << std::endl;
  return 0;
}
