#ifndef MICBRIDGE_BRIDGE_HPP_
#define MICBRIDGE_BRIDGE_HPP_

#include "audio_bridge.hpp"
#include "config.hpp"
#include "connection_manager.hpp"
#include "dispatcher.hpp"
#include "pipeline.hpp"
#include "stats.hpp"
#include "vocabulary.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

namespace micbridge {

// ============================================================================
// MicBridge - one device, its network loop and its speech pipeline
// ============================================================================

/**
 * @brief Host-side facade for a single microphone device.
 *
 * Wires ConnectionManager -> Dispatcher -> AudioBridge -> PipelineRunner.
 * start() spawns the network thread and the pipeline thread; stop() tears
 * both down and joins them.
 *
 * Usage:
 * @code
 *   micbridge::BridgeConfig cfg;
 *   cfg.host = "192.168.1.40";
 *   cfg.port = 11700;
 *   MyPipeline pipeline;
 *   micbridge::MicBridge bridge(cfg, pipeline);
 *   bridge.start();
 *   bridge.play_tts("http://hass.local:8123", "/api/tts_proxy/abc.mp3");
 * @endcode
 */
class MicBridge {
 public:
  MicBridge(const BridgeConfig& config, PipelineConsumer& consumer);
  ~MicBridge();

  MicBridge(const MicBridge&) = delete;
  MicBridge& operator=(const MicBridge&) = delete;

  // Validates the configuration first; kInvalidConfig or kInvalidState on failure
  expected<void, ErrorCode> start();

  // Idempotent
  void stop();

  bool is_running() const { return network_thread_.joinable(); }

  // Register before start(); returns false when the observer table is full
  bool add_state_observer(ConnectionObserver* observer);

  // Ask the device to play speech from url_base + path
  void play_tts(const std::string& url_base, const std::string& path);

  bool is_connected() const { return manager_.is_connected(); }
  ConnectionState state() const { return manager_.state(); }
  nlohmann::json client_info() const { return dispatcher_.client_info(); }

  const BridgeStats& stats() const { return stats_; }
  const BridgeConfig& config() const { return config_; }
  ConnectionManager& connection() { return manager_; }
  AudioBridge& audio() { return audio_; }

  /**
   * @brief Check that host:port is a device speaking this protocol.
   *
   * Connects, waits for the first message and expects a client-info carrying
   * a uuid. Returns the uuid (JSON text when it is not a string).
   * kSocketError when the connection cannot be opened, kHandshakeFailed for
   * anything else.
   */
  static expected<std::string, ErrorCode> validate_target(const std::string& host, uint16_t port,
                                                          std::chrono::milliseconds timeout,
                                                          const BridgeConfig& defaults = BridgeConfig());

 private:
  BridgeConfig config_;
  BridgeStats stats_;
  AudioBridge audio_;
  Dispatcher dispatcher_;
  ConnectionManager manager_;
  PipelineRunner runner_;
  std::thread network_thread_;
};

}  // namespace micbridge

#endif  // MICBRIDGE_BRIDGE_HPP_
