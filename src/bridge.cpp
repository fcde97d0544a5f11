#include "micbridge/bridge.hpp"

#include "micbridge/codec.hpp"
#include "micbridge/log.hpp"

namespace micbridge {

MicBridge::MicBridge(const BridgeConfig& config, PipelineConsumer& consumer)
    : config_(config),
      audio_(config.audio_queue_capacity, &stats_),
      dispatcher_(audio_, &stats_),
      manager_(config_, dispatcher_, &dispatcher_, &stats_),
      runner_(consumer, audio_) {}

MicBridge::~MicBridge() { stop(); }

expected<void, ErrorCode> MicBridge::start() {
  auto valid = validate_config(config_);
  if (!valid) {
    return valid;
  }
  if (network_thread_.joinable()) {
    MICBRIDGE_LOG_WARN("Bridge for " + config_.label() + " already started");
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
  }
  if (manager_.is_closing()) {
    MICBRIDGE_LOG_ERROR("Bridge for " + config_.label() + " was stopped and cannot be restarted");
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
  }

  MICBRIDGE_LOG_INFO("Starting bridge for " + config_.label());
  runner_.start();
  network_thread_ = std::thread([this] { manager_.run(); });
  return expected<void, ErrorCode>::success();
}

void MicBridge::stop() {
  if (!network_thread_.joinable()) {
    return;
  }
  MICBRIDGE_LOG_INFO("Stopping bridge for " + config_.label());
  manager_.close();
  network_thread_.join();
  runner_.stop();
}

bool MicBridge::add_state_observer(ConnectionObserver* observer) { return dispatcher_.add_observer(observer); }

void MicBridge::play_tts(const std::string& url_base, const std::string& path) {
  if (url_base.empty()) {
    MICBRIDGE_LOG_WARN("Can't play TTS without a base URL");
    return;
  }
  if (path.empty()) {
    MICBRIDGE_LOG_WARN("Can't play TTS without a media path");
    return;
  }
  std::string url = url_base + path;
  MICBRIDGE_LOG_DEBUG("Requesting TTS playback of " + url);
  manager_.enqueue_send(make_play_tts(url));
}

// ============================================================================
// Validation handshake
// ============================================================================

expected<std::string, ErrorCode> MicBridge::validate_target(const std::string& host, uint16_t port,
                                                            std::chrono::milliseconds timeout,
                                                            const BridgeConfig& defaults) {
  using Result = expected<std::string, ErrorCode>;
  const std::string target = host + ":" + std::to_string(port);

  sockpp::tcp_socket sock;
  if (!open_connection(sock, host, port, timeout, defaults.tcp)) {
    return Result::error(ErrorCode::kSocketError);
  }
  ScopeGuard close_guard([&sock] {
    if (!sock.close()) {
      MICBRIDGE_LOG_DEBUG("close() after validation failed: " + sock.last_error_str());
    }
  });

  MessageDecoder decoder(defaults.limits);
  auto result = read_message(sock, decoder, timeout);
  if (!result) {
    MICBRIDGE_LOG_ERROR("Validation of " + target + " failed: " + result.get_error().to_string());
    return Result::error(ErrorCode::kHandshakeFailed);
  }
  if (!result.value().has_value()) {
    MICBRIDGE_LOG_ERROR("Validation of " + target + " failed: connection closed before any message");
    return Result::error(ErrorCode::kHandshakeFailed);
  }

  const Message& msg = result.value().value();
  if (msg.type() != MessageType::kClientInfo) {
    MICBRIDGE_LOG_ERROR("Validation of " + target + " failed: expected CLIENT_INFO, got " + msg.describe());
    return Result::error(ErrorCode::kHandshakeFailed);
  }

  auto uuid = msg.data().find("uuid");
  if (uuid == msg.data().end() || uuid->is_null()) {
    MICBRIDGE_LOG_ERROR("Validation of " + target + " failed: client info has no uuid");
    return Result::error(ErrorCode::kHandshakeFailed);
  }

  std::string id = uuid->is_string() ? uuid->get<std::string>() : uuid->dump();
  MICBRIDGE_LOG_INFO("Validated device " + id + " at " + target);
  return Result::success(std::move(id));
}

}  // namespace micbridge
