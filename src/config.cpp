#include "micbridge/config.hpp"

#include "micbridge/log.hpp"

namespace micbridge {

std::string BridgeConfig::label() const {
  std::string target = host + ":" + std::to_string(port);
  if (name.empty()) {
    return target;
  }
  return name + " (" + target + ")";
}

namespace {

expected<void, ErrorCode> reject(const std::string& reason) {
  MICBRIDGE_LOG_ERROR("Invalid configuration: " + reason);
  return expected<void, ErrorCode>::error(ErrorCode::kInvalidConfig);
}

}  // namespace

expected<void, ErrorCode> validate_config(const BridgeConfig& config) {
  if (config.host.empty()) {
    return reject("host is empty");
  }
  // uint16_t already caps the upper bound at 65535
  if (config.port == 0) {
    return reject("port must be in 1..65535");
  }
  if (config.connect_timeout_ms == 0 || config.watchdog_timeout_ms == 0 || config.handshake_timeout_ms == 0 ||
      config.send_timeout_ms == 0 || config.limits.extension_timeout_ms == 0) {
    return reject("timeouts must be positive");
  }
  if (config.max_consecutive_bad_messages == 0) {
    return reject("max_consecutive_bad_messages must be positive");
  }
  if (config.audio_queue_capacity == 0 || config.outbox_capacity == 0) {
    return reject("queue capacities must be positive");
  }
  if (config.limits.max_line_bytes == 0 || config.limits.max_extension_bytes == 0) {
    return reject("codec limits must be positive");
  }
  return expected<void, ErrorCode>::success();
}

}  // namespace micbridge
