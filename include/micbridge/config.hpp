#ifndef MICBRIDGE_CONFIG_HPP_
#define MICBRIDGE_CONFIG_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <string>

namespace micbridge {

// ============================================================================
// TCP Tuning Configuration
// ============================================================================

struct TcpTuning {
  bool tcp_nodelay = true;   // Control lines are tiny; do not batch them
  bool so_keepalive = true;  // Kernel-level backstop behind the watchdog

  // Keepalive parameters (Linux-specific, effective when so_keepalive=true)
  int keepalive_idle_s = 30;      // Seconds before first keepalive probe
  int keepalive_interval_s = 10;  // Seconds between probes
  int keepalive_count = 3;        // Max probes before dropping connection
};

// ============================================================================
// Codec limits
// ============================================================================

struct CodecLimits {
  size_t max_line_bytes = 64 * 1024;          // Longest accepted header line
  size_t max_extension_bytes = 1024 * 1024;   // Largest data/payload block
  uint32_t extension_timeout_ms = 500;        // Window for each extension block
};

// ============================================================================
// BridgeConfig (everything a device bridge needs, passed by value)
// ============================================================================

struct BridgeConfig {
  std::string host;
  uint16_t port = 0;
  std::string name;  // Used in log lines; empty means host:port

  uint32_t connect_timeout_ms = 5000;
  uint32_t watchdog_timeout_ms = 15000;
  uint32_t handshake_timeout_ms = 2000;
  uint32_t reconnect_backoff_ms = 2000;
  uint32_t send_timeout_ms = 1000;

  uint32_t max_consecutive_bad_messages = 5;

  size_t audio_queue_capacity = 2048;
  size_t outbox_capacity = 256;

  CodecLimits limits;
  TcpTuning tcp;

  // "name (host:port)" or "host:port"
  std::string label() const;
};

// Check ranges; returns kInvalidConfig on the first violation (logged).
expected<void, ErrorCode> validate_config(const BridgeConfig& config);

}  // namespace micbridge

#endif  // MICBRIDGE_CONFIG_HPP_
