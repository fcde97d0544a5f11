#ifndef MICBRIDGE_STATS_HPP_
#define MICBRIDGE_STATS_HPP_

#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>

namespace micbridge {

// ============================================================================
// BridgeStats - Atomic counters, written by the reactor, readable anywhere
// ============================================================================

struct alignas(kCacheLine) BridgeStats {
  // Inbound traffic
  std::atomic<uint64_t> messages_in{0};
  std::atomic<uint64_t> bytes_in{0};
  std::atomic<uint64_t> bad_messages{0};

  // Inbound messages by kind
  std::atomic<uint64_t> audio_chunks_in{0};
  std::atomic<uint64_t> client_info_in{0};
  std::atomic<uint64_t> pings_in{0};
  std::atomic<uint64_t> unknown_in{0};

  // Outbound traffic
  std::atomic<uint64_t> messages_out{0};
  std::atomic<uint64_t> bytes_out{0};
  std::atomic<uint64_t> outbox_overflows{0};
  std::atomic<uint64_t> outbox_dropped{0};

  // Connection lifecycle
  std::atomic<uint64_t> connect_attempts{0};
  std::atomic<uint64_t> connects{0};
  std::atomic<uint64_t> connect_failures{0};
  std::atomic<uint64_t> sessions{0};
  std::atomic<uint64_t> forced_reconnects{0};
  std::atomic<uint64_t> watchdog_timeouts{0};

  // Audio queue
  std::atomic<uint64_t> audio_overflows{0};
  std::atomic<uint64_t> audio_chunks_dropped{0};

  void reset() {
    messages_in = 0;
    bytes_in = 0;
    bad_messages = 0;
    audio_chunks_in = 0;
    client_info_in = 0;
    pings_in = 0;
    unknown_in = 0;
    messages_out = 0;
    bytes_out = 0;
    outbox_overflows = 0;
    outbox_dropped = 0;
    connect_attempts = 0;
    connects = 0;
    connect_failures = 0;
    sessions = 0;
    forced_reconnects = 0;
    watchdog_timeouts = 0;
    audio_overflows = 0;
    audio_chunks_dropped = 0;
  }

  static void bump(std::atomic<uint64_t>& counter, uint64_t by = 1) { counter.fetch_add(by, std::memory_order_relaxed); }
};

}  // namespace micbridge

#endif  // MICBRIDGE_STATS_HPP_
