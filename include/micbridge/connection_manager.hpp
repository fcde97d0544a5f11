#ifndef MICBRIDGE_CONNECTION_MANAGER_HPP_
#define MICBRIDGE_CONNECTION_MANAGER_HPP_

#include "codec.hpp"
#include "config.hpp"
#include "connection_state.hpp"
#include "ring_buffer.hpp"
#include "stats.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sockpp/tcp_socket.h>
#include <string>
#include <thread>

namespace micbridge {

// Open a TCP connection with a timeout and apply tuning. Never throws;
// resolution and connect failures are logged and returned as kSocketError.
expected<void, ErrorCode> open_connection(sockpp::tcp_socket& out, const std::string& host, uint16_t port,
                                          std::chrono::milliseconds timeout, const TcpTuning& tuning);

// ============================================================================
// ConnectionManager (one device, reconnecting poll() reactor)
// ============================================================================

/**
 * @brief Owns the device socket and keeps it alive.
 *
 * run() is the outer loop: reconnect, run one session, back off, repeat until
 * close(). A session interleaves three activities on the calling thread:
 * reading and decoding (dispatched to the MessageHandler), draining the
 * outbox, and the watchdog. The session ends on end of stream, transport
 * failure, or watchdog expiry.
 *
 * Thread safety: enqueue_send(), request_reconnect(), close(), state() and
 * stats() may be called from any thread. reconnect() and send() belong to
 * the thread running run() (or to the caller before run() starts).
 */
class ConnectionManager {
 public:
  static constexpr size_t kTxBufferSize = 16384;
  static constexpr size_t kReadChunk = 8192;

  // Counters go to stats when given (shared with the rest of the bridge),
  // otherwise to a private BridgeStats.
  ConnectionManager(const BridgeConfig& config, MessageHandler& handler, ConnectionObserver* observer = nullptr,
                    BridgeStats* stats = nullptr);
  ~ConnectionManager();

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  // Outer loop (blocking); returns once close() was requested
  void run();

  // Request shutdown and wait for run() to tear the socket down. Idempotent;
  // does not wait when called from the run() thread itself.
  void close();

  // Drop the current socket (if any) and open a new one.
  // Failure leaves the state Disconnected; it is logged, never raised.
  void reconnect();

  // Ask the run() thread to reconnect at its next wakeup
  void request_reconnect();

  // Synchronous best-effort write of one message; flushes queued bytes first
  expected<void, ErrorCode> send(const nlohmann::json& data);

  // Queue a message for the send loop; valid in any state
  void enqueue_send(nlohmann::json data);

  ConnectionState state() const { return state_.load(std::memory_order_acquire); }
  bool is_connected() const { return state() == ConnectionState::kConnected; }
  bool is_closing() const { return should_close_.load(std::memory_order_acquire); }

  size_t outbox_size() const;
  const BridgeStats& stats() const { return *stats_; }
  BridgeStats& mutable_stats() { return *stats_; }
  const BridgeConfig& config() const { return config_; }

 private:
  using Clock = SteadyClock;

  BridgeConfig config_;
  MessageHandler& handler_;
  ConnectionObserver* observer_;
  std::string label_;

  sockpp::tcp_socket socket_;
  MessageDecoder decoder_;
  ByteRing<kTxBufferSize> tx_buffer_;

  std::atomic<ConnectionState> state_{ConnectionState::kDisconnected};
  std::atomic<bool> should_close_{false};
  std::atomic<bool> reconnect_requested_{false};

  TimePoint last_message_at_ = Clock::now();
  uint32_t bad_messages_ = 0;

  mutable std::mutex outbox_mutex_;
  std::deque<nlohmann::json> outbox_;

  int wake_fd_ = -1;

  std::mutex run_mutex_;
  std::condition_variable run_done_;
  bool running_ = false;
  std::thread::id run_thread_;

  BridgeStats own_stats_;
  BridgeStats* stats_;

  // --- Session ---
  void run_session();
  expected<void, ErrorCode> handle_read();
  expected<void, ErrorCode> process_messages(TimePoint now);
  expected<void, ErrorCode> handle_bad_message(const DecodeError& err);
  expected<void, ErrorCode> flush_tx();
  void pump_outbox();
  bool watchdog_expired(TimePoint now) const;
  int next_poll_timeout_ms(TimePoint now) const;

  // --- Helpers ---
  void set_state(ConnectionState state);
  void destroy_socket();
  void wake();
  void drain_wakeups();
  bool sleep_interruptible(std::chrono::milliseconds duration);
};

}  // namespace micbridge

#endif  // MICBRIDGE_CONNECTION_MANAGER_HPP_
