#include "micbridge/connection_manager.hpp"

#include "micbridge/log.hpp"

#include <cerrno>
#include <cstring>

#include <algorithm>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sockpp/tcp_connector.h>
#include <stdexcept>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/uio.h>
#include <unistd.h>

namespace micbridge {

namespace {

void apply_tcp_tuning(int fd, const TcpTuning& tuning) {
  int opt = 1;

  if (tuning.tcp_nodelay) {
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
  }

  if (tuning.so_keepalive) {
    setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));

#ifdef TCP_KEEPIDLE
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &tuning.keepalive_idle_s, sizeof(tuning.keepalive_idle_s));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &tuning.keepalive_interval_s, sizeof(tuning.keepalive_interval_s));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &tuning.keepalive_count, sizeof(tuning.keepalive_count));
#endif
  }
}

bool is_connection_loss(int err) { return err == ECONNRESET || err == EPIPE || err == ETIMEDOUT; }

}  // namespace

expected<void, ErrorCode> open_connection(sockpp::tcp_socket& out, const std::string& host, uint16_t port,
                                          std::chrono::milliseconds timeout, const TcpTuning& tuning) {
  const std::string target = host + ":" + std::to_string(port);
  sockpp::tcp_connector conn;

  try {
    sockpp::inet_address addr(host, port);
    if (!conn.connect(addr, timeout)) {
      MICBRIDGE_LOG_ERROR("Encountered an error trying to connect to " + target + ": " + conn.last_error_str());
      return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
    }
  } catch (const std::exception& e) {
    // inet_address throws when the host does not resolve
    MICBRIDGE_LOG_ERROR("Could not resolve " + target + ": " + e.what());
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }

  out = sockpp::tcp_socket(conn.release());
  apply_tcp_tuning(out.handle(), tuning);
  return expected<void, ErrorCode>::success();
}

// ============================================================================
// Lifecycle
// ============================================================================

ConnectionManager::ConnectionManager(const BridgeConfig& config, MessageHandler& handler,
                                     ConnectionObserver* observer, BridgeStats* stats)
    : config_(config),
      handler_(handler),
      observer_(observer),
      label_(config.label()),
      decoder_(config.limits),
      stats_(stats != nullptr ? stats : &own_stats_) {
  wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wake_fd_ < 0) {
    MICBRIDGE_THROW(std::runtime_error(std::string("Failed to create wakeup eventfd: ") + std::strerror(errno)));
  }
}

ConnectionManager::~ConnectionManager() {
  close();
  // Observers may already be gone; close the socket without notifying them
  if (socket_.is_open() && !socket_.close()) {
    MICBRIDGE_LOG_DEBUG("close() on " + label_ + " failed: " + socket_.last_error_str());
  }
  if (wake_fd_ >= 0) {
    ::close(wake_fd_);
  }
}

void ConnectionManager::run() {
  {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (running_) {
      MICBRIDGE_LOG_ERROR("Network loop for " + label_ + " is already running");
      return;
    }
    running_ = true;
    run_thread_ = std::this_thread::get_id();
  }

  MICBRIDGE_LOG_INFO("Starting network loop for " + label_);
  while (!is_closing()) {
    reconnect_requested_.store(false, std::memory_order_release);
    reconnect();
    if (is_connected()) {
      run_session();
    }
    destroy_socket();
    if (is_closing()) {
      break;
    }
    MICBRIDGE_LOG_WARN("Disconnected from " + label_ + "; will reconnect in " +
                       std::to_string(config_.reconnect_backoff_ms) + " ms");
    sleep_interruptible(std::chrono::milliseconds(config_.reconnect_backoff_ms));
  }
  MICBRIDGE_LOG_INFO("Network loop for " + label_ + " stopped");

  {
    std::lock_guard<std::mutex> lock(run_mutex_);
    running_ = false;
    run_thread_ = std::thread::id();
  }
  run_done_.notify_all();
}

void ConnectionManager::close() {
  if (!should_close_.exchange(true, std::memory_order_acq_rel)) {
    MICBRIDGE_LOG_DEBUG("Closing connection to " + label_);
  }
  wake();

  std::unique_lock<std::mutex> lock(run_mutex_);
  if (running_ && run_thread_ != std::this_thread::get_id()) {
    run_done_.wait(lock, [this] { return !running_; });
  }
}

void ConnectionManager::reconnect() {
  if (socket_.is_open()) {
    MICBRIDGE_LOG_DEBUG("Dropping current socket to " + label_);
    destroy_socket();
  }

  set_state(ConnectionState::kConnecting);
  BridgeStats::bump(stats_->connect_attempts);
  MICBRIDGE_LOG_DEBUG("Trying connection to " + label_);

  sockpp::tcp_socket sock;
  auto opened = open_connection(sock, config_.host, config_.port, std::chrono::milliseconds(config_.connect_timeout_ms),
                                config_.tcp);
  if (!opened) {
    BridgeStats::bump(stats_->connect_failures);
    set_state(ConnectionState::kDisconnected);
    return;
  }
  if (!sock.set_non_blocking(true)) {
    MICBRIDGE_LOG_ERROR("Failed to make socket to " + label_ + " non-blocking: " + sock.last_error_str());
    BridgeStats::bump(stats_->connect_failures);
    set_state(ConnectionState::kDisconnected);
    return;
  }

  socket_ = std::move(sock);
  decoder_.reset();
  tx_buffer_.clear();
  bad_messages_ = 0;
  last_message_at_ = Clock::now();

  BridgeStats::bump(stats_->connects);
  MICBRIDGE_LOG_INFO("Connected to " + label_);
  set_state(ConnectionState::kConnected);
}

void ConnectionManager::request_reconnect() {
  reconnect_requested_.store(true, std::memory_order_release);
  wake();
}

// ============================================================================
// Session
// ============================================================================

void ConnectionManager::run_session() {
  BridgeStats::bump(stats_->sessions);
  MICBRIDGE_LOG_DEBUG("Session started for " + label_);

  while (!is_closing() && is_connected()) {
    if (reconnect_requested_.exchange(false, std::memory_order_acq_rel)) {
      MICBRIDGE_LOG_INFO("Reconnect requested for " + label_);
      reconnect();
      if (!is_connected()) {
        break;
      }
    }

    pump_outbox();
    if (!tx_buffer_.empty() && !flush_tx()) {
      break;
    }

    TimePoint now = Clock::now();
    struct pollfd fds[2];
    fds[0].fd = socket_.handle();
    fds[0].events = static_cast<short>(POLLIN | (tx_buffer_.empty() ? 0 : POLLOUT));
    fds[0].revents = 0;
    fds[1].fd = wake_fd_;
    fds[1].events = POLLIN;
    fds[1].revents = 0;

    int ret = ::poll(fds, 2, next_poll_timeout_ms(now));
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      MICBRIDGE_LOG_ERROR(std::string("Poll error: ") + std::strerror(errno));
      set_state(ConnectionState::kDisconnected);
      break;
    }
    now = Clock::now();

    if (fds[1].revents & POLLIN) {
      drain_wakeups();
    }
    if ((fds[0].revents & POLLOUT) && !flush_tx()) {
      break;
    }
    if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) && !handle_read()) {
      break;
    }

    // Runs on every wakeup so that extension deadlines fire without input
    if (!process_messages(now)) {
      break;
    }

    if (watchdog_expired(now)) {
      auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_message_at_).count();
      MICBRIDGE_LOG_WARN("Last message from " + label_ + " is " + std::to_string(age) +
                         " ms old; assuming the connection is dead");
      BridgeStats::bump(stats_->watchdog_timeouts);
      set_state(ConnectionState::kDisconnected);
      break;
    }
  }

  MICBRIDGE_LOG_DEBUG("Session ended for " + label_);
}

expected<void, ErrorCode> ConnectionManager::handle_read() {
  uint8_t buf[kReadChunk];
  ssize_t n = socket_.read(buf, sizeof(buf));

  if (n > 0) {
    BridgeStats::bump(stats_->bytes_in, static_cast<uint64_t>(n));
    decoder_.feed(buf, static_cast<size_t>(n));
    return expected<void, ErrorCode>::success();
  }

  if (n == 0) {
    MICBRIDGE_LOG_DEBUG("Got end of stream from " + label_);
    set_state(ConnectionState::kDisconnected);
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }

  int err = socket_.last_error();
  if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
    return expected<void, ErrorCode>::success();
  }
  if (is_connection_loss(err)) {
    MICBRIDGE_LOG_WARN("Connection to " + label_ + " lost");
  } else {
    MICBRIDGE_LOG_ERROR("Read error on " + label_ + ": " + socket_.last_error_str());
  }
  set_state(ConnectionState::kDisconnected);
  return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
}

expected<void, ErrorCode> ConnectionManager::process_messages(TimePoint now) {
  while (socket_.is_open() && !is_closing()) {
    auto result = decoder_.next(now);
    if (!result.has_value()) {
      auto handled = handle_bad_message(result.get_error());
      if (!handled) {
        return handled;
      }
      continue;
    }
    if (!result.value().has_value()) {
      break;
    }

    const Message& msg = result.value().value();
    last_message_at_ = now;
    bad_messages_ = 0;
    BridgeStats::bump(stats_->messages_in);
    MICBRIDGE_LOG_DEBUG("Received " + msg.describe());
    handler_.handle_message(msg);
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> ConnectionManager::handle_bad_message(const DecodeError& err) {
  MICBRIDGE_LOG_ERROR("Bad message from " + label_ + ": " + err.to_string());
  BridgeStats::bump(stats_->bad_messages);
  // The device is still talking to us, just not sensibly
  last_message_at_ = Clock::now();

  if (++bad_messages_ < config_.max_consecutive_bad_messages) {
    return expected<void, ErrorCode>::success();
  }

  MICBRIDGE_LOG_ERROR("Got " + std::to_string(bad_messages_) + " bad messages in a row from " + label_ +
                      "; reconnecting");
  BridgeStats::bump(stats_->forced_reconnects);
  bad_messages_ = 0;
  reconnect();
  if (!is_connected()) {
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  }
  return expected<void, ErrorCode>::success();
}

bool ConnectionManager::watchdog_expired(TimePoint now) const {
  return now - last_message_at_ > std::chrono::milliseconds(config_.watchdog_timeout_ms);
}

int ConnectionManager::next_poll_timeout_ms(TimePoint now) const {
  TimePoint wake_at = last_message_at_ + std::chrono::milliseconds(config_.watchdog_timeout_ms) +
                      std::chrono::milliseconds(1);
  if (decoder_.has_deadline()) {
    wake_at = std::min(wake_at, decoder_.deadline());
  }
  return millis_until(wake_at, now);
}

// ============================================================================
// Outbound
// ============================================================================

void ConnectionManager::pump_outbox() {
  std::lock_guard<std::mutex> lock(outbox_mutex_);
  while (!outbox_.empty()) {
    std::string line = encode_message(outbox_.front());
    if (line.size() > kTxBufferSize) {
      MICBRIDGE_LOG_ERROR("Dropping outbound message of " + std::to_string(line.size()) +
                          " bytes; larger than the transmit buffer");
      BridgeStats::bump(stats_->outbox_dropped);
      outbox_.pop_front();
      continue;
    }
    if (!tx_buffer_.push(line)) {
      break;  // Resume once the socket drains
    }
    MICBRIDGE_LOG_DEBUG("Sending queued message to " + label_ + ": " + line.substr(0, line.size() - 1));
    BridgeStats::bump(stats_->messages_out);
    outbox_.pop_front();
  }
}

expected<void, ErrorCode> ConnectionManager::flush_tx() {
  while (!tx_buffer_.empty()) {
    struct iovec iov[2];
    size_t iov_count = tx_buffer_.fill_iovec(iov, 2);

    struct msghdr msg;
    std::memset(&msg, 0, sizeof(msg));
    msg.msg_iov = iov;
    msg.msg_iovlen = iov_count;

    ssize_t n = ::sendmsg(socket_.handle(), &msg, MSG_NOSIGNAL);
    if (n > 0) {
      tx_buffer_.advance(static_cast<size_t>(n));
      BridgeStats::bump(stats_->bytes_out, static_cast<uint64_t>(n));
      continue;
    }
    if (n == 0) {
      break;
    }

    int err = errno;
    if (err == EINTR) {
      continue;
    }
    if (err == EAGAIN || err == EWOULDBLOCK) {
      break;
    }
    if (is_connection_loss(err)) {
      MICBRIDGE_LOG_WARN("Connection to " + label_ + " lost while writing");
    } else {
      MICBRIDGE_LOG_ERROR("Write error on " + label_ + ": " + std::strerror(err));
    }
    set_state(ConnectionState::kDisconnected);
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> ConnectionManager::send(const nlohmann::json& data) {
  if (!is_connected() || !socket_.is_open()) {
    MICBRIDGE_LOG_WARN("Tried to write data to dead socket for " + label_);
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
  }

  std::string line = encode_message(data);
  if (line.size() > kTxBufferSize) {
    MICBRIDGE_LOG_ERROR("Message of " + std::to_string(line.size()) + " bytes does not fit the transmit buffer");
    return expected<void, ErrorCode>::error(ErrorCode::kQueueFull);
  }

  const TimePoint deadline = Clock::now() + std::chrono::milliseconds(config_.send_timeout_ms);
  bool queued = false;
  while (true) {
    if (!queued && tx_buffer_.push(line)) {
      queued = true;
      BridgeStats::bump(stats_->messages_out);
    }

    auto flushed = flush_tx();
    if (!flushed) {
      return flushed;
    }
    if (queued && tx_buffer_.empty()) {
      return expected<void, ErrorCode>::success();
    }

    TimePoint now = Clock::now();
    if (now >= deadline) {
      MICBRIDGE_LOG_WARN("Timed out writing to " + label_);
      return expected<void, ErrorCode>::error(ErrorCode::kTimeout);
    }

    struct pollfd pfd;
    pfd.fd = socket_.handle();
    pfd.events = POLLOUT;
    pfd.revents = 0;
    if (::poll(&pfd, 1, millis_until(deadline, now)) < 0 && errno != EINTR) {
      MICBRIDGE_LOG_ERROR(std::string("Poll error while writing: ") + std::strerror(errno));
      return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
    }
  }
}

void ConnectionManager::enqueue_send(nlohmann::json data) {
  size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(outbox_mutex_);
    if (outbox_.size() >= config_.outbox_capacity) {
      dropped = outbox_.size();
      outbox_.clear();
    }
    outbox_.push_back(std::move(data));
  }

  if (dropped > 0) {
    MICBRIDGE_LOG_ERROR("Outbound queue for " + label_ + " full, dropping " + std::to_string(dropped) +
                        " queued messages");
    BridgeStats::bump(stats_->outbox_overflows);
    BridgeStats::bump(stats_->outbox_dropped, dropped);
  }
  wake();
}

size_t ConnectionManager::outbox_size() const {
  std::lock_guard<std::mutex> lock(outbox_mutex_);
  return outbox_.size();
}

// ============================================================================
// Helpers
// ============================================================================

void ConnectionManager::set_state(ConnectionState state) {
  ConnectionState old = state_.exchange(state, std::memory_order_acq_rel);
  if (old == state) {
    return;
  }
  MICBRIDGE_LOG_DEBUG("Connection to " + label_ + ": " + connection_state_name(old) + " -> " +
                      connection_state_name(state));

  bool was_connected = old == ConnectionState::kConnected;
  bool now_connected = state == ConnectionState::kConnected;
  if (was_connected != now_connected && observer_ != nullptr) {
    observer_->on_connection_state_changed(now_connected);
  }
}

void ConnectionManager::destroy_socket() {
  set_state(ConnectionState::kDisconnected);
  if (!socket_.is_open()) {
    return;
  }
  // The peer may already be gone; failures here only matter for debugging
  if (!socket_.shutdown(SHUT_WR)) {
    MICBRIDGE_LOG_DEBUG("shutdown() on " + label_ + " failed: " + socket_.last_error_str());
  }
  if (!socket_.close()) {
    MICBRIDGE_LOG_DEBUG("close() on " + label_ + " failed: " + socket_.last_error_str());
  }
  tx_buffer_.clear();
  decoder_.reset();
}

void ConnectionManager::wake() {
  uint64_t one = 1;
  ssize_t n = ::write(wake_fd_, &one, sizeof(one));
  // EAGAIN means the counter is saturated, so a wakeup is already pending
  if (n < 0 && errno != EAGAIN) {
    MICBRIDGE_LOG_ERROR(std::string("Failed to signal network loop: ") + std::strerror(errno));
  }
}

void ConnectionManager::drain_wakeups() {
  uint64_t value = 0;
  ssize_t n = ::read(wake_fd_, &value, sizeof(value));
  if (n < 0 && errno != EAGAIN) {
    MICBRIDGE_LOG_ERROR(std::string("Failed to drain wakeup eventfd: ") + std::strerror(errno));
  }
}

bool ConnectionManager::sleep_interruptible(std::chrono::milliseconds duration) {
  const TimePoint until = Clock::now() + duration;
  while (!is_closing() && !reconnect_requested_.load(std::memory_order_acquire)) {
    TimePoint now = Clock::now();
    if (now >= until) {
      return false;
    }
    struct pollfd pfd;
    pfd.fd = wake_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ret = ::poll(&pfd, 1, millis_until(until, now));
    if (ret > 0) {
      drain_wakeups();
    } else if (ret < 0 && errno != EINTR) {
      MICBRIDGE_LOG_ERROR(std::string("Poll error during backoff: ") + std::strerror(errno));
      return false;
    }
  }
  return true;
}

}  // namespace micbridge
