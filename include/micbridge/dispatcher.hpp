#ifndef MICBRIDGE_DISPATCHER_HPP_
#define MICBRIDGE_DISPATCHER_HPP_

#include "audio_bridge.hpp"
#include "connection_state.hpp"
#include "stats.hpp"
#include "vocabulary.hpp"

#include <mutex>
#include <nlohmann/json.hpp>

namespace micbridge {

// ============================================================================
// Dispatcher - routes decoded messages by kind
// ============================================================================

/**
 * @brief Reactor-side sink for one device.
 *
 * Audio chunks go to the AudioBridge, client-info is remembered, pings only
 * refresh the watchdog (done by the manager). Connection transitions are fanned
 * out to registered observers in registration order.
 */
class Dispatcher : public MessageHandler, public ConnectionObserver {
 public:
  static constexpr uint32_t kMaxObservers = 8;

  explicit Dispatcher(AudioBridge& audio, BridgeStats* stats = nullptr);

  void handle_message(const Message& msg) override;
  void on_connection_state_changed(bool connected) override;

  // Register before the connection starts. Returns false once kMaxObservers
  // are registered.
  bool add_observer(ConnectionObserver* observer);

  // Latest client-info data; null until the device introduced itself
  nlohmann::json client_info() const;

  bool connected() const;

 private:
  AudioBridge& audio_;
  BridgeStats* stats_;

  mutable std::mutex mutex_;
  nlohmann::json client_info_;
  bool connected_ = false;
  FixedVector<ConnectionObserver*, kMaxObservers> observers_;
};

}  // namespace micbridge

#endif  // MICBRIDGE_DISPATCHER_HPP_
