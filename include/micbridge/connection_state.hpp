#ifndef MICBRIDGE_CONNECTION_STATE_HPP_
#define MICBRIDGE_CONNECTION_STATE_HPP_

#include "message.hpp"

#include <cstdint>

namespace micbridge {

// ============================================================================
// States
// ============================================================================

enum class ConnectionState : uint8_t {
  kDisconnected,  // No socket, or the session was declared dead
  kConnecting,    // Socket being opened
  kConnected      // Session running
};

inline const char* connection_state_name(ConnectionState state) {
  switch (state) {
    case ConnectionState::kDisconnected:
      return "disconnected";
    case ConnectionState::kConnecting:
      return "connecting";
    case ConnectionState::kConnected:
      return "connected";
  }
  return "unknown";
}

// ============================================================================
// Seams to collaborators
// ============================================================================

// Receives every decoded message, in arrival order, on the reactor thread.
class MessageHandler {
 public:
  virtual ~MessageHandler() = default;

  virtual void handle_message(const Message& msg) = 0;
};

// Receives connected/disconnected transitions synchronously on the thread
// that caused them. Implementations must not block.
class ConnectionObserver {
 public:
  virtual ~ConnectionObserver() = default;

  virtual void on_connection_state_changed(bool connected) = 0;
};

}  // namespace micbridge

#endif  // MICBRIDGE_CONNECTION_STATE_HPP_
