#include "micbridge/dispatcher.hpp"

#include "micbridge/log.hpp"

namespace micbridge {

Dispatcher::Dispatcher(AudioBridge& audio, BridgeStats* stats) : audio_(audio), stats_(stats) {}

void Dispatcher::handle_message(const Message& msg) {
  switch (msg.type()) {
    case MessageType::kAudioChunk:
      if (stats_ != nullptr) {
        BridgeStats::bump(stats_->audio_chunks_in);
      }
      audio_.enqueue(msg.payload());
      break;

    case MessageType::kClientInfo: {
      if (stats_ != nullptr) {
        BridgeStats::bump(stats_->client_info_in);
      }
      MICBRIDGE_LOG_DEBUG("Got client info: " + msg.data().dump());
      std::lock_guard<std::mutex> lock(mutex_);
      client_info_ = msg.data();
      break;
    }

    case MessageType::kPing:
      if (stats_ != nullptr) {
        BridgeStats::bump(stats_->pings_in);
      }
      break;

    case MessageType::kUnknown:
      if (stats_ != nullptr) {
        BridgeStats::bump(stats_->unknown_in);
      }
      MICBRIDGE_LOG_WARN("Got an unknown message: " + msg.describe() + ". Ignoring it.");
      break;

    case MessageType::kPlayTts:
      MICBRIDGE_LOG_ERROR("Message type " + std::string(message_type_name(msg.type())) +
                          " is unhandled (but known) on this side: " + msg.describe());
      break;
  }
}

void Dispatcher::on_connection_state_changed(bool connected) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = connected;
  }
  MICBRIDGE_LOG_DEBUG(std::string("Connection state changed: ") + (connected ? "connected" : "disconnected"));
  for (ConnectionObserver* observer : observers_) {
    observer->on_connection_state_changed(connected);
  }
}

bool Dispatcher::add_observer(ConnectionObserver* observer) {
  if (observer == nullptr) {
    return false;
  }
  if (!observers_.push_back(observer)) {
    MICBRIDGE_LOG_ERROR("Too many connection observers (max " + std::to_string(kMaxObservers) + ")");
    return false;
  }
  return true;
}

nlohmann::json Dispatcher::client_info() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return client_info_;
}

bool Dispatcher::connected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connected_;
}

}  // namespace micbridge
