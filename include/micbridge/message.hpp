#ifndef MICBRIDGE_MESSAGE_HPP_
#define MICBRIDGE_MESSAGE_HPP_

#include <cstdint>

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace micbridge {

// ============================================================================
// Message types (wire "type" strings)
// ============================================================================

enum class MessageType : uint8_t {
  kUnknown,
  kAudioChunk,  // "audio-chunk"
  kClientInfo,  // "client-info"
  kPing,        // "ping"
  kPlayTts      // "play-tts" (host -> device)
};

// Unrecognized or non-string types map to kUnknown.
MessageType message_type_from_json(const nlohmann::json& type);
MessageType message_type_from_string(std::string_view type);

// Wire string for a known type; "" for kUnknown.
const char* message_type_wire_name(MessageType type);

// Upper-case enum name for log lines (e.g. "AUDIO_CHUNK").
const char* message_type_name(MessageType type);

using Payload = std::vector<uint8_t>;

// ============================================================================
// Message (one decoded protocol unit; immutable value object)
// ============================================================================

class Message {
 public:
  Message() : data_(nlohmann::json::object()) {}

  Message(MessageType type, nlohmann::json data, Payload payload = {})
      : type_(type), data_(std::move(data)), payload_(std::move(payload)) {}

  MessageType type() const { return type_; }
  const nlohmann::json& data() const { return data_; }
  const Payload& payload() const { return payload_; }

  // "Message (PING): {...} (payload 0 bytes)"
  std::string describe() const;

 private:
  MessageType type_ = MessageType::kUnknown;
  nlohmann::json data_;
  Payload payload_;
};

// Outbound request asking the device to play synthesized speech from url.
nlohmann::json make_play_tts(const std::string& url);

}  // namespace micbridge

#endif  // MICBRIDGE_MESSAGE_HPP_
