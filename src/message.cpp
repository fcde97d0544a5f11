#include "micbridge/message.hpp"

namespace micbridge {

namespace {

struct TypeEntry {
  MessageType type;
  std::string_view wire;
  const char* name;
};

constexpr TypeEntry kTypeTable[] = {
    {MessageType::kAudioChunk, "audio-chunk", "AUDIO_CHUNK"},
    {MessageType::kClientInfo, "client-info", "CLIENT_INFO"},
    {MessageType::kPing, "ping", "PING"},
    {MessageType::kPlayTts, "play-tts", "PLAY_TTS"},
};

}  // namespace

MessageType message_type_from_string(std::string_view type) {
  for (const auto& entry : kTypeTable) {
    if (entry.wire == type) {
      return entry.type;
    }
  }
  return MessageType::kUnknown;
}

MessageType message_type_from_json(const nlohmann::json& type) {
  if (!type.is_string()) {
    return MessageType::kUnknown;
  }
  return message_type_from_string(type.get_ref<const std::string&>());
}

const char* message_type_wire_name(MessageType type) {
  for (const auto& entry : kTypeTable) {
    if (entry.type == type) {
      return entry.wire.data();
    }
  }
  return "";
}

const char* message_type_name(MessageType type) {
  for (const auto& entry : kTypeTable) {
    if (entry.type == type) {
      return entry.name;
    }
  }
  return "UNKNOWN";
}

std::string Message::describe() const {
  return std::string("Message (") + message_type_name(type_) + "): " +
         data_.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + " (payload " +
         std::to_string(payload_.size()) + " bytes)";
}

nlohmann::json make_play_tts(const std::string& url) {
  return {{"type", message_type_wire_name(MessageType::kPlayTts)}, {"data", {{"url", url}}}};
}

}  // namespace micbridge
