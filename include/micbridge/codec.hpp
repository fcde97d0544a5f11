#ifndef MICBRIDGE_CODEC_HPP_
#define MICBRIDGE_CODEC_HPP_

#include "config.hpp"
#include "message.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <chrono>
#include <nlohmann/json.hpp>
#include <sockpp/stream_socket.h>
#include <string>
#include <string_view>

namespace micbridge {

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;

// poll() timeout from now until when, rounded up; 0 once it has passed
inline int millis_until(TimePoint when, TimePoint now) {
  if (when <= now) {
    return 0;
  }
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(when - now).count() + 1;
  return ms > 0x7fffffff ? 0x7fffffff : static_cast<int>(ms);
}

// ============================================================================
// DecodeError (BadMessage and friends)
// ============================================================================

struct DecodeError {
  ErrorCode code = ErrorCode::kOk;
  std::string description;
  std::string raw;  // Offending bytes, truncated for logging

  std::string to_string() const;
};

// Decoder/reader outcome: a message, "no message" (need more bytes, or end of
// stream for read_message), or an error.
using DecodeResult = expected<optional<Message>, DecodeError>;

// ============================================================================
// Encoding
// ============================================================================

// One JSON line terminated by '\n'. Invalid UTF-8 in strings is replaced.
std::string encode_message(const nlohmann::json& data);

// ============================================================================
// MessageDecoder (incremental framing over an arbitrary byte stream)
// ============================================================================

/**
 * @brief Reassembles wire messages from bytes fed in arbitrary pieces.
 *
 * Wire format:
 *   <JSON header>\n
 *   [data_length bytes of JSON merged into header.data]
 *   [payload_length raw bytes]
 *
 * Each extension block has its own deadline starting when the previous part
 * completed. When a deadline passes, next() reports kBadMessage and framing
 * restarts at the bytes still buffered.
 */
class MessageDecoder {
 public:
  explicit MessageDecoder(const CodecLimits& limits = CodecLimits{});

  // Append received bytes
  void feed(const uint8_t* data, size_t len);
  void feed(std::string_view bytes) { feed(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()); }

  // Next decoded message.
  // Returns a message, an empty optional when more bytes are needed, or
  // error(kBadMessage) for a malformed unit (already consumed).
  DecodeResult next(TimePoint now = SteadyClock::now());

  // Deadline of the pending extension block, if any
  bool has_deadline() const { return stage_ == Stage::kExtraData || stage_ == Stage::kPayload || stage_ == Stage::kSkip; }
  TimePoint deadline() const { return deadline_; }

  // Bytes received but not yet consumed
  size_t buffered() const { return buffer_.size() - read_pos_; }

  // Drop all state (new connection)
  void reset();

 private:
  enum class Stage : uint8_t { kHeader, kExtraData, kPayload, kSkip };

  DecodeResult parse_header(std::string_view line, TimePoint now);
  DecodeResult finish_message(Payload payload);
  DecodeResult bad(std::string description, std::string_view raw);
  void skip_extensions(size_t bytes, TimePoint now);
  void clear_pending();
  void compact();

  CodecLimits limits_;
  std::string buffer_;
  size_t read_pos_ = 0;
  bool discarding_line_ = false;

  Stage stage_ = Stage::kHeader;
  TimePoint deadline_{};
  size_t skip_remaining_ = 0;

  // Header in progress
  MessageType pending_type_ = MessageType::kUnknown;
  nlohmann::json pending_data_;
  size_t pending_data_length_ = 0;
  size_t pending_payload_length_ = 0;
};

// ============================================================================
// Blocking read (validation handshake and tests)
// ============================================================================

/**
 * @brief Read one message from sock within timeout.
 *
 * Returns the message, an empty optional at end of stream, or an error:
 * kBadMessage (malformed), kTimeout (nothing complete in time),
 * kSocketError (read failure).
 */
DecodeResult read_message(sockpp::stream_socket& sock, MessageDecoder& decoder, std::chrono::milliseconds timeout);

}  // namespace micbridge

#endif  // MICBRIDGE_CODEC_HPP_
