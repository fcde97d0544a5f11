#include "micbridge/codec.hpp"

#include "micbridge/log.hpp"

#include <cerrno>
#include <cstring>

#include <algorithm>
#include <limits>
#include <poll.h>

namespace micbridge {

namespace {

constexpr size_t kRawPreviewBytes = 256;
constexpr size_t kCompactThreshold = 4096;
constexpr size_t kReadChunk = 4096;

DecodeResult need_more() { return DecodeResult::success(optional<Message>{}); }

// Length fields: absent, null, zero or negative mean "no block".
// Anything that is not an integer is malformed.
bool read_length(const nlohmann::json& header, const char* field, size_t* out) {
  *out = 0;
  auto it = header.find(field);
  if (it == header.end() || it->is_null()) {
    return true;
  }
  if (it->is_number_unsigned()) {
    *out = static_cast<size_t>(it->get<uint64_t>());
    return true;
  }
  if (it->is_number_integer()) {
    int64_t value = it->get<int64_t>();
    *out = value > 0 ? static_cast<size_t>(value) : 0;
    return true;
  }
  return false;
}

size_t saturating_add(size_t a, size_t b) {
  return a > std::numeric_limits<size_t>::max() - b ? std::numeric_limits<size_t>::max() : a + b;
}

}  // namespace

std::string DecodeError::to_string() const {
  std::string out = std::string(error_code_name(code)) + ": " + description;
  if (!raw.empty()) {
    out += ": '" + raw + "'";
  }
  return out;
}

std::string encode_message(const nlohmann::json& data) {
  std::string line = data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  line.push_back('\n');
  return line;
}

// ============================================================================
// MessageDecoder
// ============================================================================

MessageDecoder::MessageDecoder(const CodecLimits& limits) : limits_(limits) {}

void MessageDecoder::feed(const uint8_t* data, size_t len) {
  buffer_.append(reinterpret_cast<const char*>(data), len);
}

void MessageDecoder::reset() {
  buffer_.clear();
  read_pos_ = 0;
  discarding_line_ = false;
  skip_remaining_ = 0;
  clear_pending();
}

void MessageDecoder::clear_pending() {
  stage_ = Stage::kHeader;
  pending_type_ = MessageType::kUnknown;
  pending_data_ = nlohmann::json();
  pending_data_length_ = 0;
  pending_payload_length_ = 0;
}

void MessageDecoder::compact() {
  if (read_pos_ == 0) {
    return;
  }
  if (read_pos_ >= buffer_.size()) {
    buffer_.clear();
    read_pos_ = 0;
  } else if (read_pos_ >= kCompactThreshold) {
    buffer_.erase(0, read_pos_);
    read_pos_ = 0;
  }
}

DecodeResult MessageDecoder::bad(std::string description, std::string_view raw) {
  DecodeError err;
  err.code = ErrorCode::kBadMessage;
  err.description = std::move(description);
  err.raw = std::string(raw.substr(0, kRawPreviewBytes));
  return DecodeResult::error(std::move(err));
}

void MessageDecoder::skip_extensions(size_t bytes, TimePoint now) {
  clear_pending();
  if (bytes > 0) {
    stage_ = Stage::kSkip;
    skip_remaining_ = bytes;
    deadline_ = now + std::chrono::milliseconds(limits_.extension_timeout_ms);
  }
}

DecodeResult MessageDecoder::finish_message(Payload payload) {
  optional<Message> msg(Message(pending_type_, std::move(pending_data_), std::move(payload)));
  clear_pending();
  compact();
  return DecodeResult::success(std::move(msg));
}

DecodeResult MessageDecoder::parse_header(std::string_view line, TimePoint now) {
  nlohmann::json header = nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
  if (header.is_discarded()) {
    return bad("Failed to decode JSON", line);
  }
  if (!header.is_object()) {
    return bad("Header is not a JSON object", line);
  }

  auto type_it = header.find("type");
  if (type_it == header.end()) {
    return bad("Field 'type' not in message", line);
  }

  size_t data_length = 0;
  size_t payload_length = 0;
  if (!read_length(header, "data_length", &data_length) || !read_length(header, "payload_length", &payload_length)) {
    return bad("Length fields must be integers", line);
  }

  if (data_length > limits_.max_extension_bytes || payload_length > limits_.max_extension_bytes) {
    skip_extensions(saturating_add(data_length, payload_length), now);
    return bad("Extension block exceeds " + std::to_string(limits_.max_extension_bytes) + " bytes", line);
  }

  nlohmann::json data = nlohmann::json::object();
  auto data_it = header.find("data");
  if (data_it != header.end() && !data_it->is_null()) {
    if (!data_it->is_object()) {
      skip_extensions(saturating_add(data_length, payload_length), now);
      return bad("Field 'data' is not an object", line);
    }
    data = std::move(*data_it);
  }

  pending_type_ = message_type_from_json(*type_it);
  pending_data_ = std::move(data);
  pending_data_length_ = data_length;
  pending_payload_length_ = payload_length;

  if (data_length > 0) {
    stage_ = Stage::kExtraData;
  } else if (payload_length > 0) {
    stage_ = Stage::kPayload;
  } else {
    return finish_message(Payload{});
  }
  deadline_ = now + std::chrono::milliseconds(limits_.extension_timeout_ms);
  return need_more();
}

DecodeResult MessageDecoder::next(TimePoint now) {
  while (true) {
    switch (stage_) {
      case Stage::kHeader: {
        std::string_view pending(buffer_.data() + read_pos_, buffer_.size() - read_pos_);
        size_t newline = pending.find('\n');

        if (discarding_line_) {
          if (newline == std::string_view::npos) {
            read_pos_ = buffer_.size();
            compact();
            return need_more();
          }
          read_pos_ += newline + 1;
          discarding_line_ = false;
          continue;
        }

        if (newline == std::string_view::npos) {
          if (pending.size() > limits_.max_line_bytes) {
            std::string preview(pending.substr(0, kRawPreviewBytes));
            read_pos_ = buffer_.size();
            discarding_line_ = true;
            compact();
            return bad("Header line exceeds " + std::to_string(limits_.max_line_bytes) + " bytes", preview);
          }
          compact();
          return need_more();
        }

        std::string_view line = pending.substr(0, newline);
        read_pos_ += newline + 1;

        // Blank lines are keep-alive padding
        if (line.empty()) {
          continue;
        }
        if (line.size() > limits_.max_line_bytes) {
          return bad("Header line exceeds " + std::to_string(limits_.max_line_bytes) + " bytes", line);
        }

        auto result = parse_header(line, now);
        if (!result.has_value() || result.value().has_value()) {
          return result;
        }
        continue;
      }

      case Stage::kExtraData: {
        if (buffered() < pending_data_length_) {
          if (now >= deadline_) {
            clear_pending();
            return bad("Timed out waiting for extra data", {});
          }
          return need_more();
        }

        std::string_view block(buffer_.data() + read_pos_, pending_data_length_);
        read_pos_ += pending_data_length_;

        nlohmann::json extra = nlohmann::json::parse(block.begin(), block.end(), nullptr, false);
        if (extra.is_discarded() || !extra.is_object()) {
          skip_extensions(pending_payload_length_, now);
          return bad(extra.is_discarded() ? "Failed to decode JSON for extra data" : "Extra data is not a JSON object",
                     block);
        }
        pending_data_.update(extra);

        if (pending_payload_length_ == 0) {
          return finish_message(Payload{});
        }
        stage_ = Stage::kPayload;
        deadline_ = now + std::chrono::milliseconds(limits_.extension_timeout_ms);
        continue;
      }

      case Stage::kPayload: {
        if (buffered() < pending_payload_length_) {
          if (now >= deadline_) {
            clear_pending();
            return bad("Timed out waiting for payload", {});
          }
          return need_more();
        }

        const auto* begin = reinterpret_cast<const uint8_t*>(buffer_.data() + read_pos_);
        Payload payload(begin, begin + pending_payload_length_);
        read_pos_ += pending_payload_length_;
        return finish_message(std::move(payload));
      }

      case Stage::kSkip: {
        size_t n = std::min(skip_remaining_, buffered());
        read_pos_ += n;
        skip_remaining_ -= n;
        compact();
        if (skip_remaining_ == 0 || now >= deadline_) {
          skip_remaining_ = 0;
          stage_ = Stage::kHeader;
          continue;
        }
        return need_more();
      }
    }
  }
}

// ============================================================================
// read_message
// ============================================================================

DecodeResult read_message(sockpp::stream_socket& sock, MessageDecoder& decoder, std::chrono::milliseconds timeout) {
  const TimePoint deadline = SteadyClock::now() + timeout;
  uint8_t buf[kReadChunk];

  while (true) {
    TimePoint now = SteadyClock::now();
    auto result = decoder.next(now);
    if (!result.has_value() || result.value().has_value()) {
      return result;
    }

    if (now >= deadline) {
      DecodeError err;
      err.code = ErrorCode::kTimeout;
      err.description = "Timed out waiting for message";
      return DecodeResult::error(std::move(err));
    }

    TimePoint wake = deadline;
    if (decoder.has_deadline()) {
      wake = std::min(wake, decoder.deadline());
    }

    pollfd pfd{sock.handle(), POLLIN, 0};
    int ret = ::poll(&pfd, 1, millis_until(wake, now));
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      DecodeError err;
      err.code = ErrorCode::kSocketError;
      err.description = std::string("poll failed: ") + std::strerror(errno);
      return DecodeResult::error(std::move(err));
    }
    if (ret == 0) {
      continue;
    }

    ssize_t n = sock.read(buf, sizeof(buf));
    if (n == 0) {
      if (decoder.buffered() > 0) {
        MICBRIDGE_LOG_DEBUG("Stream closed with " + std::to_string(decoder.buffered()) + " unframed bytes");
      }
      return DecodeResult::success(optional<Message>{});
    }
    if (n < 0) {
      int err_no = sock.last_error();
      if (err_no == EAGAIN || err_no == EWOULDBLOCK || err_no == EINTR) {
        continue;
      }
      DecodeError err;
      err.code = ErrorCode::kSocketError;
      err.description = "read failed: " + sock.last_error_str();
      return DecodeResult::error(std::move(err));
    }
    decoder.feed(buf, static_cast<size_t>(n));
  }
}

}  // namespace micbridge
