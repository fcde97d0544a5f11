#ifndef MICBRIDGE_AUDIO_BRIDGE_HPP_
#define MICBRIDGE_AUDIO_BRIDGE_HPP_

#include "message.hpp"
#include "stats.hpp"
#include "vocabulary.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace micbridge {

// ============================================================================
// AudioChunkSource - pull side seen by the speech pipeline
// ============================================================================

class AudioChunkSource {
 public:
  virtual ~AudioChunkSource() = default;

  // Block until a chunk is available. An empty optional means the source was
  // torn down by its owner; it never ends on its own.
  virtual optional<Payload> next_chunk() = 0;
};

// ============================================================================
// AudioBridge - bounded chunk queue between the reader and the pipeline
// ============================================================================

/**
 * @brief Bounded FIFO of raw audio chunks.
 *
 * enqueue() never blocks. When the queue is at capacity the whole backlog is
 * dropped and the new chunk becomes the only queued entry: stale audio is of
 * no use to a live recognizer.
 */
class AudioBridge : public AudioChunkSource {
 public:
  explicit AudioBridge(size_t capacity, BridgeStats* stats = nullptr);

  AudioBridge(const AudioBridge&) = delete;
  AudioBridge& operator=(const AudioBridge&) = delete;

  // Producer side (reactor thread)
  void enqueue(Payload chunk);

  // Consumer side: blocks until a chunk arrives or close() is called
  optional<Payload> dequeue();

  // As dequeue(), giving up after timeout
  optional<Payload> dequeue_for(std::chrono::milliseconds timeout);

  optional<Payload> next_chunk() override { return dequeue(); }

  // Wake every waiting consumer; subsequent dequeues return empty
  void close();

  // Reopen for a new pipeline run, discarding anything queued
  void reopen();

  bool is_closed() const;
  size_t size() const;
  size_t capacity() const { return capacity_; }

 private:
  const size_t capacity_;
  BridgeStats* stats_;

  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<Payload> queue_;
  bool closed_ = false;
};

}  // namespace micbridge

#endif  // MICBRIDGE_AUDIO_BRIDGE_HPP_
