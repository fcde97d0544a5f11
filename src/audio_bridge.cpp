#include "micbridge/audio_bridge.hpp"

#include "micbridge/log.hpp"

namespace micbridge {

AudioBridge::AudioBridge(size_t capacity, BridgeStats* stats) : capacity_(capacity), stats_(stats) {}

void AudioBridge::enqueue(Payload chunk) {
  size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    if (queue_.size() >= capacity_) {
      dropped = queue_.size();
      queue_.clear();
    }
    queue_.push_back(std::move(chunk));
  }
  ready_.notify_one();

  if (dropped > 0) {
    MICBRIDGE_LOG_ERROR("Chunk queue full, dumping " + std::to_string(dropped) + " queued chunks");
    if (stats_ != nullptr) {
      BridgeStats::bump(stats_->audio_overflows);
      BridgeStats::bump(stats_->audio_chunks_dropped, dropped);
    }
  }
}

optional<Payload> AudioBridge::dequeue() {
  std::unique_lock<std::mutex> lock(mutex_);
  ready_.wait(lock, [this] { return closed_ || !queue_.empty(); });
  if (closed_) {
    return {};
  }
  Payload chunk = std::move(queue_.front());
  queue_.pop_front();
  return chunk;
}

optional<Payload> AudioBridge::dequeue_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!ready_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); }) || closed_) {
    return {};
  }
  Payload chunk = std::move(queue_.front());
  queue_.pop_front();
  return chunk;
}

void AudioBridge::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    queue_.clear();
  }
  ready_.notify_all();
}

void AudioBridge::reopen() {
  std::lock_guard<std::mutex> lock(mutex_);
  queue_.clear();
  closed_ = false;
}

bool AudioBridge::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t AudioBridge::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

}  // namespace micbridge
