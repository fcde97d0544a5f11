#ifndef MICBRIDGE_PIPELINE_HPP_
#define MICBRIDGE_PIPELINE_HPP_

#include "audio_bridge.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace micbridge {

// Stream format produced by the device
struct AudioFormat {
  static constexpr uint32_t kSampleRate = 16000;
  static constexpr uint32_t kChannels = 1;
  static constexpr uint32_t kBitsPerSample = 16;
  static constexpr uint32_t kBytesPerSecond = kSampleRate * kChannels * kBitsPerSample / 8;
};

// ============================================================================
// PipelineConsumer - one speech pipeline run over the audio stream
// ============================================================================

class PipelineConsumer {
 public:
  virtual ~PipelineConsumer() = default;

  // Pull chunks until the run completes or source.next_chunk() returns empty.
  virtual void run_pipeline(AudioChunkSource& source) = 0;
};

// ============================================================================
// PipelineRunner - restarts the consumer each time a run finishes
// ============================================================================

class PipelineRunner {
 public:
  static constexpr std::chrono::milliseconds kRestartDelay{100};

  PipelineRunner(PipelineConsumer& consumer, AudioBridge& audio);
  ~PipelineRunner();

  PipelineRunner(const PipelineRunner&) = delete;
  PipelineRunner& operator=(const PipelineRunner&) = delete;

  // Spawn the runner thread; false if already running
  bool start();

  // Close the audio bridge (waking the consumer) and join. Idempotent.
  void stop();

  bool is_running() const { return running_.load(std::memory_order_acquire); }
  uint64_t runs() const { return runs_.load(std::memory_order_relaxed); }

 private:
  PipelineConsumer& consumer_;
  AudioBridge& audio_;

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> runs_{0};

  std::mutex mutex_;
  std::condition_variable stop_cv_;
  bool stop_requested_ = false;

  void loop();
};

}  // namespace micbridge

#endif  // MICBRIDGE_PIPELINE_HPP_
