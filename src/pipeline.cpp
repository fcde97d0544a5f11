#include "micbridge/pipeline.hpp"

#include "micbridge/log.hpp"

#include <exception>

namespace micbridge {

PipelineRunner::PipelineRunner(PipelineConsumer& consumer, AudioBridge& audio) : consumer_(consumer), audio_(audio) {}

PipelineRunner::~PipelineRunner() { stop(); }

bool PipelineRunner::start() {
  if (thread_.joinable()) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = false;
  }
  audio_.reopen();
  running_.store(true, std::memory_order_release);
  thread_ = std::thread([this] { loop(); });
  return true;
}

void PipelineRunner::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();
  audio_.close();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void PipelineRunner::loop() {
  MICBRIDGE_LOG_DEBUG("Starting pipeline runner");
  while (true) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stop_requested_) {
        break;
      }
    }

    runs_.fetch_add(1, std::memory_order_relaxed);
#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
    try {
      consumer_.run_pipeline(audio_);
    } catch (const std::exception& e) {
      MICBRIDGE_LOG_ERROR(std::string("Pipeline run failed: ") + e.what());
    }
#else
    consumer_.run_pipeline(audio_);
#endif

    std::unique_lock<std::mutex> lock(mutex_);
    if (stop_cv_.wait_for(lock, kRestartDelay, [this] { return stop_requested_; })) {
      break;
    }
    MICBRIDGE_LOG_DEBUG("Pipeline finished, starting over");
  }
  running_.store(false, std::memory_order_release);
  MICBRIDGE_LOG_DEBUG("Pipeline runner stopped");
}

}  // namespace micbridge
