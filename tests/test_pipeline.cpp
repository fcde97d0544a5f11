#include "micbridge/pipeline.hpp"

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <functional>
#include <thread>

using namespace micbridge;
using std::chrono::milliseconds;

namespace {

// Each run consumes up to chunks_per_run chunks
class CountingConsumer : public PipelineConsumer {
 public:
  explicit CountingConsumer(int chunks_per_run) : chunks_per_run_(chunks_per_run) {}

  void run_pipeline(AudioChunkSource& source) override {
    for (int i = 0; i < chunks_per_run_; ++i) {
      auto chunk = source.next_chunk();
      if (!chunk) {
        ended.store(true);
        return;
      }
      chunks.fetch_add(1);
    }
  }

  std::atomic<int> chunks{0};
  std::atomic<bool> ended{false};

 private:
  int chunks_per_run_;
};

bool wait_until(const std::function<bool()>& pred, milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(milliseconds(5));
  }
  return pred();
}

}  // namespace

TEST_CASE("PipelineRunner - restarts after each run", "[pipeline]") {
  AudioBridge audio(64);
  CountingConsumer consumer(2);
  PipelineRunner runner(consumer, audio);
  REQUIRE(runner.start());
  REQUIRE_FALSE(runner.start());

  for (uint8_t i = 0; i < 6; ++i) {
    audio.enqueue(Payload{i});
  }
  REQUIRE(wait_until([&]() { return consumer.chunks.load() == 6; }, milliseconds(2000)));
  REQUIRE(runner.runs() >= 3);

  runner.stop();
  REQUIRE_FALSE(runner.is_running());
}

TEST_CASE("PipelineRunner - stop ends a blocked run", "[pipeline]") {
  AudioBridge audio(64);
  CountingConsumer consumer(1000);
  PipelineRunner runner(consumer, audio);
  runner.start();
  std::this_thread::sleep_for(milliseconds(20));

  runner.stop();
  REQUIRE(consumer.ended.load());
  REQUIRE(runner.runs() == 1);

  // Idempotent
  runner.stop();
}

TEST_CASE("PipelineRunner - can be started again after stop", "[pipeline]") {
  AudioBridge audio(64);
  CountingConsumer consumer(1);
  PipelineRunner runner(consumer, audio);
  runner.start();
  runner.stop();

  REQUIRE(runner.start());
  audio.enqueue(Payload{1});
  REQUIRE(wait_until([&]() { return consumer.chunks.load() == 1; }, milliseconds(2000)));
  runner.stop();
}
