#include "micbridge/dispatcher.hpp"

#include <catch2/catch_test_macros.hpp>
#include <vector>

using namespace micbridge;
using json = nlohmann::json;

namespace {

class RecordingObserver : public ConnectionObserver {
 public:
  void on_connection_state_changed(bool connected) override { changes.push_back(connected); }

  std::vector<bool> changes;
};

}  // namespace

// ============================================================================
// Routing
// ============================================================================

TEST_CASE("Dispatcher - audio chunk goes to the bridge", "[dispatcher]") {
  BridgeStats stats;
  AudioBridge audio(8, &stats);
  Dispatcher dispatcher(audio, &stats);

  dispatcher.handle_message(Message(MessageType::kAudioChunk, json::object(), Payload{1, 2, 3}));
  REQUIRE(audio.size() == 1);
  REQUIRE(audio.dequeue().value() == Payload{1, 2, 3});
  REQUIRE(stats.audio_chunks_in.load() == 1);
}

TEST_CASE("Dispatcher - client info is remembered", "[dispatcher]") {
  AudioBridge audio(8);
  Dispatcher dispatcher(audio);
  REQUIRE(dispatcher.client_info().is_null());

  dispatcher.handle_message(Message(MessageType::kClientInfo, json::parse(R"({"uuid":"first"})")));
  dispatcher.handle_message(Message(MessageType::kClientInfo, json::parse(R"({"uuid":"second"})")));
  REQUIRE(dispatcher.client_info()["uuid"] == "second");
  REQUIRE(audio.size() == 0);
}

TEST_CASE("Dispatcher - ping, unknown and play-tts are not routed", "[dispatcher]") {
  BridgeStats stats;
  AudioBridge audio(8, &stats);
  Dispatcher dispatcher(audio, &stats);

  dispatcher.handle_message(Message(MessageType::kPing, json::object()));
  dispatcher.handle_message(Message(MessageType::kUnknown, json::object(), Payload{9}));
  dispatcher.handle_message(Message(MessageType::kPlayTts, json::parse(R"({"url":"http://x"})")));

  REQUIRE(audio.size() == 0);
  REQUIRE(dispatcher.client_info().is_null());
  REQUIRE(stats.pings_in.load() == 1);
  REQUIRE(stats.unknown_in.load() == 1);
}

// ============================================================================
// Observer fan-out
// ============================================================================

TEST_CASE("Dispatcher - state changes reach every observer in order", "[dispatcher]") {
  AudioBridge audio(8);
  Dispatcher dispatcher(audio);
  RecordingObserver first;
  RecordingObserver second;
  REQUIRE(dispatcher.add_observer(&first));
  REQUIRE(dispatcher.add_observer(&second));

  dispatcher.on_connection_state_changed(true);
  dispatcher.on_connection_state_changed(false);

  REQUIRE(first.changes == std::vector<bool>{true, false});
  REQUIRE(second.changes == std::vector<bool>{true, false});
  REQUIRE_FALSE(dispatcher.connected());
}

TEST_CASE("Dispatcher - observer table is bounded", "[dispatcher]") {
  AudioBridge audio(8);
  Dispatcher dispatcher(audio);
  RecordingObserver observers[Dispatcher::kMaxObservers + 1];

  for (uint32_t i = 0; i < Dispatcher::kMaxObservers; ++i) {
    REQUIRE(dispatcher.add_observer(&observers[i]));
  }
  REQUIRE_FALSE(dispatcher.add_observer(&observers[Dispatcher::kMaxObservers]));
  REQUIRE_FALSE(dispatcher.add_observer(nullptr));
}
