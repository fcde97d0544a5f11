/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file micbridge.hpp
 * @brief micbridge - host-side bridge for networked microphone devices
 *
 * Keeps one TCP connection per device alive (reconnect, watchdog, bad-message
 * threshold), decodes the line-framed JSON + binary protocol, and feeds raw
 * 16 kHz mono PCM to a speech pipeline through a bounded queue.
 *
 * Usage:
 *   #include "micbridge.hpp"
 *
 *   class Sink : public micbridge::PipelineConsumer {
 *     void run_pipeline(micbridge::AudioChunkSource& src) override {
 *       while (auto chunk = src.next_chunk()) { ... }
 *     }
 *   };
 *
 *   int main() {
 *     micbridge::BridgeConfig cfg;
 *     cfg.host = "192.168.1.40";
 *     cfg.port = 11700;
 *     Sink sink;
 *     micbridge::MicBridge bridge(cfg, sink);
 *     bridge.start();
 *     ...
 *   }
 */

#ifndef MICBRIDGE_HPP_
#define MICBRIDGE_HPP_

#include "micbridge/vocabulary.hpp"
#include "micbridge/log.hpp"
#include "micbridge/config.hpp"
#include "micbridge/stats.hpp"
#include "micbridge/ring_buffer.hpp"
#include "micbridge/message.hpp"
#include "micbridge/codec.hpp"
#include "micbridge/connection_state.hpp"
#include "micbridge/audio_bridge.hpp"
#include "micbridge/dispatcher.hpp"
#include "micbridge/connection_manager.hpp"
#include "micbridge/pipeline.hpp"
#include "micbridge/bridge.hpp"

#endif  // MICBRIDGE_HPP_
