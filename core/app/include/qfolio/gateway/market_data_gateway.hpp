#pragma once

#include "qfolio/common/result.hpp"
#include "qfolio/market/bar_store.hpp"
#include "qfolio/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <string>

namespace qfolio {

// -----------------------------------------------------------------------------
// applyMarketMessage(store, replay_clock, payload)
// -----------------------------------------------------------------------------
//
// @brief  Decodes one JSON message from the feeder and applies it.
//
// @details
// Accepted payloads:
//
//   {"type": "bar", "symbol": "BTC", "timestamp_ms": 1700000000000,
//    "open": 1, "high": 1, "low": 1, "close": 1, "volume": 1}
//   {"type": "sentiment", "symbol": "BTC", "score": 0.4}
//   {"symbol": "BTC", "timestamp_ms": 1700000000000, "price": 1,
//    "volume": 1}                                  — tick, stored as a bar
//
// Only symbol, timestamp_ms and close (or price) are required for bars;
// open/high/low default to close and volume to 0.
//
// When replay_clock is not null it is advanced to the bar's timestamp
// before the bar is stored, so time-dependent components observe the
// replayed time.
//
// Errors: InvalidInput for malformed JSON, unknown types or missing fields.
// -----------------------------------------------------------------------------
Status applyMarketMessage(BarStore& store,
                          SimulationTimeProvider* replay_clock,
                          const std::string& payload);

// -----------------------------------------------------------------------------
// MarketDataGateway — ZeroMQ SUB bridge from the external feeder
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON bars and sentiment updates on a SUB socket and
//         writes them into a BarStore.
//
// @details
// run() blocks and is meant for a dedicated thread; the socket has a receive
// timeout so that stop() is observed within kRecvTimeoutMs. Malformed
// messages are logged and skipped.
//
// Thread model:
//   Constructed on the main thread; run() on the gateway thread; stop() from
//   any thread. The BarStore synchronizes itself.
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  MarketDataGateway(BarStore& store, const std::string& endpoint,
                    SimulationTimeProvider* replay_clock = nullptr);

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;

  void run();
  void stop();

  std::size_t messagesApplied() const { return applied_.load(); }
  std::size_t messagesRejected() const { return rejected_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  BarStore& store_;
  SimulationTimeProvider* replay_clock_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  // Set at construction so a stop() issued before run() starts is kept.
  std::atomic<bool> running_{true};
  std::atomic<std::size_t> applied_{0};
  std::atomic<std::size_t> rejected_{0};
};

}  // namespace qfolio
