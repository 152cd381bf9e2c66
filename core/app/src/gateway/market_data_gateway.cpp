#include "qfolio/gateway/market_data_gateway.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>

namespace qfolio {

// -----------------------------------------------------------------------------
// applyMarketMessage(): JSON → BarStore
// -----------------------------------------------------------------------------
Status applyMarketMessage(BarStore& store,
                          SimulationTimeProvider* replay_clock,
                          const std::string& payload) {
  try {
    const auto json = nlohmann::json::parse(payload);
    const std::string type = json.value("type", std::string("bar"));
    const std::string symbol = json.at("symbol").get<std::string>();

    if (type == "sentiment") {
      store.setSentiment(symbol, json.at("score").get<double>());
      return okStatus();
    }
    if (type != "bar") {
      return makeError(ErrorKind::InvalidInput,
                       "unknown message type '" + type + "'", "gateway",
                       symbol);
    }

    domain::Bar bar;
    bar.timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();
    bar.close = json.contains("close") ? json.at("close").get<double>()
                                       : json.at("price").get<double>();
    bar.open = json.value("open", bar.close);
    bar.high = json.value("high", bar.close);
    bar.low = json.value("low", bar.close);
    bar.volume = json.value("volume", 0.0);

    // Advance the replay clock first so readers never see a bar from the
    // future.
    if (replay_clock != nullptr) {
      replay_clock->advance_time(bar.timestamp_ms);
    }

    if (!store.appendBar(symbol, bar)) {
      return makeError(ErrorKind::InvalidInput, "out-of-order bar dropped",
                       "gateway", symbol,
                       {{"timestamp_ms", static_cast<double>(bar.timestamp_ms)}});
    }
    return okStatus();
  } catch (const nlohmann::json::exception& e) {
    return makeError(ErrorKind::InvalidInput,
                     std::string("malformed market message: ") + e.what(),
                     "gateway");
  }
}

// -----------------------------------------------------------------------------
// Constructor: SUB socket, subscribe to everything, bounded recv
// -----------------------------------------------------------------------------
MarketDataGateway::MarketDataGateway(BarStore& store,
                                     const std::string& endpoint,
                                     SimulationTimeProvider* replay_clock)
    : store_(store), replay_clock_(replay_clock) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
  std::cout << "[MarketDataGateway] connected to " << endpoint << "\n";
}

void MarketDataGateway::run() {
  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }
    if (!result.has_value()) {
      continue;  // timeout; re-check running_
    }

    const std::string payload = msg.to_string();
    Status applied = applyMarketMessage(store_, replay_clock_, payload);
    if (applied) {
      applied_.fetch_add(1);
    } else {
      rejected_.fetch_add(1);
      std::cerr << "[MarketDataGateway] skipped message: "
                << describe(applied.error()) << "\n";
    }
  }
}

void MarketDataGateway::stop() { running_.store(false); }

}  // namespace qfolio
