#pragma once

#include "qfolio/domain/trade_record.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace qfolio {

// -----------------------------------------------------------------------------
// AssetComplianceState
// -----------------------------------------------------------------------------
//   last_buy_ms / last_sell_ms — timestamps of the most recent fills.
//   day_index / trades_today   — UTC day of the counter and trades on it.
//   realized_net_pnl           — Σ net P&L of closed round trips.
//   round_trips                — sells that closed quantity.
//   losing_round_trips         — those with net P&L < 0.
// -----------------------------------------------------------------------------
struct AssetComplianceState {
  std::optional<std::int64_t> last_buy_ms;
  std::optional<std::int64_t> last_sell_ms;
  std::int64_t day_index{0};
  int trades_today{0};
  double realized_net_pnl{0.0};
  int round_trips{0};
  int losing_round_trips{0};
};

// -----------------------------------------------------------------------------
// ComplianceStateStore — per-asset trading history for the rule engine
// -----------------------------------------------------------------------------
//
// @brief  Owned by the PortfolioEngine, read by the WashComplianceEngine and
//         written back through WashComplianceEngine::recordExecution() after
//         each confirmed fill.
//
// @details
// Daily counters are stored with the UTC day they belong to; reads for a
// different day see 0, so the rollover happens lazily at the boundary with
// no timer. The global counter works the same way.
//
// noteTrade() advances only the counters. The orchestrator uses it on a
// scratch copy of the store so that the daily caps of later intents in a
// cycle account for intents approved earlier in the same cycle.
//
// Thread model: not synchronized. Only the cycle thread touches it, and
// cycles are serialized by the PortfolioEngine's cycle lock.
// -----------------------------------------------------------------------------
class ComplianceStateStore {
 public:
  const AssetComplianceState* find(const std::string& asset) const;

  int tradesToday(const std::string& asset, std::int64_t day_index) const;
  int totalTradesToday(std::int64_t day_index) const;

  // Counter-only projection of a trade at now_ms.
  void noteTrade(const std::string& asset, std::int64_t now_ms);

  // Full update from a confirmed fill.
  void recordTrade(const domain::TradeRecord& record);

  // Seeds the last-buy time of a position hydrated at start-up.
  void hydrateLastBuy(const std::string& asset, std::int64_t timestamp_ms);

  std::size_t size() const { return assets_.size(); }

 private:
  AssetComplianceState& stateFor(const std::string& asset);
  void bumpCounters(AssetComplianceState& state, std::int64_t now_ms);

  std::map<std::string, AssetComplianceState> assets_;
  std::int64_t global_day_index_{0};
  int global_trades_today_{0};
};

}  // namespace qfolio
