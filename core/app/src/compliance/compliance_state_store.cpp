#include "qfolio/compliance/compliance_state_store.hpp"
#include "qfolio/time/time_utils.hpp"

namespace qfolio {

const AssetComplianceState* ComplianceStateStore::find(
    const std::string& asset) const {
  auto it = assets_.find(asset);
  return (it != assets_.end()) ? &it->second : nullptr;
}

AssetComplianceState& ComplianceStateStore::stateFor(const std::string& asset) {
  return assets_[asset];
}

int ComplianceStateStore::tradesToday(const std::string& asset,
                                      std::int64_t day_index) const {
  const AssetComplianceState* state = find(asset);
  if (state == nullptr || state->day_index != day_index) {
    return 0;
  }
  return state->trades_today;
}

int ComplianceStateStore::totalTradesToday(std::int64_t day_index) const {
  return global_day_index_ == day_index ? global_trades_today_ : 0;
}

void ComplianceStateStore::bumpCounters(AssetComplianceState& state,
                                        std::int64_t now_ms) {
  const std::int64_t day = utc_day_index(now_ms);
  if (state.day_index != day) {
    state.day_index = day;
    state.trades_today = 0;
  }
  ++state.trades_today;

  if (global_day_index_ != day) {
    global_day_index_ = day;
    global_trades_today_ = 0;
  }
  ++global_trades_today_;
}

void ComplianceStateStore::noteTrade(const std::string& asset,
                                     std::int64_t now_ms) {
  bumpCounters(stateFor(asset), now_ms);
}

// -----------------------------------------------------------------------------
// recordTrade: timestamps, counters and round-trip bookkeeping
// -----------------------------------------------------------------------------
void ComplianceStateStore::recordTrade(const domain::TradeRecord& record) {
  AssetComplianceState& state = stateFor(record.asset);
  bumpCounters(state, record.timestamp_ms);

  if (record.side == domain::Side::Buy) {
    state.last_buy_ms = record.timestamp_ms;
    return;
  }

  state.last_sell_ms = record.timestamp_ms;
  state.realized_net_pnl += record.net_pnl;
  ++state.round_trips;
  if (record.net_pnl < 0.0) {
    ++state.losing_round_trips;
  }
}

void ComplianceStateStore::hydrateLastBuy(const std::string& asset,
                                          std::int64_t timestamp_ms) {
  AssetComplianceState& state = stateFor(asset);
  if (!state.last_buy_ms || *state.last_buy_ms < timestamp_ms) {
    state.last_buy_ms = timestamp_ms;
  }
}

}  // namespace qfolio
