#pragma once

#include "qfolio/compliance/compliance_state_store.hpp"
#include "qfolio/config/engine_config.hpp"
#include "qfolio/domain/compliance_decision.hpp"
#include "qfolio/domain/holding.hpp"
#include "qfolio/domain/order.hpp"
#include "qfolio/domain/trade_record.hpp"
#include "qfolio/time/i_time_provider.hpp"

#include <string>

namespace qfolio {

// -----------------------------------------------------------------------------
// TradeProposal — a trade the orchestrator would like to make
// -----------------------------------------------------------------------------
struct TradeProposal {
  std::string asset;
  domain::Side side{domain::Side::Buy};
  double quantity{0.0};
  double price{0.0};
};

// -----------------------------------------------------------------------------
// WashComplianceEngine — anti-wash-trading gate
// -----------------------------------------------------------------------------
//
// @brief  Approves or blocks one proposed trade against the asset's trading
//         history and the configured thresholds.
//
// @details
// Rules, evaluated in this order (the first failure is the reported reason;
// every failure is listed in ComplianceDecision::violations):
//
//   1. MIN_HOLD_TIME — SELL only. Blocked if now - last_buy <
//      MIN_HOLD_HOURS. last_buy falls back to the holding's entry time when
//      the store has none; with neither the rule does not apply.
//   2. MIN_NET_PROFIT — SELL only. Blocked if
//      (price - avg_entry)/avg_entry - 2·COMMISSION_RATE < MIN_NET_PROFIT.
//      Not applicable without a positive entry price.
//   3. MAX_DAILY_TRADES_PER_ASSET — blocked if today's count for the asset
//      has reached the cap.
//   4. MAX_DAILY_TOTAL_TRADES — blocked if today's count across all assets
//      has reached the cap.
//   5. MIN_TRADE_VALUE — blocked if quantity·price < MIN_TRADE_VALUE.
//   6. COOLDOWN_AFTER_SELL — BUY only. Blocked if the asset was sold less
//      than COOLDOWN_HOURS_AFTER_SELL ago.
//
// "Today" is the UTC day of the time provider's now_ms().
//
// Thread model:
//   evaluate() is const and reads the store passed in; recordExecution() is
//   the only write path and is called from the cycle thread after a
//   confirmed fill.
// -----------------------------------------------------------------------------
class WashComplianceEngine {
 public:
  WashComplianceEngine(ComplianceConfig config, const ITimeProvider& clock);

  domain::ComplianceDecision evaluate(const TradeProposal& proposal,
                                      const ComplianceStateStore& store,
                                      const domain::Holding* holding) const;

  // Writes a confirmed fill back into the store.
  void recordExecution(ComplianceStateStore& store,
                       const domain::TradeRecord& record) const;

  // (price - entry)/entry - 2·commission
  double netProfitFraction(double price, double entry_price) const;

  const ComplianceConfig& config() const { return config_; }

 private:
  ComplianceConfig config_;
  const ITimeProvider& clock_;
};

}  // namespace qfolio
