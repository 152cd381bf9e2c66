#include "qfolio/compliance/wash_compliance_engine.hpp"
#include "qfolio/time/time_utils.hpp"

#include <optional>
#include <sstream>
#include <utility>

namespace qfolio {

WashComplianceEngine::WashComplianceEngine(ComplianceConfig config,
                                           const ITimeProvider& clock)
    : config_(std::move(config)), clock_(clock) {}

double WashComplianceEngine::netProfitFraction(double price,
                                               double entry_price) const {
  return (price - entry_price) / entry_price - 2.0 * config_.commission_rate;
}

// -----------------------------------------------------------------------------
// evaluate(): rules 1–6 in order
// -----------------------------------------------------------------------------
domain::ComplianceDecision WashComplianceEngine::evaluate(
    const TradeProposal& proposal, const ComplianceStateStore& store,
    const domain::Holding* holding) const {
  using domain::ComplianceRule;

  domain::ComplianceDecision decision;
  decision.asset = proposal.asset;
  decision.side = proposal.side;
  decision.quantity = proposal.quantity;
  decision.price = proposal.price;

  const std::int64_t now = clock_.now_ms();
  const std::int64_t today = utc_day_index(now);
  const AssetComplianceState* state = store.find(proposal.asset);
  const bool selling = proposal.side == domain::Side::Sell;

  std::string first_reason;
  auto fail = [&](ComplianceRule rule, const std::string& reason) {
    if (decision.violations.empty()) {
      first_reason = reason;
    }
    decision.violations.push_back(rule);
  };

  // 1. Minimum hold time
  if (selling) {
    std::optional<std::int64_t> last_buy;
    if (state != nullptr && state->last_buy_ms) {
      last_buy = state->last_buy_ms;
    } else if (holding != nullptr && holding->entry_timestamp_ms > 0) {
      last_buy = holding->entry_timestamp_ms;
    }
    const std::int64_t hold_ms = hours_to_ms(config_.min_hold_hours);
    if (last_buy && now - *last_buy < hold_ms) {
      std::ostringstream os;
      os << "held " << ms_to_hours(now - *last_buy) << "h < "
         << config_.min_hold_hours << "h";
      fail(ComplianceRule::MinHoldTime, os.str());
    }
  }

  // 2. Minimum net profit
  if (selling && holding != nullptr && holding->average_entry_price > 0.0) {
    const double net =
        netProfitFraction(proposal.price, holding->average_entry_price);
    if (net < config_.min_net_profit) {
      std::ostringstream os;
      os << "net profit " << net << " < " << config_.min_net_profit
         << " (entry " << holding->average_entry_price << ", price "
         << proposal.price << ")";
      fail(ComplianceRule::MinNetProfit, os.str());
    }
  }

  // 3. Per-asset daily cap
  const int asset_trades = store.tradesToday(proposal.asset, today);
  if (asset_trades >= config_.max_daily_trades_per_asset) {
    std::ostringstream os;
    os << asset_trades << " trades today >= cap "
       << config_.max_daily_trades_per_asset;
    fail(ComplianceRule::AssetDailyTradeCap, os.str());
  }

  // 4. Global daily cap
  const int total_trades = store.totalTradesToday(today);
  if (total_trades >= config_.max_daily_total_trades) {
    std::ostringstream os;
    os << total_trades << " total trades today >= cap "
       << config_.max_daily_total_trades;
    fail(ComplianceRule::GlobalDailyTradeCap, os.str());
  }

  // 5. Minimum trade value
  const double value = proposal.quantity * proposal.price;
  if (value < config_.min_trade_value) {
    std::ostringstream os;
    os << "value " << value << " < " << config_.min_trade_value;
    fail(ComplianceRule::MinTradeValue, os.str());
  }

  // 6. Post-sell cooldown
  if (!selling && state != nullptr && state->last_sell_ms) {
    const std::int64_t cooldown_ms =
        hours_to_ms(config_.cooldown_hours_after_sell);
    if (now - *state->last_sell_ms < cooldown_ms) {
      std::ostringstream os;
      os << "sold " << ms_to_hours(now - *state->last_sell_ms) << "h ago < "
         << config_.cooldown_hours_after_sell << "h cooldown";
      fail(ComplianceRule::PostSellCooldown, os.str());
    }
  }

  if (decision.violations.empty()) {
    decision.verdict = domain::ComplianceVerdict::Approve;
    decision.rule = ComplianceRule::None;
  } else {
    decision.verdict = domain::ComplianceVerdict::Block;
    decision.rule = decision.violations.front();
    decision.reason = first_reason;
  }
  return decision;
}

void WashComplianceEngine::recordExecution(
    ComplianceStateStore& store, const domain::TradeRecord& record) const {
  store.recordTrade(record);
}

}  // namespace qfolio
