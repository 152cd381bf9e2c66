#pragma once

#include "qfolio/compliance/compliance_state_store.hpp"
#include "qfolio/compliance/wash_compliance_engine.hpp"
#include "qfolio/config/engine_config.hpp"
#include "qfolio/domain/compliance_decision.hpp"
#include "qfolio/domain/order.hpp"
#include "qfolio/domain/portfolio_types.hpp"
#include "qfolio/domain/trade_record.hpp"
#include "qfolio/eventbus/event_bus.hpp"
#include "qfolio/execution/i_execution_client.hpp"
#include "qfolio/execution/order_rate_limiter.hpp"
#include "qfolio/market/market_data_source.hpp"
#include "qfolio/risk/circuit_breaker.hpp"
#include "qfolio/risk/portfolio_ledger.hpp"
#include "qfolio/time/i_time_provider.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace qfolio {

// -----------------------------------------------------------------------------
// RebalanceIntent — one proposed trade out of delta computation
// -----------------------------------------------------------------------------
struct RebalanceIntent {
  std::string asset;
  domain::Side side{domain::Side::Buy};
  double quantity{0.0};
  double price{0.0};
  double current_weight{0.0};
  double target_weight{0.0};

  double notional() const { return quantity * price; }
};

// -----------------------------------------------------------------------------
// RebalanceReport — what one rebalance() call did
// -----------------------------------------------------------------------------
struct RebalanceReport {
  std::map<std::string, double> prices;
  std::vector<std::string> unpriced;
  // Sizing base: cash plus priced holdings only.
  double portfolio_value{0.0};
  // Full mark, unpriced holdings at entry price. This is what the circuit
  // breaker observes.
  double marked_equity{0.0};
  double cash_before{0.0};
  // Cash after stage 6; either the exchange figure or the ledger's.
  double cash_available{0.0};
  bool cash_from_exchange{false};
  // 1/k applied to buys; 1 when no scaling was needed.
  double buy_scale{1.0};

  std::vector<RebalanceIntent> intents;
  std::vector<domain::ComplianceDecision> blocked;
  std::vector<domain::TradeRecord> executed;
  std::size_t orders_submitted{0};
  std::size_t orders_filled{0};
  std::size_t orders_failed{0};

  bool cancelled{false};
  bool halted{false};
};

// -----------------------------------------------------------------------------
// RebalanceOrchestrator
// -----------------------------------------------------------------------------
//
// @brief  Turns target weights into compliant, ordered trades.
//
// @details
// Seven stages per call:
//
//   1. Price discovery     — every held or targeted asset; an asset whose
//                            price cannot be obtained is excluded.
//   2. Valuation           — cash + Σ quantity × price over priced holdings.
//   3. Delta computation   — |target − current| ≥ threshold yields an
//                            intent; held assets without a target are sold
//                            in full. Quantities are floored to the step
//                            size.
//   4. Compliance          — each intent, sells first, through the
//                            WashComplianceEngine against a scratch copy of
//                            the state store so daily caps count intents
//                            already approved this cycle.
//   5. SELL execution      — descending notional.
//   6. Cash resync         — exchange cash, else the ledger's figure.
//   7. BUY execution       — scaled by 1/k when the requested value plus
//                            commission exceeds cash by k > 1; scaled buys
//                            below the minimum trade value are dropped.
//
// A per-asset failure never aborts the other assets. Cancellation is read
// after each of stages 1-4 and never once selling has started. The circuit
// breaker is checked before every order; a trip stops all further orders of
// the cycle.
//
// Every order goes through the OrderRateLimiter and the bounded retry
// wrapper. Holdings and compliance state are updated from the actual filled
// quantity, so partial fills reconcile naturally.
//
// Thread model:
//   Not thread-safe; called under the engine's cycle lock. Holds references
//   to components owned by PortfolioEngine.
// -----------------------------------------------------------------------------
class RebalanceOrchestrator {
 public:
  RebalanceOrchestrator(RebalanceConfig config, RetryConfig retry,
                        IExecutionClient& client,
                        const IMarketDataSource& market,
                        PortfolioLedger& ledger, ComplianceStateStore& store,
                        const WashComplianceEngine& compliance,
                        CircuitBreaker& breaker, EventBus& bus,
                        ITimeProvider& clock);

  RebalanceReport rebalance(std::uint64_t cycle_id,
                            const domain::TargetWeights& targets,
                            const std::atomic<bool>* cancel = nullptr);

  double stepSizeFor(const std::string& asset) const;

  // Largest multiple of the asset's step size not above quantity.
  double roundToStep(const std::string& asset, double quantity) const;

 private:
  struct CycleContext {
    std::uint64_t cycle_id{0};
    RebalanceReport report;
    bool stop_orders{false};
  };

  void discoverPrices(CycleContext& ctx, const domain::TargetWeights& targets);
  void valuePortfolio(CycleContext& ctx);
  void computeIntents(CycleContext& ctx, const domain::TargetWeights& targets);
  std::vector<RebalanceIntent> filterCompliance(CycleContext& ctx);
  void executeSells(CycleContext& ctx, std::vector<RebalanceIntent> sells);
  void resyncCash(CycleContext& ctx);
  void executeBuys(CycleContext& ctx, std::vector<RebalanceIntent> buys);

  // Submits one order and applies its fill. False once no further orders
  // may be sent this cycle.
  bool executeOrder(CycleContext& ctx, const RebalanceIntent& intent);

  bool cancelRequested(CycleContext& ctx, const std::atomic<bool>* cancel,
                       const char* after_stage);

  void publishStage(const CycleContext& ctx, const std::string& stage,
                    const std::string& asset, bool ok,
                    const std::string& detail,
                    std::map<std::string, double> values = {},
                    const std::string& error_kind = {});

  const RebalanceConfig config_;
  const RetryConfig retry_;

  IExecutionClient& client_;
  const IMarketDataSource& market_;
  PortfolioLedger& ledger_;
  ComplianceStateStore& store_;
  const WashComplianceEngine& compliance_;
  CircuitBreaker& breaker_;
  EventBus& bus_;
  ITimeProvider& clock_;

  OrderRateLimiter rate_limiter_;
};

}  // namespace qfolio
