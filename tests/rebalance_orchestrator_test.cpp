// =============================================================================
// rebalance_orchestrator_test.cpp
// =============================================================================
// Component tests for qfolio::RebalanceOrchestrator against the paper
// exchange (MockExecutionClient) and a BarStore price source.
//
// Validates:
//   - Buys from cash, sells before buys, 300 ms order spacing
//   - Buy scaling to exchange cash, re-blocking of scaled dust
//   - Cash resync fallback to the ledger
//   - Partial fills reconcile holdings and compliance state
//   - Compliance blocks are audited; daily caps count this cycle's intents
//   - Circuit-breaker halt, cancellation, unpriced assets, threshold
//   - A held asset without a price does not read as a drawdown
//   - A retried submission fills exactly once
//   - Step-size rounding
//
// Design: every component is real; only the clock is simulated, so rate
// limiting and retry backoff show up as clock jumps.
// =============================================================================

#include "qfolio/audit/audit_recorder.hpp"
#include "qfolio/audit/audit_sink.hpp"
#include "qfolio/engine/rebalance_orchestrator.hpp"
#include "qfolio/execution/mock_execution_client.hpp"
#include "qfolio/market/bar_store.hpp"
#include "qfolio/time/simulation_time_provider.hpp"
#include "qfolio/time/time_utils.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>

using qfolio::domain::ComplianceRule;
using qfolio::domain::Side;
using qfolio_test::kEpochMs;

class RebalanceOrchestratorTest : public ::testing::Test {
 protected:
  // 10:00 UTC, far enough from midnight that no day rollover interferes.
  static constexpr std::int64_t kNow = kEpochMs + 10 * qfolio::kMsPerHour;

  qfolio::SimulationTimeProvider clock{kNow};
  qfolio::BarStore bars;
  qfolio::MockExecutionClient client{clock, 0.001, 1000.0};
  qfolio::PortfolioLedger ledger{1000.0};
  qfolio::ComplianceStateStore store;
  qfolio::ComplianceConfig compliance_config;
  qfolio::RebalanceConfig rebalance_config;
  qfolio::RetryConfig retry_config;
  qfolio::EventBus bus;
  qfolio::CircuitBreaker breaker{qfolio::CircuitBreakerConfig{}, bus, clock};
  qfolio::InMemoryAuditSink sink;
  qfolio::AuditRecorder recorder{bus};

  void SetUp() override {
    recorder.addSink(sink);
    price("BTC", 100.0);
    price("ETH", 50.0);
    price("SOL", 10.0);
  }

  void price(const std::string& asset, double close) {
    qfolio::domain::Bar b;
    b.timestamp_ms = kNow - qfolio::kMsPerHour;
    b.open = b.high = b.low = b.close = close;
    bars.appendBar(asset, b);
  }

  // Holds `qty` of asset on both the ledger and the exchange.
  void hold(const std::string& asset, double qty, double entry,
            double hours_ago) {
    qfolio::domain::Holding h;
    h.asset = asset;
    h.quantity = qty;
    h.average_entry_price = entry;
    h.entry_timestamp_ms =
        kNow - static_cast<std::int64_t>(hours_ago * qfolio::kMsPerHour);
    ledger.hydrateHolding(h);
    client.setBalance(asset, qty);
  }

  std::unique_ptr<qfolio::WashComplianceEngine> compliance;
  std::unique_ptr<qfolio::RebalanceOrchestrator> orchestrator;

  qfolio::RebalanceOrchestrator& make() {
    compliance = std::make_unique<qfolio::WashComplianceEngine>(
        compliance_config, clock);
    orchestrator = std::make_unique<qfolio::RebalanceOrchestrator>(
        rebalance_config, retry_config, client, bars, ledger, store,
        *compliance, breaker, bus, clock);
    return *orchestrator;
  }
};

// -----------------------------------------------------------------------------
// 1. All-cash portfolio buys the targets; orders are 300 ms apart.
// -----------------------------------------------------------------------------
TEST_F(RebalanceOrchestratorTest, BuysTargetsFromCash) {
  auto report = make().rebalance(1, {{"BTC", 0.5}, {"ETH", 0.3}});

  EXPECT_DOUBLE_EQ(report.portfolio_value, 1000.0);
  ASSERT_EQ(report.intents.size(), 2u);
  EXPECT_EQ(report.orders_submitted, 2u);
  EXPECT_EQ(report.orders_filled, 2u);
  EXPECT_TRUE(report.cash_from_exchange);
  EXPECT_DOUBLE_EQ(report.buy_scale, 1.0);

  ASSERT_TRUE(ledger.holding("BTC").has_value());
  EXPECT_NEAR(ledger.holding("BTC")->quantity, 5.0, 1e-9);
  EXPECT_NEAR(ledger.holding("ETH")->quantity, 6.0, 1e-9);
  EXPECT_NEAR(ledger.cash(), 1000.0 - 500.5 - 300.3, 1e-6);

  auto log = client.submissions();
  ASSERT_EQ(log.size(), 2u);
  EXPECT_GE(log[1].timestamp_ms - log[0].timestamp_ms, 300);
}

// -----------------------------------------------------------------------------
// 2. Sells execute before buys and fund them.
// -----------------------------------------------------------------------------
TEST_F(RebalanceOrchestratorTest, SellsBeforeBuys) {
  ledger.setCash(500.0);
  client.setCash(500.0);
  hold("SOL", 50.0, 8.0, 8.0);

  auto report = make().rebalance(2, {{"BTC", 0.9}});

  EXPECT_DOUBLE_EQ(report.portfolio_value, 1000.0);
  auto log = client.submissions();
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(log[0].request.asset, "SOL");
  EXPECT_EQ(log[0].request.side, Side::Sell);
  EXPECT_DOUBLE_EQ(log[0].request.quantity, 50.0);
  EXPECT_EQ(log[1].request.asset, "BTC");
  EXPECT_NEAR(log[1].request.quantity, 9.0, 1e-9);

  EXPECT_NEAR(report.cash_available, 999.5, 1e-9);
  auto open = ledger.snapshots();
  ASSERT_EQ(open.size(), 1u);
  EXPECT_EQ(open[0].asset, "BTC");
  ASSERT_EQ(report.executed.size(), 2u);
  EXPECT_GT(report.executed[0].net_pnl, 0.0);
}

// -----------------------------------------------------------------------------
// 3. Exchange cash below the requested buys: every buy is scaled by 1/k.
// -----------------------------------------------------------------------------
TEST_F(RebalanceOrchestratorTest, ScalesBuysToAvailableCash) {
  client.setCash(500.0);

  auto report = make().rebalance(3, {{"BTC", 0.5}, {"ETH", 0.5}});

  const double k = 500.0 / 1001.0;
  EXPECT_NEAR(report.buy_scale, k, 1e-12);
  EXPECT_EQ(report.orders_filled, 2u);
  const double cash_left = client.queryCash().value();
  EXPECT_GE(cash_left, 0.0);
  EXPECT_LT(cash_left, 0.01);

  // Unscaled intents were 5 BTC and 10 ETH; both shrink by the same factor.
  const double step = rebalance_config.default_step_size;
  auto log = client.submissions();
  ASSERT_EQ(log.size(), 2u);
  double btc = 0.0;
  double eth = 0.0;
  double notional = 0.0;
  for (const auto& s : log) {
    (s.request.asset == "BTC" ? btc : eth) = s.request.quantity;
    notional += s.request.quantity * (s.request.asset == "BTC" ? 100.0 : 50.0);
  }
  EXPECT_NEAR(btc, 5.0 * k, step);
  EXPECT_NEAR(eth, 10.0 * k, step);
  EXPECT_NEAR(eth / btc, 2.0, 3.0 * step / btc);
  EXPECT_NEAR(notional * (1.0 + compliance_config.commission_rate), 500.0,
              150.0 * step * 1.001 + 1e-9);

  auto scaling = sink.recordsOfType("stage");
  bool seen = false;
  for (const auto& r : scaling) {
    seen = seen || r["payload"]["stage"] == "buy_scaling";
  }
  EXPECT_TRUE(seen);
}

// -----------------------------------------------------------------------------
// 4. Buys scaled below the minimum trade value are blocked, not sent.
// -----------------------------------------------------------------------------
TEST_F(RebalanceOrchestratorTest, ScaledDustIsBlocked) {
  client.setCash(15.0);

  auto report = make().rebalance(4, {{"BTC", 0.5}, {"ETH", 0.5}});

  EXPECT_TRUE(client.submissions().empty());
  ASSERT_EQ(report.blocked.size(), 2u);
  for (const auto& d : report.blocked) {
    EXPECT_EQ(d.rule, ComplianceRule::MinTradeValue);
  }
}

// -----------------------------------------------------------------------------
// 5. Cash query keeps failing: the ledger's figure is used.
// -----------------------------------------------------------------------------
TEST_F(RebalanceOrchestratorTest, CashResyncFallsBackToLedger) {
  client.failCashQueries(retry_config.max_attempts);

  auto report = make().rebalance(5, {{"BTC", 0.5}});

  EXPECT_FALSE(report.cash_from_exchange);
  EXPECT_DOUBLE_EQ(report.cash_available, 1000.0);
  EXPECT_EQ(report.orders_filled, 1u);
  // Two retry waits before the fallback.
  EXPECT_GE(clock.now_ms(), kNow + 200 + 400);
}

// -----------------------------------------------------------------------------
// 6. A partial fill updates holdings and compliance state with the filled
//    quantity only.
// -----------------------------------------------------------------------------
TEST_F(RebalanceOrchestratorTest, PartialFillReconciles) {
  client.setFillRatio(0.5);

  auto report = make().rebalance(6, {{"BTC", 0.5}});

  ASSERT_EQ(report.executed.size(), 1u);
  EXPECT_NEAR(report.executed[0].quantity, 2.5, 1e-9);
  EXPECT_NEAR(ledger.holding("BTC")->quantity, 2.5, 1e-9);
  EXPECT_EQ(store.tradesToday("BTC", qfolio::utc_day_index(clock.now_ms())),
            1);

  bool partial = false;
  for (const auto& r : sink.recordsOfType("stage")) {
    partial = partial || r["payload"]["detail"] == "partial fill";
  }
  EXPECT_TRUE(partial);
}

// -----------------------------------------------------------------------------
// 7. A sell inside the hold window is blocked and audited.
// -----------------------------------------------------------------------------
TEST_F(RebalanceOrchestratorTest, ComplianceBlockIsAudited) {
  hold("SOL", 50.0, 8.0, 1.0);

  auto report = make().rebalance(7, {});

  EXPECT_TRUE(client.submissions().empty());
  ASSERT_EQ(report.blocked.size(), 1u);
  EXPECT_EQ(report.blocked[0].rule, ComplianceRule::MinHoldTime);

  auto decisions = sink.recordsOfType("compliance_decision");
  ASSERT_EQ(decisions.size(), 1u);
  EXPECT_EQ(decisions[0]["payload"]["verdict"], "BLOCK");
  EXPECT_EQ(decisions[0]["payload"]["asset"], "SOL");
  EXPECT_EQ(decisions[0]["cycle_id"].get<std::uint64_t>(), 7u);
}

// -----------------------------------------------------------------------------
// 8. Daily caps count intents approved earlier in the same cycle.
//
// Why: the scratch store sees the first approval, the real store only sees
// confirmed fills.
// -----------------------------------------------------------------------------
TEST_F(RebalanceOrchestratorTest, DailyCapCountsThisCycle) {
  compliance_config.max_daily_total_trades = 1;

  auto report = make().rebalance(8, {{"BTC", 0.3}, {"ETH", 0.3}});

  ASSERT_EQ(report.blocked.size(), 1u);
  EXPECT_EQ(report.blocked[0].asset, "ETH");
  EXPECT_EQ(report.blocked[0].rule, ComplianceRule::GlobalDailyTradeCap);
  EXPECT_EQ(report.orders_filled, 1u);
  EXPECT_EQ(store.totalTradesToday(qfolio::utc_day_index(clock.now_ms())), 1);
}

// -----------------------------------------------------------------------------
// 9. A tripped breaker stops all order submission.
// -----------------------------------------------------------------------------
TEST_F(RebalanceOrchestratorTest, TrippedBreakerHalts) {
  breaker.trip("operator HALT");

  auto report = make().rebalance(9, {{"BTC", 0.5}});

  EXPECT_TRUE(report.halted);
  EXPECT_EQ(report.orders_submitted, 0u);
  EXPECT_TRUE(client.submissions().empty());
  EXPECT_DOUBLE_EQ(ledger.cash(), 1000.0);
}

// -----------------------------------------------------------------------------
// 10. Cancellation before selling leaves the portfolio untouched.
// -----------------------------------------------------------------------------
TEST_F(RebalanceOrchestratorTest, CancelStopsBeforeTrading) {
  std::atomic<bool> cancel{true};

  auto report = make().rebalance(10, {{"BTC", 0.5}}, &cancel);

  EXPECT_TRUE(report.cancelled);
  EXPECT_TRUE(report.intents.empty());
  EXPECT_TRUE(client.submissions().empty());

  bool cancelled = false;
  for (const auto& r : sink.recordsOfType("stage")) {
    cancelled = cancelled || r["payload"]["stage"] == "cancelled";
  }
  EXPECT_TRUE(cancelled);
}

// -----------------------------------------------------------------------------
// 11. An asset without a price is excluded; the others still trade.
// -----------------------------------------------------------------------------
TEST_F(RebalanceOrchestratorTest, UnpricedAssetIsExcluded) {
  auto report = make().rebalance(11, {{"DOGE", 0.4}, {"BTC", 0.4}});

  ASSERT_EQ(report.unpriced.size(), 1u);
  EXPECT_EQ(report.unpriced[0], "DOGE");
  ASSERT_EQ(report.intents.size(), 1u);
  EXPECT_EQ(report.intents[0].asset, "BTC");
  EXPECT_EQ(report.orders_filled, 1u);

  bool logged = false;
  for (const auto& r : sink.recordsOfType("stage")) {
    logged = logged || (r["payload"]["stage"] == "price_discovery" &&
                        r["payload"]["error_kind"] == "PriceUnavailable");
  }
  EXPECT_TRUE(logged);
}

// -----------------------------------------------------------------------------
// 12. Weight changes below the threshold produce no intent.
// -----------------------------------------------------------------------------
TEST_F(RebalanceOrchestratorTest, SmallDeltasAreIgnored) {
  ledger.setCash(520.0);
  client.setCash(520.0);
  hold("BTC", 4.8, 90.0, 24.0);

  auto report = make().rebalance(12, {{"BTC", 0.5}});

  EXPECT_DOUBLE_EQ(report.portfolio_value, 1000.0);
  EXPECT_TRUE(report.intents.empty());
  EXPECT_TRUE(client.submissions().empty());
}

// -----------------------------------------------------------------------------
// 13. Quantities floor to the asset's step size.
// -----------------------------------------------------------------------------
TEST_F(RebalanceOrchestratorTest, RoundsToStepSize) {
  rebalance_config.step_sizes["BTC"] = 0.1;
  auto& o = make();

  EXPECT_DOUBLE_EQ(o.stepSizeFor("BTC"), 0.1);
  EXPECT_DOUBLE_EQ(o.stepSizeFor("ETH"), rebalance_config.default_step_size);
  EXPECT_NEAR(o.roundToStep("BTC", 0.3), 0.3, 1e-12);
  EXPECT_NEAR(o.roundToStep("BTC", 0.29), 0.2, 1e-12);
  EXPECT_DOUBLE_EQ(o.roundToStep("BTC", -1.0), 0.0);
}

// -----------------------------------------------------------------------------
// 14. A held asset without a price keeps its entry mark for the breaker.
//
// Why: 90% of the portfolio sits in ADA. Dropping it from the equity would
// read as a 90% drawdown and halt the BTC buy.
// -----------------------------------------------------------------------------
TEST_F(RebalanceOrchestratorTest, UnpricedHoldingDoesNotTripBreaker) {
  ledger.setCash(100.0);
  client.setCash(100.0);
  hold("ADA", 9.0, 100.0, 24.0);
  breaker.observeEquity(1000.0);

  auto report = make().rebalance(14, {{"BTC", 0.5}});

  ASSERT_EQ(report.unpriced.size(), 1u);
  EXPECT_EQ(report.unpriced[0], "ADA");
  EXPECT_DOUBLE_EQ(report.marked_equity, 1000.0);
  EXPECT_DOUBLE_EQ(report.portfolio_value, 100.0);

  EXPECT_FALSE(breaker.isTripped());
  EXPECT_DOUBLE_EQ(breaker.drawdown(), 0.0);
  EXPECT_FALSE(report.halted);

  auto log = client.submissions();
  ASSERT_EQ(log.size(), 1u);
  EXPECT_EQ(log[0].request.asset, "BTC");
  EXPECT_NEAR(log[0].request.quantity, 0.5, 1e-9);
  EXPECT_NEAR(ledger.holding("ADA")->quantity, 9.0, 1e-12);
}

// -----------------------------------------------------------------------------
// 15. A transient submit failure is retried and fills exactly once.
// -----------------------------------------------------------------------------
TEST_F(RebalanceOrchestratorTest, RetriedOrderFillsOnce) {
  client.failTransiently(1);

  auto report = make().rebalance(15, {{"BTC", 0.5}});

  EXPECT_EQ(report.orders_submitted, 1u);
  EXPECT_EQ(report.orders_filled, 1u);
  ASSERT_EQ(client.submissions().size(), 1u);
  EXPECT_NEAR(client.balance("BTC"), 5.0, 1e-9);
  EXPECT_NEAR(ledger.holding("BTC")->quantity, 5.0, 1e-9);
  EXPECT_NEAR(client.queryCash().value(), 1000.0 - 500.5, 1e-6);
}
