#pragma once

#include "qfolio/audit/audit_recorder.hpp"
#include "qfolio/common/result.hpp"
#include "qfolio/compliance/compliance_state_store.hpp"
#include "qfolio/compliance/wash_compliance_engine.hpp"
#include "qfolio/config/engine_config.hpp"
#include "qfolio/engine/rebalance_orchestrator.hpp"
#include "qfolio/engine/selection_pipeline.hpp"
#include "qfolio/eventbus/event_bus.hpp"
#include "qfolio/execution/i_execution_client.hpp"
#include "qfolio/market/market_data_source.hpp"
#include "qfolio/risk/circuit_breaker.hpp"
#include "qfolio/risk/performance_metrics.hpp"
#include "qfolio/risk/portfolio_ledger.hpp"
#include "qfolio/selection/random_source.hpp"
#include "qfolio/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace qfolio {

// -----------------------------------------------------------------------------
// CycleReport — result of one runCycle()
// -----------------------------------------------------------------------------
struct CycleReport {
  std::uint64_t cycle_id{0};
  // Empty when selection failed and the cycle held its positions.
  std::optional<SelectionOutcome> selection;
  std::string hold_reason;
  RebalanceReport rebalance;
  double equity{0.0};
  PerformanceMetrics performance;
};

// -----------------------------------------------------------------------------
// PortfolioEngine
// -----------------------------------------------------------------------------
//
// @brief  Owns every stateful component and runs selection + rebalance
//         cycles one at a time.
//
// @details
// Lifecycle:
//
//   PortfolioEngine engine(config, market, &sentiment, client, clock);
//   engine.auditRecorder().addSink(sink);
//   engine.start();          // reconciliation gate
//   engine.runCycle();       // every rebalance interval
//
// start() reads holdings and cash from the execution client and hydrates
// the ledger and the compliance state store. Positions found at start-up
// are treated as bought at start-up time, so minimum-hold rules apply to
// them. runCycle() refuses to run until start() succeeded.
//
// runCycle():
//   1. Builds the MarketSnapshot (history_bars per universe asset) and the
//      sentiment map.
//   2. SelectionPipeline → target weights. If selection fails the cycle
//      holds: no orders, summary still recorded.
//   3. RebalanceOrchestrator → trades.
//   4. Marks the ledger to market, feeds the circuit breaker, extends the
//      equity curve and publishes a CycleSummaryEvent with the curve's
//      PerformanceMetrics.
//
// Operator commands (executeCommand):
//   "PING"          → {"status":"ok","response":"PONG"}
//   "STATUS"        → breaker state, cash, equity, holdings, cycles
//   "HALT"          → trips the circuit breaker
//   "CLEAR_BREAKER" → clears it
//   "CANCEL"        → cancels the running cycle if it has not started
//                     selling yet
//
// Thread model:
//   runCycle() and start() are serialized by cycle_mutex_. executeCommand()
//   and requestCancel() may be called from any thread while a cycle runs;
//   they only touch thread-safe components and state_mutex_.
//
// Ownership:
//   Owns the EventBus, AuditRecorder, ledger, compliance state and engine,
//   circuit breaker, pipeline and orchestrator. Market data source,
//   sentiment source, execution client and clock are borrowed and must
//   outlive the engine.
// -----------------------------------------------------------------------------
class PortfolioEngine {
 public:
  PortfolioEngine(EngineConfig config, const IMarketDataSource& market,
                  const ISentimentSource* sentiment, IExecutionClient& client,
                  ITimeProvider& clock, RandomSourceFactory random_factory = {});

  PortfolioEngine(const PortfolioEngine&) = delete;
  PortfolioEngine& operator=(const PortfolioEngine&) = delete;
  PortfolioEngine(PortfolioEngine&&) = delete;
  PortfolioEngine& operator=(PortfolioEngine&&) = delete;

  // Reconciliation gate. Errors from the execution client are returned and
  // leave the engine unstarted.
  Status start();

  bool started() const { return started_.load(); }

  // InvalidInput when start() has not succeeded.
  Result<CycleReport> runCycle();

  void requestCancel() { cancel_.store(true); }

  std::string executeCommand(const std::string& cmd);

  EventBus& eventBus() { return bus_; }
  AuditRecorder& auditRecorder() { return recorder_; }
  const PortfolioLedger& ledger() const { return ledger_; }
  CircuitBreaker& circuitBreaker() { return breaker_; }
  const EngineConfig& config() const { return config_; }

  std::uint64_t cyclesCompleted() const { return cycles_completed_.load(); }
  std::vector<double> equityCurve() const;

  // Copy of the compliance state; taken under the cycle lock.
  ComplianceStateStore complianceState() const;

 private:
  domain::MarketSnapshot buildSnapshot() const;
  domain::SentimentScores buildSentiment() const;
  std::map<std::string, double> markPrices() const;

  const EngineConfig config_;
  const IMarketDataSource& market_;
  const ISentimentSource* sentiment_;
  IExecutionClient& client_;
  ITimeProvider& clock_;

  EventBus bus_;
  AuditRecorder recorder_;

  PortfolioLedger ledger_;
  ComplianceStateStore compliance_store_;
  WashComplianceEngine compliance_;
  CircuitBreaker breaker_;

  SelectionPipeline pipeline_;
  RebalanceOrchestrator orchestrator_;

  mutable std::mutex cycle_mutex_;
  std::atomic<bool> started_{false};
  std::atomic<bool> cancel_{false};
  std::atomic<std::uint64_t> cycles_completed_{0};
  std::uint64_t next_cycle_id_{1};

  mutable std::mutex state_mutex_;
  std::vector<double> equity_curve_;
};

}  // namespace qfolio
