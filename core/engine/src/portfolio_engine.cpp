#include "qfolio/engine/portfolio_engine.hpp"

#include "qfolio/execution/retry_policy.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace qfolio {

// -----------------------------------------------------------------------------
// Constructor: wire components; members are declared in dependency order
// -----------------------------------------------------------------------------
PortfolioEngine::PortfolioEngine(EngineConfig config,
                                 const IMarketDataSource& market,
                                 const ISentimentSource* sentiment,
                                 IExecutionClient& client,
                                 ITimeProvider& clock,
                                 RandomSourceFactory random_factory)
    : config_(std::move(config)),
      market_(market),
      sentiment_(sentiment),
      client_(client),
      clock_(clock),
      recorder_(bus_),
      ledger_(config_.cycle.initial_cash),
      compliance_(config_.compliance, clock_),
      breaker_(config_.circuit_breaker, bus_, clock_),
      pipeline_(config_, bus_, clock_, std::move(random_factory)),
      orchestrator_(config_.rebalance, config_.retry, client_, market_,
                    ledger_, compliance_store_, compliance_, breaker_, bus_,
                    clock_) {}

// -----------------------------------------------------------------------------
// start(): reconcile exchange holdings and cash before any cycle
// -----------------------------------------------------------------------------
Status PortfolioEngine::start() {
  std::lock_guard lock(cycle_mutex_);
  if (started_.load()) {
    return okStatus();
  }

  auto balances = withRetry<domain::Balances>(
      config_.retry, clock_, "queryHoldings",
      [this] { return client_.queryHoldings(); });
  if (!balances) {
    std::cerr << "[PortfolioEngine] reconciliation failed: "
              << describe(balances.error()) << "\n";
    return balances.error();
  }
  auto cash = withRetry<double>(config_.retry, clock_, "queryCash",
                                [this] { return client_.queryCash(); });
  if (!cash) {
    std::cerr << "[PortfolioEngine] reconciliation failed: "
              << describe(cash.error()) << "\n";
    return cash.error();
  }

  const std::int64_t now = clock_.now_ms();
  for (const auto& [asset, quantity] : balances.value()) {
    if (quantity <= config_.rebalance.dust_quantity) {
      continue;
    }
    domain::Holding h;
    h.asset = asset;
    h.quantity = quantity;
    h.average_entry_price = market_.latestPrice(asset).value_or(0.0);
    h.entry_timestamp_ms = now;
    ledger_.hydrateHolding(h);
    compliance_store_.hydrateLastBuy(asset, now);
    std::cout << "[PortfolioEngine] reconciled " << asset << " qty="
              << quantity << " @ " << h.average_entry_price << "\n";
  }
  ledger_.setCash(cash.value());

  const double equity = ledger_.equity(markPrices());
  breaker_.observeEquity(equity);
  {
    std::lock_guard state_lock(state_mutex_);
    equity_curve_.assign(1, equity);
  }

  started_.store(true);
  std::cout << "[PortfolioEngine] started. cash=" << cash.value()
            << " equity=" << equity << "\n";
  return okStatus();
}

domain::MarketSnapshot PortfolioEngine::buildSnapshot() const {
  domain::MarketSnapshot snapshot;
  for (const auto& asset : config_.cycle.universe) {
    auto bars = market_.latestBars(asset, config_.cycle.history_bars);
    if (!bars.empty()) {
      snapshot.emplace(asset, std::move(bars));
    }
  }
  return snapshot;
}

domain::SentimentScores PortfolioEngine::buildSentiment() const {
  domain::SentimentScores scores;
  if (sentiment_ == nullptr) {
    return scores;
  }
  for (const auto& asset : config_.cycle.universe) {
    if (auto s = sentiment_->sentiment(asset)) {
      scores[asset] = *s;
    }
  }
  return scores;
}

std::map<std::string, double> PortfolioEngine::markPrices() const {
  std::map<std::string, double> prices;
  for (const auto& h : ledger_.snapshots()) {
    auto price = market_.latestPrice(h.asset);
    if (price) {
      prices[h.asset] = price.value();
    }
  }
  return prices;
}

// -----------------------------------------------------------------------------
// runCycle(): snapshot → selection → rebalance → summary
// -----------------------------------------------------------------------------
Result<CycleReport> PortfolioEngine::runCycle() {
  std::lock_guard lock(cycle_mutex_);
  if (!started_.load()) {
    return makeError(ErrorKind::InvalidInput,
                     "engine not started; reconciliation has not run",
                     "cycle");
  }

  CycleReport report;
  report.cycle_id = next_cycle_id_++;
  cancel_.store(false);
  breaker_.beginCycle(report.cycle_id);

  std::cout << "[PortfolioEngine] cycle " << report.cycle_id << " started\n";

  const domain::MarketSnapshot snapshot = buildSnapshot();
  const domain::SentimentScores sentiment = buildSentiment();

  auto selection = pipeline_.run(report.cycle_id, snapshot, sentiment);
  if (selection) {
    report.selection = std::move(selection).value();
    report.rebalance = orchestrator_.rebalance(
        report.cycle_id, report.selection->weights, &cancel_);
  } else {
    report.hold_reason = describe(selection.error());
    std::cerr << "[PortfolioEngine] cycle " << report.cycle_id
              << " holds positions: " << report.hold_reason << "\n";
  }

  report.equity = ledger_.equity(markPrices());
  breaker_.observeEquity(report.equity);

  {
    std::lock_guard state_lock(state_mutex_);
    equity_curve_.push_back(report.equity);
    report.performance = computePerformanceMetrics(
        returnsFromCurve(equity_curve_), config_.cycle.periods_per_year);
  }

  CycleSummaryEvent summary;
  summary.cycle_id = report.cycle_id;
  summary.timestamp_ms = clock_.now_ms();
  summary.equity = report.equity;
  summary.cash = ledger_.cash();
  summary.intents = report.rebalance.intents.size();
  summary.blocked = report.rebalance.blocked.size();
  summary.orders_submitted = report.rebalance.orders_submitted;
  summary.orders_filled = report.rebalance.orders_filled;
  summary.orders_failed = report.rebalance.orders_failed;
  summary.cancelled = report.rebalance.cancelled;
  summary.halted = report.rebalance.halted || breaker_.isTripped();
  summary.performance = report.performance;
  bus_.publish(summary);

  cycles_completed_.fetch_add(1);
  std::cout << "[PortfolioEngine] cycle " << report.cycle_id
            << " done. equity=" << report.equity << "\n";
  return report;
}

std::vector<double> PortfolioEngine::equityCurve() const {
  std::lock_guard lock(state_mutex_);
  return equity_curve_;
}

ComplianceStateStore PortfolioEngine::complianceState() const {
  std::lock_guard lock(cycle_mutex_);
  return compliance_store_;
}

// -----------------------------------------------------------------------------
// executeCommand(): operator channel
// -----------------------------------------------------------------------------
std::string PortfolioEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response["status"] = "ok";
    response["started"] = started_.load();
    response["halted"] = breaker_.isTripped();
    response["halt_reason"] = breaker_.reason();
    response["drawdown"] = breaker_.drawdown();
    response["loss_rate"] = breaker_.lossRate();
    response["cycles_completed"] = cycles_completed_.load();
    response["cash"] = ledger_.cash();
    {
      std::lock_guard lock(state_mutex_);
      response["equity"] = equity_curve_.empty() ? ledger_.cash()
                                                 : equity_curve_.back();
    }

    nlohmann::json holdings = nlohmann::json::array();
    for (const auto& h : ledger_.snapshots()) {
      holdings.push_back({{"asset", h.asset},
                          {"quantity", h.quantity},
                          {"average_entry_price", h.average_entry_price},
                          {"entry_timestamp_ms", h.entry_timestamp_ms},
                          {"realized_pnl", h.realized_pnl}});
    }
    response["holdings"] = std::move(holdings);
  } else if (cmd == "HALT") {
    breaker_.trip("operator HALT");
    response["status"] = "ok";
    response["response"] = "Trading halted";
  } else if (cmd == "CLEAR_BREAKER") {
    breaker_.clear();
    response["status"] = "ok";
    response["response"] = "Circuit breaker cleared";
  } else if (cmd == "CANCEL") {
    requestCancel();
    response["status"] = "ok";
    response["response"] = "Cancellation requested";
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

}  // namespace qfolio
