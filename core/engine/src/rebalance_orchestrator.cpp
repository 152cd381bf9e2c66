#include "qfolio/engine/rebalance_orchestrator.hpp"

#include "qfolio/execution/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>
#include <utility>

namespace qfolio {

namespace {

// Absorbs representation error so that e.g. 0.3 / 0.1 floors to 3, not 2.
constexpr double kStepEpsilon = 1e-9;
constexpr double kWeightEpsilon = 1e-12;

}  // namespace

RebalanceOrchestrator::RebalanceOrchestrator(
    RebalanceConfig config, RetryConfig retry, IExecutionClient& client,
    const IMarketDataSource& market, PortfolioLedger& ledger,
    ComplianceStateStore& store, const WashComplianceEngine& compliance,
    CircuitBreaker& breaker, EventBus& bus, ITimeProvider& clock)
    : config_(std::move(config)),
      retry_(retry),
      client_(client),
      market_(market),
      ledger_(ledger),
      store_(store),
      compliance_(compliance),
      breaker_(breaker),
      bus_(bus),
      clock_(clock),
      rate_limiter_(clock, config_.min_order_interval_ms) {}

double RebalanceOrchestrator::stepSizeFor(const std::string& asset) const {
  auto it = config_.step_sizes.find(asset);
  return it != config_.step_sizes.end() ? it->second
                                        : config_.default_step_size;
}

double RebalanceOrchestrator::roundToStep(const std::string& asset,
                                          double quantity) const {
  const double step = stepSizeFor(asset);
  if (quantity <= 0.0) {
    return 0.0;
  }
  if (step <= 0.0) {
    return quantity;
  }
  const double units = quantity / step;
  return std::floor(units + kStepEpsilon * std::max(1.0, units)) * step;
}

void RebalanceOrchestrator::publishStage(const CycleContext& ctx,
                                         const std::string& stage,
                                         const std::string& asset, bool ok,
                                         const std::string& detail,
                                         std::map<std::string, double> values,
                                         const std::string& error_kind) {
  StageEvent event;
  event.cycle_id = ctx.cycle_id;
  event.timestamp_ms = clock_.now_ms();
  event.stage = stage;
  event.asset = asset;
  event.ok = ok;
  event.detail = detail;
  event.error_kind = error_kind;
  event.values = std::move(values);
  bus_.publish(event);
}

bool RebalanceOrchestrator::cancelRequested(CycleContext& ctx,
                                            const std::atomic<bool>* cancel,
                                            const char* after_stage) {
  if (cancel == nullptr || !cancel->load()) {
    return false;
  }
  ctx.report.cancelled = true;
  publishStage(ctx, "cancelled", "", true,
               std::string("cancelled after ") + after_stage);
  std::cout << "[RebalanceOrchestrator] cycle " << ctx.cycle_id
            << " cancelled after " << after_stage << "\n";
  return true;
}

// -----------------------------------------------------------------------------
// rebalance(): stages 1-7
// -----------------------------------------------------------------------------
RebalanceReport RebalanceOrchestrator::rebalance(
    std::uint64_t cycle_id, const domain::TargetWeights& targets,
    const std::atomic<bool>* cancel) {
  CycleContext ctx;
  ctx.cycle_id = cycle_id;

  discoverPrices(ctx, targets);
  if (cancelRequested(ctx, cancel, "price_discovery")) {
    return ctx.report;
  }

  valuePortfolio(ctx);
  if (cancelRequested(ctx, cancel, "valuation")) {
    return ctx.report;
  }
  if (ctx.report.portfolio_value <= 0.0) {
    return ctx.report;
  }

  computeIntents(ctx, targets);
  if (cancelRequested(ctx, cancel, "delta")) {
    return ctx.report;
  }

  std::vector<RebalanceIntent> approved = filterCompliance(ctx);
  if (cancelRequested(ctx, cancel, "compliance")) {
    return ctx.report;
  }

  // From here on the cycle runs to completion.
  std::vector<RebalanceIntent> sells;
  std::vector<RebalanceIntent> buys;
  for (auto& intent : approved) {
    (intent.side == domain::Side::Sell ? sells : buys)
        .push_back(std::move(intent));
  }

  executeSells(ctx, std::move(sells));
  resyncCash(ctx);
  executeBuys(ctx, std::move(buys));

  std::cout << "[RebalanceOrchestrator] cycle " << cycle_id << ": "
            << ctx.report.intents.size() << " intents, "
            << ctx.report.blocked.size() << " blocked, "
            << ctx.report.orders_filled << "/" << ctx.report.orders_submitted
            << " orders filled" << (ctx.report.halted ? " (halted)" : "")
            << "\n";
  return ctx.report;
}

// -----------------------------------------------------------------------------
// Stage 1: price discovery
// -----------------------------------------------------------------------------
void RebalanceOrchestrator::discoverPrices(
    CycleContext& ctx, const domain::TargetWeights& targets) {
  std::set<std::string> assets;
  for (const auto& [asset, weight] : targets) {
    if (weight > 0.0) {
      assets.insert(asset);
    }
  }
  for (const auto& h : ledger_.snapshots()) {
    assets.insert(h.asset);
  }

  for (const auto& asset : assets) {
    auto price = withRetry<double>(retry_, clock_, "price " + asset, [&] {
      return market_.latestPrice(asset);
    });
    if (price) {
      ctx.report.prices[asset] = price.value();
      continue;
    }
    ctx.report.unpriced.push_back(asset);
    const Error& error = price.error();
    publishStage(ctx, "price_discovery", asset, false, error.message,
                 error.inputs, errorKindToString(error.kind));
    std::cerr << "[RebalanceOrchestrator] excluding " << asset << ": "
              << describe(error) << "\n";
  }
}

// -----------------------------------------------------------------------------
// Stage 2: valuation
// -----------------------------------------------------------------------------
void RebalanceOrchestrator::valuePortfolio(CycleContext& ctx) {
  auto& report = ctx.report;
  report.cash_before = ledger_.cash();
  report.marked_equity = ledger_.equity(report.prices);
  report.portfolio_value = report.marked_equity;

  // Unpriced holdings are left out of the sizing base; they are neither
  // bought nor sold this cycle.
  for (const auto& asset : report.unpriced) {
    if (auto h = ledger_.holding(asset)) {
      report.portfolio_value -= h->quantity * h->average_entry_price;
    }
  }

  publishStage(ctx, "valuation", "", report.portfolio_value > 0.0,
               report.portfolio_value > 0.0 ? "portfolio valued"
                                            : "non-positive portfolio value",
               {{"cash", report.cash_before},
                {"portfolio_value", report.portfolio_value},
                {"marked_equity", report.marked_equity}});

  // A missing price is a per-asset failure, not a loss.
  if (report.marked_equity > 0.0) {
    breaker_.observeEquity(report.marked_equity);
  }
}

// -----------------------------------------------------------------------------
// Stage 3: delta computation
// -----------------------------------------------------------------------------
void RebalanceOrchestrator::computeIntents(
    CycleContext& ctx, const domain::TargetWeights& targets) {
  auto& report = ctx.report;
  const double value = report.portfolio_value;

  for (const auto& [asset, price] : report.prices) {
    const auto held = ledger_.holding(asset);
    const double held_qty = held ? held->quantity : 0.0;
    const double current = held_qty * price / value;

    auto t = targets.find(asset);
    const double target = t != targets.end() ? t->second : 0.0;
    const double delta = target - current;

    if (std::abs(delta) + kWeightEpsilon < config_.threshold) {
      continue;
    }

    RebalanceIntent intent;
    intent.asset = asset;
    intent.price = price;
    intent.current_weight = current;
    intent.target_weight = target;

    if (delta < 0.0) {
      intent.side = domain::Side::Sell;
      intent.quantity = target <= 0.0
                            ? held_qty
                            : std::min(held_qty, roundToStep(
                                  asset, -delta * value / price));
    } else {
      intent.side = domain::Side::Buy;
      intent.quantity = roundToStep(asset, delta * value / price);
    }

    if (intent.quantity <= config_.dust_quantity) {
      publishStage(ctx, "delta", asset, true,
                   "quantity below step size, skipped",
                   {{"delta", delta}, {"price", price}});
      continue;
    }
    report.intents.push_back(intent);
  }

  publishStage(ctx, "delta", "", true, "intents computed",
               {{"intents", static_cast<double>(report.intents.size())},
                {"threshold", config_.threshold}});
}

// -----------------------------------------------------------------------------
// Stage 4: compliance filtering (sells first, scratch store)
// -----------------------------------------------------------------------------
std::vector<RebalanceIntent> RebalanceOrchestrator::filterCompliance(
    CycleContext& ctx) {
  auto& report = ctx.report;
  std::vector<RebalanceIntent> ordered = report.intents;
  std::stable_partition(ordered.begin(), ordered.end(),
                        [](const RebalanceIntent& i) {
                          return i.side == domain::Side::Sell;
                        });

  ComplianceStateStore scratch = store_;
  std::vector<RebalanceIntent> approved;
  const std::int64_t now = clock_.now_ms();

  for (const auto& intent : ordered) {
    const auto held = ledger_.holding(intent.asset);
    const auto decision = compliance_.evaluate(
        TradeProposal{intent.asset, intent.side, intent.quantity,
                      intent.price},
        scratch, held ? &*held : nullptr);

    bus_.publish(ComplianceDecisionEvent{ctx.cycle_id, now, decision});

    if (decision.approved()) {
      scratch.noteTrade(intent.asset, now);
      approved.push_back(intent);
    } else {
      std::cerr << "[RebalanceOrchestrator] blocked "
                << domain::sideToString(intent.side) << " " << intent.asset
                << ": " << decision.reason << "\n";
      report.blocked.push_back(decision);
    }
  }
  return approved;
}

// -----------------------------------------------------------------------------
// Stage 5: sells, largest freed cash first
// -----------------------------------------------------------------------------
void RebalanceOrchestrator::executeSells(CycleContext& ctx,
                                         std::vector<RebalanceIntent> sells) {
  std::stable_sort(sells.begin(), sells.end(),
                   [](const RebalanceIntent& a, const RebalanceIntent& b) {
                     return a.notional() > b.notional();
                   });
  for (const auto& intent : sells) {
    if (!executeOrder(ctx, intent)) {
      break;
    }
  }
}

// -----------------------------------------------------------------------------
// Stage 6: cash resync
// -----------------------------------------------------------------------------
void RebalanceOrchestrator::resyncCash(CycleContext& ctx) {
  auto& report = ctx.report;
  auto cash = withRetry<double>(retry_, clock_, "queryCash",
                                [&] { return client_.queryCash(); });
  if (cash) {
    ledger_.setCash(cash.value());
    report.cash_available = cash.value();
    report.cash_from_exchange = true;
    publishStage(ctx, "cash_resync", "", true, "exchange cash",
                 {{"cash", report.cash_available}});
    return;
  }

  report.cash_available = ledger_.cash();
  const Error& error = cash.error();
  publishStage(ctx, "cash_resync", "", false,
               "using locally reconciled cash: " + error.message,
               {{"cash", report.cash_available}},
               errorKindToString(error.kind));
  std::cerr << "[RebalanceOrchestrator] cash resync failed, using ledger "
            << report.cash_available << ": " << describe(error) << "\n";
}

// -----------------------------------------------------------------------------
// Stage 7: buys, scaled to available cash
// -----------------------------------------------------------------------------
void RebalanceOrchestrator::executeBuys(CycleContext& ctx,
                                        std::vector<RebalanceIntent> buys) {
  auto& report = ctx.report;
  if (buys.empty()) {
    return;
  }

  const double commission_rate = compliance_.config().commission_rate;
  double requested = 0.0;
  for (const auto& intent : buys) {
    requested += intent.notional() * (1.0 + commission_rate);
  }

  const double available = std::max(report.cash_available, 0.0);
  if (requested > available) {
    report.buy_scale = available > 0.0 ? available / requested : 0.0;
    publishStage(ctx, "buy_scaling", "", true, "buys scaled to available cash",
                 {{"requested", requested},
                  {"available", available},
                  {"scale", report.buy_scale}});
    std::cout << "[RebalanceOrchestrator] scaling buys by "
              << report.buy_scale << " (requested " << requested
              << ", available " << available << ")\n";
  }

  const double min_value = compliance_.config().min_trade_value;
  const std::int64_t now = clock_.now_ms();
  std::vector<RebalanceIntent> scaled;
  for (auto intent : buys) {
    if (report.buy_scale < 1.0) {
      intent.quantity = roundToStep(intent.asset,
                                    intent.quantity * report.buy_scale);
    }
    if (intent.notional() < min_value) {
      domain::ComplianceDecision decision;
      decision.asset = intent.asset;
      decision.side = intent.side;
      decision.quantity = intent.quantity;
      decision.price = intent.price;
      decision.verdict = domain::ComplianceVerdict::Block;
      decision.rule = domain::ComplianceRule::MinTradeValue;
      decision.violations.push_back(decision.rule);
      decision.reason = "scaled trade value " +
                        std::to_string(intent.notional()) + " below " +
                        std::to_string(min_value);
      bus_.publish(ComplianceDecisionEvent{ctx.cycle_id, now, decision});
      std::cerr << "[RebalanceOrchestrator] blocked BUY " << intent.asset
                << ": " << decision.reason << "\n";
      report.blocked.push_back(std::move(decision));
      continue;
    }
    scaled.push_back(std::move(intent));
  }

  for (const auto& intent : scaled) {
    if (!executeOrder(ctx, intent)) {
      break;
    }
  }
}

// -----------------------------------------------------------------------------
// executeOrder(): breaker → rate limit → retrying submit → ledger
// -----------------------------------------------------------------------------
bool RebalanceOrchestrator::executeOrder(CycleContext& ctx,
                                         const RebalanceIntent& intent) {
  auto& report = ctx.report;
  if (ctx.stop_orders) {
    return false;
  }
  if (breaker_.isTripped()) {
    ctx.stop_orders = true;
    report.halted = true;
    publishStage(ctx, "execution", intent.asset, false,
                 "circuit breaker tripped: " + breaker_.reason(), {},
                 errorKindToString(ErrorKind::CircuitBreakerTripped));
    std::cerr << "[RebalanceOrchestrator] order submission halted: "
              << breaker_.reason() << "\n";
    return false;
  }

  rate_limiter_.acquire();

  domain::OrderRequest request;
  request.asset = intent.asset;
  request.side = intent.side;
  request.quantity = intent.quantity;
  request.type = domain::OrderType::Market;
  request.reference_price = intent.price;
  bus_.publish(TradeAttemptEvent{ctx.cycle_id, clock_.now_ms(), request});

  // Safe to resubmit: TransientFailure means the order was not placed.
  auto result = withRetry<domain::OrderFill>(
      retry_, clock_, "submitOrder " + intent.asset,
      [&] { return client_.submitOrder(request); });
  ++report.orders_submitted;

  TradeOutcomeEvent outcome;
  outcome.cycle_id = ctx.cycle_id;
  outcome.timestamp_ms = clock_.now_ms();
  outcome.request = request;

  if (!result) {
    ++report.orders_failed;
    outcome.accepted = false;
    outcome.error = describe(result.error());
    bus_.publish(outcome);
    std::cerr << "[RebalanceOrchestrator] order failed: " << outcome.error
              << "\n";
    return true;
  }

  const domain::OrderFill& fill = result.value();
  outcome.accepted = true;
  outcome.fill = fill;
  bus_.publish(outcome);

  if (fill.status == domain::OrderStatus::Rejected ||
      fill.filled_quantity <= 0.0) {
    ++report.orders_failed;
    publishStage(ctx, "execution", intent.asset, false,
                 "order rejected: " + fill.message,
                 {{"requested_quantity", fill.requested_quantity}},
                 errorKindToString(ErrorKind::OrderRejected));
    std::cerr << "[RebalanceOrchestrator] " << intent.asset
              << " rejected: " << fill.message << "\n";
    return true;
  }

  domain::TradeRecord record = ledger_.applyFill(
      intent.asset, intent.side, fill.filled_quantity, fill.fill_price,
      fill.commission, fill.timestamp_ms, fill.order_id);
  compliance_.recordExecution(store_, record);
  ++report.orders_filled;

  if (fill.status == domain::OrderStatus::PartiallyFilled) {
    publishStage(ctx, "execution", intent.asset, true, "partial fill",
                 {{"requested_quantity", fill.requested_quantity},
                  {"filled_quantity", fill.filled_quantity}});
  }

  if (intent.side == domain::Side::Sell) {
    breaker_.observeRoundTrip(record.net_pnl);
  }
  report.executed.push_back(std::move(record));
  return true;
}

}  // namespace qfolio
