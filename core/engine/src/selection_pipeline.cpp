#include "qfolio/engine/selection_pipeline.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <numeric>
#include <utility>

namespace qfolio {

SelectionPipeline::SelectionPipeline(const EngineConfig& config, EventBus& bus,
                                     const ITimeProvider& clock,
                                     RandomSourceFactory random_factory)
    : regime_detector_(config.regime),
      alpha_scorer_(config.alpha),
      correlation_estimator_(config.correlation),
      hamiltonian_builder_(config.hamiltonian),
      annealer_(config.annealer, std::move(random_factory)),
      weight_allocator_(config.allocator),
      count_tolerance_(config.annealer.count_tolerance),
      bus_(bus),
      clock_(clock) {}

domain::Selection SelectionPipeline::topByAlpha(
    const domain::AlphaVector& alpha, int n) {
  std::vector<std::size_t> order(alpha.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&](std::size_t a, std::size_t b) {
                     return alpha.scores[a] > alpha.scores[b];
                   });

  domain::Selection selection;
  selection.assets = alpha.assets;
  selection.bits.assign(alpha.size(), 0);
  const std::size_t take =
      std::min(order.size(), static_cast<std::size_t>(std::max(n, 0)));
  for (std::size_t i = 0; i < take; ++i) {
    selection.bits[order[i]] = 1;
  }
  return selection;
}

void SelectionPipeline::publishStage(std::uint64_t cycle_id,
                                     const std::string& stage,
                                     const Error& error,
                                     const std::string& detail) {
  StageEvent event;
  event.cycle_id = cycle_id;
  event.timestamp_ms = clock_.now_ms();
  event.stage = stage;
  event.asset = error.asset;
  event.ok = false;
  event.detail = detail + ": " + error.message;
  event.error_kind = errorKindToString(error.kind);
  event.values = error.inputs;
  bus_.publish(event);
}

// -----------------------------------------------------------------------------
// run(): regime → alpha → correlation → QUBO → anneal → repair → weights
// -----------------------------------------------------------------------------
Result<SelectionOutcome> SelectionPipeline::run(
    std::uint64_t cycle_id, const domain::MarketSnapshot& snapshot,
    const domain::SentimentScores& sentiment) {
  SelectionOutcome out;

  // ---  1) Regime -----------------------------------------------------------
  RegimeEvent regime_event;
  regime_event.cycle_id = cycle_id;
  regime_event.timestamp_ms = clock_.now_ms();
  auto regime = regime_detector_.detect(snapshot);
  if (regime) {
    out.regime = regime.value();
    last_regime_ = out.regime;
  } else {
    out.regime_fallback = true;
    out.regime = last_regime_ ? *last_regime_ : regime_detector_.defaults();
    regime_event.fallback = true;
    regime_event.fallback_reason =
        (last_regime_ ? "previous parameters: " : "defaults: ") +
        regime.error().message;
    std::cerr << "[SelectionPipeline] regime fallback ("
              << describe(regime.error()) << ")\n";
  }
  regime_event.params = out.regime;
  bus_.publish(regime_event);

  // ---  2) Alpha ------------------------------------------------------------
  auto alpha = alpha_scorer_.score(snapshot, sentiment);
  if (!alpha) {
    publishStage(cycle_id, "alpha", alpha.error(), "no scorable assets");
    return alpha.error();
  }
  out.alpha = std::move(alpha).value();
  bus_.publish(AlphaEvent{cycle_id, clock_.now_ms(), out.alpha});

  out.target_count =
      std::min(out.regime.n, static_cast<int>(out.alpha.size()));

  // ---  3) Correlation ------------------------------------------------------
  auto correlation =
      correlation_estimator_.estimate(snapshot, out.alpha.assets);
  domain::CorrelationMatrix rho;
  if (correlation) {
    rho = std::move(correlation).value();
  } else {
    publishStage(cycle_id, "correlation", correlation.error(),
                 "using identity correlation");
    rho = domain::CorrelationMatrix::identity(out.alpha.assets);
  }

  // ---  4-6) QUBO, annealing, repair ---------------------------------------
  SelectionEvent selection_event;
  selection_event.cycle_id = cycle_id;
  selection_event.target_count = out.target_count;
  selection_event.lambda = out.regime.lambda;

  auto problem = hamiltonian_builder_.build(out.alpha, rho, out.target_count,
                                            out.regime.lambda);
  if (!problem) {
    publishStage(cycle_id, "hamiltonian", problem.error(),
                 "falling back to alpha ranking");
  }

  std::optional<AnnealResult> annealed;
  if (problem) {
    selection_event.penalty = problem.value().penalty;
    auto solved = annealer_.solve(problem.value());
    if (solved) {
      annealed = std::move(solved).value();
    } else {
      publishStage(cycle_id, "annealer", solved.error(),
                   "falling back to alpha ranking");
    }
  }

  if (annealed) {
    out.method = "annealer";
    out.selection = annealed->selection;
    selection_event.best_read = annealed->best_read;
    selection_event.best_read_energy = annealed->selection.energy;
    out.repair.count_before = out.selection.count();
    out.repair.count_after = out.repair.count_before;
    if (std::abs(out.selection.count() - out.target_count) >
        count_tolerance_) {
      out.repair = repairSelection(out.selection, problem.value(),
                                   out.target_count);
    }
  } else {
    out.method = "alpha_top_n";
    out.selection = topByAlpha(out.alpha, out.target_count);
    out.repair.count_before = out.selection.count();
    out.repair.count_after = out.repair.count_before;
  }
  if (problem) {
    out.selection.energy = problem.value().energy(out.selection.bits);
  }

  selection_event.timestamp_ms = clock_.now_ms();
  selection_event.selection = out.selection;
  selection_event.method = out.method;
  selection_event.count_before_repair = out.repair.count_before;
  selection_event.repair_removed = out.repair.removed;
  selection_event.repair_added = out.repair.added;
  bus_.publish(selection_event);

  // ---  7) Weights ----------------------------------------------------------
  WeightsEvent weights_event;
  weights_event.cycle_id = cycle_id;
  auto allocation = weight_allocator_.allocate(out.selection, snapshot);
  if (allocation) {
    out.weights = allocation.value().weights;
    out.cvar = allocation.value().cvar;
    out.expected_return = allocation.value().expected_return;
    weights_event.bounds_relaxed = allocation.value().bounds_relaxed;
  } else {
    publishStage(cycle_id, "allocation", allocation.error(),
                 "using equal weights");
    out.weights = WeightAllocator::equalWeights(out.selection);
    out.equal_weight_fallback = true;
  }
  weights_event.timestamp_ms = clock_.now_ms();
  weights_event.weights = out.weights;
  weights_event.cvar = out.cvar;
  weights_event.expected_return = out.expected_return;
  weights_event.equal_weight_fallback = out.equal_weight_fallback;
  bus_.publish(weights_event);

  std::cout << "[SelectionPipeline] cycle " << cycle_id << ": "
            << out.selection.count() << "/" << out.alpha.size()
            << " assets selected via " << out.method << " (n="
            << out.target_count << ", lambda=" << out.regime.lambda << ")\n";
  return out;
}

}  // namespace qfolio
