#pragma once

#include "qfolio/common/result.hpp"
#include "qfolio/config/engine_config.hpp"
#include "qfolio/domain/bar.hpp"
#include "qfolio/domain/portfolio_types.hpp"
#include "qfolio/eventbus/event_bus.hpp"
#include "qfolio/selection/alpha_scorer.hpp"
#include "qfolio/selection/annealer.hpp"
#include "qfolio/selection/correlation_estimator.hpp"
#include "qfolio/selection/hamiltonian_builder.hpp"
#include "qfolio/selection/regime_detector.hpp"
#include "qfolio/selection/selection_repair.hpp"
#include "qfolio/selection/weight_allocator.hpp"
#include "qfolio/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace qfolio {

// -----------------------------------------------------------------------------
// SelectionOutcome — everything the selection half of a cycle produced
// -----------------------------------------------------------------------------
struct SelectionOutcome {
  domain::RegimeParameters regime;
  bool regime_fallback{false};
  domain::AlphaVector alpha;
  // Target count after clamping to the number of scored assets.
  int target_count{0};
  domain::Selection selection;
  // "annealer" or "alpha_top_n".
  std::string method;
  RepairOutcome repair;
  domain::TargetWeights weights;
  bool equal_weight_fallback{false};
  double cvar{0.0};
  double expected_return{0.0};
};

// -----------------------------------------------------------------------------
// SelectionPipeline
// -----------------------------------------------------------------------------
//
// @brief  Market snapshot + sentiment → target weights.
//
// @details
// Stage order and the local recovery at each step:
//
//   1. RegimeDetector        → on failure reuse the previous cycle's
//                              parameters, else the configured defaults.
//   2. AlphaScorer           → EmptyUniverse is returned to the caller;
//                              there is nothing to select from.
//   3. CorrelationEstimator  → on failure the identity matrix (no
//                              diversification term).
//   4. HamiltonianBuilder    → n is clamped to the number of scored assets.
//   5. Annealer              → on failure the top-n assets by alpha.
//   6. Repair                → when |count - n| exceeds count_tolerance.
//   7. WeightAllocator       → DegenerateSelection falls back to equal
//                              weights.
//
// Each intermediate product is published on the EventBus (RegimeEvent,
// AlphaEvent, SelectionEvent, WeightsEvent) and every recovery also emits a
// StageEvent with the error that caused it.
//
// With frozen inputs and a seeded annealer, run() is idempotent.
//
// Thread model:
//   Not thread-safe; called under the engine's cycle lock.
// -----------------------------------------------------------------------------
class SelectionPipeline {
 public:
  SelectionPipeline(const EngineConfig& config, EventBus& bus,
                    const ITimeProvider& clock,
                    RandomSourceFactory random_factory = {});

  Result<SelectionOutcome> run(std::uint64_t cycle_id,
                               const domain::MarketSnapshot& snapshot,
                               const domain::SentimentScores& sentiment);

  const std::optional<domain::RegimeParameters>& lastRegime() const {
    return last_regime_;
  }

  // Highest-alpha n assets; ties keep the lower index.
  static domain::Selection topByAlpha(const domain::AlphaVector& alpha, int n);

 private:
  void publishStage(std::uint64_t cycle_id, const std::string& stage,
                    const Error& error, const std::string& detail);

  RegimeDetector regime_detector_;
  AlphaScorer alpha_scorer_;
  CorrelationEstimator correlation_estimator_;
  HamiltonianBuilder hamiltonian_builder_;
  Annealer annealer_;
  WeightAllocator weight_allocator_;
  const int count_tolerance_;

  EventBus& bus_;
  const ITimeProvider& clock_;

  std::optional<domain::RegimeParameters> last_regime_;
};

}  // namespace qfolio
