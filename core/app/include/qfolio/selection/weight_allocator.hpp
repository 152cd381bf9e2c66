#pragma once

#include "qfolio/common/result.hpp"
#include "qfolio/config/engine_config.hpp"
#include "qfolio/domain/bar.hpp"
#include "qfolio/domain/portfolio_types.hpp"

#include <cstddef>
#include <vector>

namespace qfolio {

// -----------------------------------------------------------------------------
// AllocationResult
// -----------------------------------------------------------------------------
//   weights         — every universe asset of the selection; unselected → 0.
//   cvar            — tail loss of the chosen weights at the confidence level.
//   expected_return — per-period mean portfolio return.
//   bounds_relaxed  — min/max weight bounds were widened to stay feasible.
// -----------------------------------------------------------------------------
struct AllocationResult {
  domain::TargetWeights weights;
  double cvar{0.0};
  double expected_return{0.0};
  double objective{0.0};
  std::size_t observations{0};
  std::size_t iterations{0};
  double min_weight{0.0};
  double max_weight{0.0};
  bool bounds_relaxed{false};
};

// -----------------------------------------------------------------------------
// WeightAllocator — CVaR-aware weights for the selected assets
// -----------------------------------------------------------------------------
//
// @brief  Minimizes risk_aversion·CVaR_β(w) - μ·w - γ·s·w over the bounded
//         simplex {Σw = 1, min_weight ≤ w_i ≤ max_weight}.
//
// @details
// Inputs: the aligned trailing simple returns of the selected assets
// (T periods, the shortest history decides T).
//
// CVaR is evaluated exactly on the empirical distribution (Rockafellar–
// Uryasev): with losses L_t = -R_t·w sorted descending and q = (1 - β)·T,
// CVaR = (Σ_{top ⌊q⌋} L + (q - ⌊q⌋)·L_{⌊q⌋+1}) / q.
//
// s is the optional historical-performance tilt: the configured ratio
// (Sortino / Sharpe / Calmar) per asset, centred and scaled into [-1, 1];
// γ = performance_weight.
//
// Solver: projected subgradient descent from equal weights, step
// initial_step/sqrt(k+1) along the ∞-norm-normalized subgradient,
// Euclidean projection onto the bounded simplex by bisection on the shift.
// The best iterate is returned. Fully deterministic.
//
// Bounds: when k·min_weight > 1 the minimum drops to 1/k; when
// k·max_weight < 1 the maximum rises to 1/k.
//
// Errors (caller falls back to equalWeights()):
//   DegenerateSelection — nothing selected, fewer than min_observations
//                         aligned returns, missing history, or every
//                         return identical.
// A single selected asset gets weight 1 without optimization.
// -----------------------------------------------------------------------------
class WeightAllocator {
 public:
  explicit WeightAllocator(AllocatorConfig config);

  Result<AllocationResult> allocate(const domain::Selection& selection,
                                    const domain::MarketSnapshot& snapshot) const;

  // 1/k for every selected asset, 0 for the rest.
  static domain::TargetWeights equalWeights(const domain::Selection& selection);

  // Empirical CVaR of the portfolio loss. returns is T rows of k columns.
  static double cvar(const std::vector<std::vector<double>>& returns,
                     const std::vector<double>& weights, double confidence);

  // Euclidean projection of v onto {Σw = 1, lo ≤ w_i ≤ hi}. Requires
  // k·lo ≤ 1 ≤ k·hi.
  static std::vector<double> projectBoundedSimplex(const std::vector<double>& v,
                                                   double lo, double hi);

 private:
  AllocatorConfig config_;
};

}  // namespace qfolio
