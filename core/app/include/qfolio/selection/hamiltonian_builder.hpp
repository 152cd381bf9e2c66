#pragma once

#include "qfolio/common/result.hpp"
#include "qfolio/config/engine_config.hpp"
#include "qfolio/domain/portfolio_types.hpp"
#include "qfolio/selection/qubo_problem.hpp"

namespace qfolio {

// -----------------------------------------------------------------------------
// HamiltonianBuilder
// -----------------------------------------------------------------------------
//
// @brief  Encodes "pick n assets with high alpha and low mutual correlation"
//         as a QUBO.
//
// @details
//   H = -Σ α_i x_i + λ Σ_{i<j} ρ_ij x_i x_j + P (Σ x_i - n)²
//
// Expanding the penalty with x_i² = x_i gives
//   Q_ii  = -α_i + P(1 - 2n)
//   Q_ij  =  λ ρ_ij + 2P           (i < j)
//   offset = P n²
//
// Choice of P:
//   P = penalty_multiplier · max|α|  (zero_alpha_penalty when all α are 0),
//   floored at dominanceBound() when enforce_dominance is set. The floor
//   makes adding an asset strictly improve H whenever fewer than n are
//   selected, and removing one strictly improve H whenever more than n are
//   selected, so every single-flip local minimum has exactly n ones.
//   A positive fixed_penalty replaces the whole rule.
//
// Errors:
//   EmptyUniverse — n < 1 or fewer than n assets in the alpha vector.
//   InvalidInput  — the correlation matrix covers different assets.
// -----------------------------------------------------------------------------
class HamiltonianBuilder {
 public:
  explicit HamiltonianBuilder(HamiltonianConfig config);

  Result<QuboProblem> build(const domain::AlphaVector& alpha,
                            const domain::CorrelationMatrix& correlation,
                            int n, double lambda) const;

  // P actually used for these inputs.
  double penaltyFor(const domain::AlphaVector& alpha,
                    const domain::CorrelationMatrix& correlation, int n,
                    double lambda) const;

  // max|α| + λ·n·max_{i≠j}|ρ_ij| + margin
  static double dominanceBound(const domain::AlphaVector& alpha,
                               const domain::CorrelationMatrix& correlation,
                               int n, double lambda, double margin);

 private:
  HamiltonianConfig config_;
};

}  // namespace qfolio
