#include "qfolio/selection/hamiltonian_builder.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace qfolio {

namespace {

double maxAbs(const std::vector<double>& values) {
  double m = 0.0;
  for (double v : values) {
    m = std::max(m, std::abs(v));
  }
  return m;
}

double maxAbsOffDiagonal(const domain::CorrelationMatrix& rho) {
  double m = 0.0;
  for (std::size_t i = 0; i < rho.size(); ++i) {
    for (std::size_t j = 0; j < rho.size(); ++j) {
      if (i != j) {
        m = std::max(m, std::abs(rho(i, j)));
      }
    }
  }
  return m;
}

}  // namespace

HamiltonianBuilder::HamiltonianBuilder(HamiltonianConfig config)
    : config_(std::move(config)) {}

double HamiltonianBuilder::dominanceBound(
    const domain::AlphaVector& alpha,
    const domain::CorrelationMatrix& correlation, int n, double lambda,
    double margin) {
  return maxAbs(alpha.scores) +
         std::abs(lambda) * static_cast<double>(n) *
             maxAbsOffDiagonal(correlation) +
         margin;
}

double HamiltonianBuilder::penaltyFor(
    const domain::AlphaVector& alpha,
    const domain::CorrelationMatrix& correlation, int n,
    double lambda) const {
  if (config_.fixed_penalty > 0.0) {
    return config_.fixed_penalty;
  }
  const double max_alpha = maxAbs(alpha.scores);
  double p = max_alpha > 0.0 ? config_.penalty_multiplier * max_alpha
                             : config_.zero_alpha_penalty;
  if (config_.enforce_dominance) {
    p = std::max(p, dominanceBound(alpha, correlation, n, lambda,
                                   config_.dominance_margin));
  }
  return p;
}

// -----------------------------------------------------------------------------
// build(): expand H into (Q, offset)
// -----------------------------------------------------------------------------
Result<QuboProblem> HamiltonianBuilder::build(
    const domain::AlphaVector& alpha,
    const domain::CorrelationMatrix& correlation, int n,
    double lambda) const {
  const std::size_t size = alpha.size();
  if (n < 1 || size < static_cast<std::size_t>(n)) {
    return makeError(ErrorKind::EmptyUniverse,
                     "fewer eligible assets than the target portfolio size",
                     "hamiltonian", {},
                     {{"eligible", static_cast<double>(size)},
                      {"n", static_cast<double>(n)}});
  }
  if (correlation.assets != alpha.assets) {
    return makeError(ErrorKind::InvalidInput,
                     "correlation matrix and alpha vector cover different "
                     "assets",
                     "hamiltonian", {},
                     {{"alpha_assets", static_cast<double>(size)},
                      {"correlation_assets",
                       static_cast<double>(correlation.size())}});
  }

  const double p = penaltyFor(alpha, correlation, n, lambda);
  const double nd = static_cast<double>(n);

  QuboProblem qubo;
  qubo.assets = alpha.assets;
  qubo.alpha = alpha.scores;
  qubo.penalty = p;
  qubo.lambda = lambda;
  qubo.target_count = n;
  qubo.offset = p * nd * nd;
  qubo.coefficients.assign(size * size, 0.0);

  for (std::size_t i = 0; i < size; ++i) {
    qubo.coefficients[i * size + i] = -alpha.scores[i] + p * (1.0 - 2.0 * nd);
    for (std::size_t j = i + 1; j < size; ++j) {
      const double c = lambda * correlation(i, j) + 2.0 * p;
      qubo.coefficients[i * size + j] = c;
      qubo.coefficients[j * size + i] = c;
    }
  }
  return qubo;
}

}  // namespace qfolio
