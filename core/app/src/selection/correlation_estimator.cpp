#include "qfolio/selection/correlation_estimator.hpp"
#include "qfolio/selection/series_math.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace qfolio {

CorrelationEstimator::CorrelationEstimator(CorrelationConfig config)
    : config_(std::move(config)) {}

Result<domain::CorrelationMatrix> CorrelationEstimator::estimate(
    const domain::MarketSnapshot& snapshot,
    const std::vector<std::string>& assets) const {
  std::vector<std::vector<double>> returns;
  returns.reserve(assets.size());
  std::size_t span = config_.window;

  for (const auto& asset : assets) {
    auto it = snapshot.find(asset);
    if (it == snapshot.end()) {
      return makeError(ErrorKind::InvalidInput,
                       "asset missing from market snapshot", "correlation",
                       asset);
    }
    returns.push_back(series::simpleReturns(it->second));
    span = std::min(span, returns.back().size());
  }

  if (!assets.empty() && span < config_.min_observations) {
    return makeError(
        ErrorKind::InsufficientHistory,
        "not enough aligned returns for correlation", "correlation", {},
        {{"aligned", static_cast<double>(span)},
         {"min_observations", static_cast<double>(config_.min_observations)}});
  }

  // Centre each aligned tail once.
  std::vector<std::vector<double>> centred(assets.size());
  std::vector<double> norms(assets.size(), 0.0);
  for (std::size_t i = 0; i < assets.size(); ++i) {
    centred[i] = series::tail(returns[i], span);
    const double m = series::mean(centred[i]);
    for (double& v : centred[i]) {
      v -= m;
      norms[i] += v * v;
    }
    norms[i] = std::sqrt(norms[i]);
  }

  auto matrix = domain::CorrelationMatrix::identity(assets);
  for (std::size_t i = 0; i < assets.size(); ++i) {
    for (std::size_t j = i + 1; j < assets.size(); ++j) {
      double rho = 0.0;
      if (norms[i] > std::numeric_limits<double>::epsilon() &&
          norms[j] > std::numeric_limits<double>::epsilon()) {
        double dot = 0.0;
        for (std::size_t t = 0; t < span; ++t) {
          dot += centred[i][t] * centred[j][t];
        }
        rho = series::clamp(dot / (norms[i] * norms[j]), -1.0, 1.0);
      }
      matrix(i, j) = rho;
      matrix(j, i) = rho;
    }
  }
  return matrix;
}

}  // namespace qfolio
