#include "qfolio/selection/regime_detector.hpp"
#include "qfolio/selection/series_math.hpp"

#include <cmath>
#include <iostream>
#include <utility>

namespace qfolio {

RegimeDetector::RegimeDetector(RegimeConfig config)
    : config_(std::move(config)) {}

// -----------------------------------------------------------------------------
// detect(): average annualized volatility over the reference set
// -----------------------------------------------------------------------------
Result<domain::RegimeParameters> RegimeDetector::detect(
    const domain::MarketSnapshot& snapshot) const {
  double vol_sum = 0.0;
  std::size_t contributors = 0;
  std::size_t min_used = 0;

  auto consider = [&](const domain::PriceSeries& bars) {
    auto returns = series::tail(series::simpleReturns(bars), config_.window);
    if (returns.size() < config_.min_observations) {
      return;
    }
    vol_sum += series::stddev(returns) * std::sqrt(config_.periods_per_year);
    min_used = (contributors == 0) ? returns.size()
                                   : std::min(min_used, returns.size());
    ++contributors;
  };

  if (config_.reference_assets.empty()) {
    for (const auto& [asset, bars] : snapshot) {
      consider(bars);
    }
  } else {
    for (const auto& asset : config_.reference_assets) {
      auto it = snapshot.find(asset);
      if (it != snapshot.end()) {
        consider(it->second);
      }
    }
  }

  if (contributors == 0) {
    return makeError(
        ErrorKind::InsufficientHistory,
        "no reference asset has enough returns to measure volatility",
        "regime", {},
        {{"min_observations", static_cast<double>(config_.min_observations)},
         {"window", static_cast<double>(config_.window)},
         {"assets", static_cast<double>(snapshot.size())}});
  }

  domain::RegimeParameters params =
      fromVolatility(vol_sum / static_cast<double>(contributors));
  params.observations = min_used;
  return params;
}

// -----------------------------------------------------------------------------
// fromVolatility(): clamped piecewise-linear mapping
// -----------------------------------------------------------------------------
domain::RegimeParameters RegimeDetector::fromVolatility(
    double volatility) const {
  const double span = config_.high_volatility - config_.low_volatility;
  const double t =
      series::clamp((volatility - config_.low_volatility) / span, 0.0, 1.0);

  domain::RegimeParameters params;
  params.volatility = volatility;
  params.n = static_cast<int>(std::lround(
      config_.min_n + t * static_cast<double>(config_.max_n - config_.min_n)));
  params.lambda =
      config_.min_lambda + t * (config_.max_lambda - config_.min_lambda);

  if (volatility < config_.low_volatility) {
    params.regime = domain::VolatilityRegime::LowVolatility;
  } else if (volatility > config_.high_volatility) {
    params.regime = domain::VolatilityRegime::HighVolatility;
  } else {
    params.regime = domain::VolatilityRegime::Normal;
  }
  return params;
}

domain::RegimeParameters RegimeDetector::defaults() const {
  domain::RegimeParameters params;
  params.n = config_.default_n;
  params.lambda = config_.default_lambda;
  params.regime = domain::VolatilityRegime::Normal;
  return params;
}

}  // namespace qfolio
