#pragma once

#include "qfolio/common/result.hpp"
#include "qfolio/config/engine_config.hpp"
#include "qfolio/domain/bar.hpp"
#include "qfolio/domain/portfolio_types.hpp"

namespace qfolio {

// -----------------------------------------------------------------------------
// RegimeDetector — volatility → (n, lambda)
// -----------------------------------------------------------------------------
//
// @brief  Measures market-wide volatility and maps it to the target portfolio
//         size n and the risk-penalty weight lambda.
//
// @details
// Volatility: for every reference asset with enough history, the sample
// stdev of its last `window` simple returns is annualized by
// sqrt(periods_per_year); the detector averages those figures.
//
// Mapping: t = clamp((vol - low) / (high - low), 0, 1)
//   n      = round(min_n + t·(max_n - min_n))
//   lambda = min_lambda + t·(max_lambda - min_lambda)
// Both are monotonic non-decreasing in volatility and clamped to their
// configured ranges.
//
// Regime label: LowVolatility below low_volatility, HighVolatility above
// high_volatility, Normal in between.
//
// Errors:
//   InsufficientHistory — no reference asset has min_observations returns
//   inside the window. The caller falls back to the previous cycle's
//   parameters or to defaults().
//
// Thread model: stateless after construction; detect() is const.
// -----------------------------------------------------------------------------
class RegimeDetector {
 public:
  explicit RegimeDetector(RegimeConfig config);

  Result<domain::RegimeParameters> detect(
      const domain::MarketSnapshot& snapshot) const;

  // Applies the mapping to an already-measured annualized volatility.
  domain::RegimeParameters fromVolatility(double volatility) const;

  // Configured (default_n, default_lambda), labelled Normal.
  domain::RegimeParameters defaults() const;

  const RegimeConfig& config() const { return config_; }

 private:
  RegimeConfig config_;
};

}  // namespace qfolio
