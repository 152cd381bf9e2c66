#pragma once

#include "qfolio/common/result.hpp"
#include "qfolio/config/engine_config.hpp"
#include "qfolio/domain/bar.hpp"
#include "qfolio/domain/portfolio_types.hpp"

#include <string>
#include <vector>

namespace qfolio {

// -----------------------------------------------------------------------------
// AlphaScorer — multi-factor expected-return proxy
// -----------------------------------------------------------------------------
//
// @brief  Scores each eligible asset from momentum, mean reversion and an
//         external sentiment signal, normalized into [-1, 1].
//
// @details
// Factors, with p the latest close:
//   momentum       = r(short_window) - r(long_window),  r(w) = p / p[-w] - 1
//   mean reversion = scale · (MA(moving_average_window) - p) / p
//   sentiment      = external score clamped to [-1, 1]; 0 when missing
//
// raw_i = w_m·momentum + w_r·mean_reversion + w_s·sentiment
//
// Normalization: z_i = (raw_i - mean) / stdev, then divided by max|z| so
// the result lies in [-1, 1]. When the raw scores have no spread (or only
// one asset is eligible) every score is 0.
//
// Eligibility: an asset needs more than long_window bars (and at least
// moving_average_window). Ineligible assets are omitted from the vector;
// they never fail the computation.
//
// Errors:
//   EmptyUniverse — no asset is eligible.
//
// Determinism: iteration follows MarketSnapshot's sorted key order and uses
// no randomness, so identical inputs give identical vectors.
// -----------------------------------------------------------------------------
class AlphaScorer {
 public:
  explicit AlphaScorer(AlphaConfig config);

  Result<domain::AlphaVector> score(
      const domain::MarketSnapshot& snapshot,
      const domain::SentimentScores& sentiment) const;

  // Raw (un-normalized) factor blend for one series; exposed for tests and
  // audit. Requires an eligible series.
  double rawScore(const domain::PriceSeries& bars, double sentiment) const;

  bool eligible(const domain::PriceSeries& bars) const;

 private:
  AlphaConfig config_;
};

}  // namespace qfolio
