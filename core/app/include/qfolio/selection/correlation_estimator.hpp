#pragma once

#include "qfolio/common/result.hpp"
#include "qfolio/config/engine_config.hpp"
#include "qfolio/domain/bar.hpp"
#include "qfolio/domain/portfolio_types.hpp"

#include <string>
#include <vector>

namespace qfolio {

// -----------------------------------------------------------------------------
// CorrelationEstimator
// -----------------------------------------------------------------------------
//
// @brief  Pearson correlation of simple returns over the trailing window.
//
// @details
// Series are aligned on their most recent end: the estimator uses the last
// min(window, shortest return series) returns of every asset. An asset with
// zero variance over that span is uncorrelated with everything (0). Entries
// are clamped to [-1, 1] and the diagonal is exactly 1.
//
// Errors:
//   InvalidInput         — an asset is missing from the snapshot.
//   InsufficientHistory  — fewer than min_observations aligned returns.
// -----------------------------------------------------------------------------
class CorrelationEstimator {
 public:
  explicit CorrelationEstimator(CorrelationConfig config);

  Result<domain::CorrelationMatrix> estimate(
      const domain::MarketSnapshot& snapshot,
      const std::vector<std::string>& assets) const;

 private:
  CorrelationConfig config_;
};

}  // namespace qfolio
