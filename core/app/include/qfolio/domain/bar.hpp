#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace qfolio {
namespace domain {

// -----------------------------------------------------------------------------
// Bar — one OHLCV observation
// -----------------------------------------------------------------------------
// Plain value type. timestamp_ms is the bar's close time in epoch
// milliseconds; bars inside a PriceSeries are ordered oldest first.
// -----------------------------------------------------------------------------
struct Bar {
  std::int64_t timestamp_ms{0};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
};

// Ordered bar history for one asset, oldest first.
using PriceSeries = std::vector<Bar>;

// -----------------------------------------------------------------------------
// MarketSnapshot
// -----------------------------------------------------------------------------
// asset → PriceSeries for one cycle. Built once by the PortfolioEngine from
// the market-data source and then only read by the RegimeDetector,
// AlphaScorer, CorrelationEstimator and WeightAllocator. std::map keeps the
// asset universe in a stable (sorted) order, which the QUBO indexing and the
// idempotence guarantee both rely on.
// -----------------------------------------------------------------------------
using MarketSnapshot = std::map<std::string, PriceSeries>;

// asset → external sentiment/trend score. Assets without an entry are
// treated as neutral (0) by the AlphaScorer.
using SentimentScores = std::map<std::string, double>;

}  // namespace domain
}  // namespace qfolio
