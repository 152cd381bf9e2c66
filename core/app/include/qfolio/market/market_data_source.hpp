#pragma once

#include "qfolio/common/result.hpp"
#include "qfolio/domain/bar.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace qfolio {

// -----------------------------------------------------------------------------
// IMarketDataSource
// -----------------------------------------------------------------------------
// Read side of the market-data feed.
//
//   latestBars(asset, count) — up to `count` most recent bars, oldest first.
//                              An unknown asset yields an empty series.
//   latestPrice(asset)       — last close; PriceUnavailable when the asset
//                              has no bars or a non-positive close.
//
// Retrieval, polling and vendor formats belong to implementations.
// -----------------------------------------------------------------------------
class IMarketDataSource {
 public:
  virtual ~IMarketDataSource() = default;

  virtual domain::PriceSeries latestBars(const std::string& asset,
                                         std::size_t count) const = 0;

  virtual Result<double> latestPrice(const std::string& asset) const = 0;
};

// -----------------------------------------------------------------------------
// ISentimentSource
// -----------------------------------------------------------------------------
// Optional external score per asset, nominally in [-1, 1]. std::nullopt when
// the feed has nothing for the asset; the AlphaScorer treats that as neutral.
// -----------------------------------------------------------------------------
class ISentimentSource {
 public:
  virtual ~ISentimentSource() = default;

  virtual std::optional<double> sentiment(const std::string& asset) const = 0;
};

}  // namespace qfolio
