#pragma once

#include "qfolio/market/market_data_source.hpp"

#include <cstddef>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

namespace qfolio {

// -----------------------------------------------------------------------------
// BarStore — in-memory market data and sentiment
// -----------------------------------------------------------------------------
//
// @brief  Thread-safe rolling window of bars per asset plus the latest
//         sentiment score; implements both read interfaces.
//
// @details
// Writers: the MarketDataGateway thread (live feed) or tests.
// Readers: the PortfolioEngine at the start of each cycle.
//
// appendBar() keeps bars ordered by timestamp: a bar with the same timestamp
// as the last one replaces it (bar revision), an older one is dropped. At
// most `capacity` bars are retained per asset.
//
// Thread model: std::shared_mutex, readers share, writers exclusive.
// -----------------------------------------------------------------------------
class BarStore final : public IMarketDataSource, public ISentimentSource {
 public:
  explicit BarStore(std::size_t capacity = 500);

  domain::PriceSeries latestBars(const std::string& asset,
                                 std::size_t count) const override;
  Result<double> latestPrice(const std::string& asset) const override;
  std::optional<double> sentiment(const std::string& asset) const override;

  // Returns false when the bar was older than the stored tail and dropped.
  bool appendBar(const std::string& asset, const domain::Bar& bar);
  void setSeries(const std::string& asset, domain::PriceSeries bars);
  void setSentiment(const std::string& asset, double score);
  void clearSentiment(const std::string& asset);

  std::vector<std::string> assets() const;

 private:
  const std::size_t capacity_;
  mutable std::shared_mutex mutex_;
  std::map<std::string, domain::PriceSeries> bars_;
  std::map<std::string, double> sentiment_;
};

}  // namespace qfolio
