#include "qfolio/market/bar_store.hpp"

#include <mutex>
#include <utility>

namespace qfolio {

BarStore::BarStore(std::size_t capacity) : capacity_(capacity) {}

domain::PriceSeries BarStore::latestBars(const std::string& asset,
                                         std::size_t count) const {
  std::shared_lock lock(mutex_);
  auto it = bars_.find(asset);
  if (it == bars_.end()) {
    return {};
  }
  const auto& series = it->second;
  const std::size_t start = series.size() > count ? series.size() - count : 0;
  return domain::PriceSeries(series.begin() + static_cast<std::ptrdiff_t>(start),
                             series.end());
}

Result<double> BarStore::latestPrice(const std::string& asset) const {
  std::shared_lock lock(mutex_);
  auto it = bars_.find(asset);
  if (it == bars_.end() || it->second.empty()) {
    return makeError(ErrorKind::PriceUnavailable, "no bars for asset",
                     "price_discovery", asset);
  }
  const double close = it->second.back().close;
  if (!(close > 0.0)) {
    return makeError(ErrorKind::PriceUnavailable, "non-positive last close",
                     "price_discovery", asset, {{"close", close}});
  }
  return close;
}

std::optional<double> BarStore::sentiment(const std::string& asset) const {
  std::shared_lock lock(mutex_);
  auto it = sentiment_.find(asset);
  if (it == sentiment_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool BarStore::appendBar(const std::string& asset, const domain::Bar& bar) {
  std::unique_lock lock(mutex_);
  auto& series = bars_[asset];
  if (!series.empty()) {
    if (bar.timestamp_ms < series.back().timestamp_ms) {
      return false;
    }
    if (bar.timestamp_ms == series.back().timestamp_ms) {
      series.back() = bar;
      return true;
    }
  }
  series.push_back(bar);
  if (series.size() > capacity_) {
    series.erase(series.begin(),
                 series.begin() +
                     static_cast<std::ptrdiff_t>(series.size() - capacity_));
  }
  return true;
}

void BarStore::setSeries(const std::string& asset, domain::PriceSeries bars) {
  std::unique_lock lock(mutex_);
  if (bars.size() > capacity_) {
    bars.erase(bars.begin(),
               bars.begin() +
                   static_cast<std::ptrdiff_t>(bars.size() - capacity_));
  }
  bars_[asset] = std::move(bars);
}

void BarStore::setSentiment(const std::string& asset, double score) {
  std::unique_lock lock(mutex_);
  sentiment_[asset] = score;
}

void BarStore::clearSentiment(const std::string& asset) {
  std::unique_lock lock(mutex_);
  sentiment_.erase(asset);
}

std::vector<std::string> BarStore::assets() const {
  std::shared_lock lock(mutex_);
  std::vector<std::string> out;
  out.reserve(bars_.size());
  for (const auto& [asset, series] : bars_) {
    out.push_back(asset);
  }
  return out;
}

}  // namespace qfolio
