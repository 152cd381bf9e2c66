#include "qfolio/selection/alpha_scorer.hpp"
#include "qfolio/selection/series_math.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace qfolio {

namespace {

// p[-1] / p[-1 - window] - 1
double trailingReturn(const std::vector<double>& prices, std::size_t window) {
  const double last = prices.back();
  const double base = prices[prices.size() - 1 - window];
  return base > 0.0 ? last / base - 1.0 : 0.0;
}

}  // namespace

AlphaScorer::AlphaScorer(AlphaConfig config) : config_(std::move(config)) {}

bool AlphaScorer::eligible(const domain::PriceSeries& bars) const {
  return bars.size() > config_.long_window &&
         bars.size() >= config_.moving_average_window;
}

// -----------------------------------------------------------------------------
// rawScore(): weighted factor blend before normalization
// -----------------------------------------------------------------------------
double AlphaScorer::rawScore(const domain::PriceSeries& bars,
                             double sentiment) const {
  const auto prices = series::closes(bars);
  const double p = prices.back();

  const double momentum = trailingReturn(prices, config_.short_window) -
                          trailingReturn(prices, config_.long_window);

  const double ma =
      series::mean(series::tail(prices, config_.moving_average_window));
  const double mean_reversion =
      p > 0.0 ? config_.mean_reversion_scale * (ma - p) / p : 0.0;

  const double s = series::clamp(sentiment, -1.0, 1.0);

  return config_.momentum_weight * momentum +
         config_.mean_reversion_weight * mean_reversion +
         config_.sentiment_weight * s;
}

// -----------------------------------------------------------------------------
// score(): raw blend → z-score → scale by max |z|
// -----------------------------------------------------------------------------
Result<domain::AlphaVector> AlphaScorer::score(
    const domain::MarketSnapshot& snapshot,
    const domain::SentimentScores& sentiment) const {
  domain::AlphaVector out;

  for (const auto& [asset, bars] : snapshot) {
    if (!eligible(bars)) {
      continue;
    }
    auto it = sentiment.find(asset);
    const double s = (it != sentiment.end() && std::isfinite(it->second))
                         ? it->second
                         : 0.0;
    out.assets.push_back(asset);
    out.scores.push_back(rawScore(bars, s));
  }

  if (out.empty()) {
    return makeError(
        ErrorKind::EmptyUniverse, "no asset has enough history for alpha",
        "alpha", {},
        {{"long_window", static_cast<double>(config_.long_window)},
         {"assets", static_cast<double>(snapshot.size())}});
  }

  const double m = series::mean(out.scores);
  double sd = 0.0;
  for (double v : out.scores) {
    sd += (v - m) * (v - m);
  }
  sd = std::sqrt(sd / static_cast<double>(out.scores.size()));

  if (sd < 1e-12) {
    std::fill(out.scores.begin(), out.scores.end(), 0.0);
    return out;
  }

  double max_abs = 0.0;
  for (double& v : out.scores) {
    v = (v - m) / sd;
    max_abs = std::max(max_abs, std::abs(v));
  }
  for (double& v : out.scores) {
    v /= max_abs;
  }
  return out;
}

}  // namespace qfolio
