#pragma once

#include "qfolio/domain/bar.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace qfolio {
namespace series {

// -----------------------------------------------------------------------------
// Small numeric helpers shared by the selection components.
// -----------------------------------------------------------------------------

inline std::vector<double> closes(const domain::PriceSeries& bars) {
  std::vector<double> out;
  out.reserve(bars.size());
  for (const auto& bar : bars) {
    out.push_back(bar.close);
  }
  return out;
}

// Simple returns p[t]/p[t-1] - 1. A non-positive previous price yields 0
// for that step.
inline std::vector<double> simpleReturns(const std::vector<double>& prices) {
  std::vector<double> out;
  if (prices.size() < 2) {
    return out;
  }
  out.reserve(prices.size() - 1);
  for (std::size_t i = 1; i < prices.size(); ++i) {
    const double prev = prices[i - 1];
    out.push_back(prev > 0.0 ? prices[i] / prev - 1.0 : 0.0);
  }
  return out;
}

inline std::vector<double> simpleReturns(const domain::PriceSeries& bars) {
  return simpleReturns(closes(bars));
}

// Last `count` elements (all of them when count >= size).
inline std::vector<double> tail(const std::vector<double>& values,
                                std::size_t count) {
  if (count >= values.size()) {
    return values;
  }
  return std::vector<double>(values.end() - static_cast<std::ptrdiff_t>(count),
                             values.end());
}

inline double mean(const std::vector<double>& values) {
  if (values.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (double v : values) {
    sum += v;
  }
  return sum / static_cast<double>(values.size());
}

// Sample standard deviation (n - 1). 0 for fewer than two values.
inline double stddev(const std::vector<double>& values) {
  if (values.size() < 2) {
    return 0.0;
  }
  const double m = mean(values);
  double acc = 0.0;
  for (double v : values) {
    acc += (v - m) * (v - m);
  }
  return std::sqrt(acc / static_cast<double>(values.size() - 1));
}

inline double clamp(double value, double lo, double hi) {
  return std::max(lo, std::min(hi, value));
}

}  // namespace series
}  // namespace qfolio
