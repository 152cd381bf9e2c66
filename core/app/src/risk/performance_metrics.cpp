#include "qfolio/risk/performance_metrics.hpp"
#include "qfolio/selection/series_math.hpp"

#include <algorithm>
#include <cmath>

namespace qfolio {

PerformanceMetrics computePerformanceMetrics(const std::vector<double>& returns,
                                             double periods_per_year,
                                             double risk_free_rate) {
  PerformanceMetrics m;
  m.observations = returns.size();
  if (returns.empty()) {
    return m;
  }

  const double sqrt_periods = std::sqrt(periods_per_year);

  for (double r : returns) {
    m.total_return += r;
  }
  m.annual_return = series::mean(returns) * periods_per_year;
  m.annual_volatility = series::stddev(returns) * sqrt_periods;

  if (m.annual_volatility > 0.0) {
    m.sharpe = (m.annual_return - risk_free_rate) / m.annual_volatility;
  }

  std::vector<double> downside;
  for (double r : returns) {
    if (r < 0.0) {
      downside.push_back(r);
    }
  }
  const double downside_dev = series::stddev(downside) * sqrt_periods;
  if (downside_dev > 0.0) {
    m.sortino = (m.annual_return - risk_free_rate) / downside_dev;
  }

  double wealth = 1.0;
  double peak = 1.0;
  for (double r : returns) {
    wealth *= (1.0 + r);
    peak = std::max(peak, wealth);
    if (peak > 0.0) {
      m.max_drawdown = std::max(m.max_drawdown, (peak - wealth) / peak);
    }
  }
  if (m.max_drawdown > 0.0) {
    m.calmar = m.annual_return / m.max_drawdown;
  }

  std::vector<double> sorted = returns;
  std::sort(sorted.begin(), sorted.end());
  const double pos = 0.05 * static_cast<double>(sorted.size() - 1);
  const auto lo = static_cast<std::size_t>(std::floor(pos));
  const std::size_t hi = std::min(lo + 1, sorted.size() - 1);
  m.var_95 = sorted[lo] + (pos - static_cast<double>(lo)) *
                              (sorted[hi] - sorted[lo]);

  double tail_sum = 0.0;
  std::size_t tail_count = 0;
  for (double r : sorted) {
    if (r > m.var_95) {
      break;
    }
    tail_sum += r;
    ++tail_count;
  }
  m.cvar_95 = tail_count > 0 ? tail_sum / static_cast<double>(tail_count)
                             : m.var_95;
  return m;
}

double performanceScore(const PerformanceMetrics& metrics,
                        PerformanceMetric metric) {
  switch (metric) {
    case PerformanceMetric::Sortino: return metrics.sortino;
    case PerformanceMetric::Sharpe:  return metrics.sharpe;
    case PerformanceMetric::Calmar:  return metrics.calmar;
  }
  return 0.0;
}

std::vector<double> returnsFromCurve(const std::vector<double>& curve) {
  return series::simpleReturns(curve);
}

}  // namespace qfolio
