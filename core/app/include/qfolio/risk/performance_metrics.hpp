#pragma once

#include "qfolio/config/engine_config.hpp"

#include <cstddef>
#include <vector>

namespace qfolio {

// -----------------------------------------------------------------------------
// PerformanceMetrics
// -----------------------------------------------------------------------------
//
// @brief  Summary statistics of a per-period return series.
//
// @details
//   total_return       — Σ r
//   annual_return      — mean(r) · periods_per_year
//   annual_volatility  — stdev(r) · sqrt(periods_per_year)
//   sharpe             — (annual_return - rf) / annual_volatility
//   sortino            — (annual_return - rf) / annualized stdev of r < 0
//   max_drawdown       — largest peak-to-trough fall of Π(1 + r), as a
//                        positive fraction
//   calmar             — annual_return / max_drawdown
//   var_95             — 5th percentile of r (linear interpolation)
//   cvar_95            — mean of r at or below var_95
//
// Ratios whose denominator is 0 are reported as 0.
// -----------------------------------------------------------------------------
struct PerformanceMetrics {
  std::size_t observations{0};
  double total_return{0.0};
  double annual_return{0.0};
  double annual_volatility{0.0};
  double sharpe{0.0};
  double sortino{0.0};
  double max_drawdown{0.0};
  double calmar{0.0};
  double var_95{0.0};
  double cvar_95{0.0};
};

PerformanceMetrics computePerformanceMetrics(const std::vector<double>& returns,
                                             double periods_per_year,
                                             double risk_free_rate = 0.0);

// Picks the configured ratio out of a metrics record.
double performanceScore(const PerformanceMetrics& metrics,
                        PerformanceMetric metric);

// Simple returns of an equity (or price) curve.
std::vector<double> returnsFromCurve(const std::vector<double>& curve);

}  // namespace qfolio
