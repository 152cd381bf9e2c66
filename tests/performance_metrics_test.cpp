// =============================================================================
// performance_metrics_test.cpp
// =============================================================================
// Unit tests for qfolio::computePerformanceMetrics() and helpers.
// =============================================================================

#include "qfolio/risk/performance_metrics.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

// -----------------------------------------------------------------------------
// 1. Hand-computed metrics on four periods (periods_per_year = 1).
// -----------------------------------------------------------------------------
TEST(PerformanceMetricsTest, HandComputedSample) {
  const std::vector<double> r{0.10, -0.05, 0.02, -0.01};

  auto m = qfolio::computePerformanceMetrics(r, 1.0);

  EXPECT_EQ(m.observations, 4u);
  EXPECT_NEAR(m.total_return, 0.06, 1e-12);
  EXPECT_NEAR(m.annual_return, 0.015, 1e-12);
  EXPECT_NEAR(m.max_drawdown, 0.05, 1e-12);
  EXPECT_NEAR(m.calmar, 0.3, 1e-9);
  // Downside {-0.05, -0.01}: sample stdev 0.02·√2.
  EXPECT_NEAR(m.sortino, 0.015 / (0.02 * std::sqrt(2.0)), 1e-9);
  EXPECT_NEAR(m.var_95, -0.044, 1e-12);
  EXPECT_NEAR(m.cvar_95, -0.05, 1e-12);
  EXPECT_GT(m.sharpe, 0.0);
}

// -----------------------------------------------------------------------------
// 2. Annualization scales mean linearly and volatility by √periods.
// -----------------------------------------------------------------------------
TEST(PerformanceMetricsTest, AnnualizationScaling) {
  const std::vector<double> r{0.01, -0.01, 0.02, 0.0};

  auto one = qfolio::computePerformanceMetrics(r, 1.0);
  auto hourly = qfolio::computePerformanceMetrics(r, 8760.0);

  EXPECT_NEAR(hourly.annual_return, one.annual_return * 8760.0, 1e-9);
  EXPECT_NEAR(hourly.annual_volatility,
              one.annual_volatility * std::sqrt(8760.0), 1e-9);
  EXPECT_NEAR(hourly.sharpe, one.sharpe * std::sqrt(8760.0), 1e-9);
}

// -----------------------------------------------------------------------------
// 3. Zero denominators give 0 rather than inf/NaN.
// -----------------------------------------------------------------------------
TEST(PerformanceMetricsTest, ZeroDenominatorsReportZero) {
  auto gains = qfolio::computePerformanceMetrics({0.01, 0.02, 0.03}, 365.0);
  EXPECT_DOUBLE_EQ(gains.sortino, 0.0);
  EXPECT_DOUBLE_EQ(gains.max_drawdown, 0.0);
  EXPECT_DOUBLE_EQ(gains.calmar, 0.0);

  auto flat = qfolio::computePerformanceMetrics({0.0, 0.0}, 365.0);
  EXPECT_DOUBLE_EQ(flat.sharpe, 0.0);

  auto empty = qfolio::computePerformanceMetrics({}, 365.0);
  EXPECT_EQ(empty.observations, 0u);
  EXPECT_DOUBLE_EQ(empty.total_return, 0.0);
}

// -----------------------------------------------------------------------------
// 4. Curve → returns, and ratio selection.
// -----------------------------------------------------------------------------
TEST(PerformanceMetricsTest, CurveReturnsAndScoreSelection) {
  auto r = qfolio::returnsFromCurve({100.0, 110.0, 99.0});
  ASSERT_EQ(r.size(), 2u);
  EXPECT_NEAR(r[0], 0.10, 1e-12);
  EXPECT_NEAR(r[1], -0.10, 1e-12);

  qfolio::PerformanceMetrics m;
  m.sortino = 1.5;
  m.sharpe = 0.7;
  m.calmar = 2.0;
  EXPECT_DOUBLE_EQ(
      qfolio::performanceScore(m, qfolio::PerformanceMetric::Sortino), 1.5);
  EXPECT_DOUBLE_EQ(
      qfolio::performanceScore(m, qfolio::PerformanceMetric::Sharpe), 0.7);
  EXPECT_DOUBLE_EQ(
      qfolio::performanceScore(m, qfolio::PerformanceMetric::Calmar), 2.0);
}
