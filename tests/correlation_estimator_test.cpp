// =============================================================================
// correlation_estimator_test.cpp
// =============================================================================
// Unit tests for qfolio::CorrelationEstimator.
// =============================================================================

#include "qfolio/selection/correlation_estimator.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <vector>

using qfolio_test::makeSeries;
using qfolio_test::randomWalk;
using qfolio_test::steadyTrend;
using qfolio_test::zigzag;

class CorrelationEstimatorTest : public ::testing::Test {
 protected:
  qfolio::CorrelationConfig config;
};

// -----------------------------------------------------------------------------
// 1. Unit diagonal, symmetric, entries in [-1, 1].
// -----------------------------------------------------------------------------
TEST_F(CorrelationEstimatorTest, MatrixIsSymmetricWithUnitDiagonal) {
  qfolio::CorrelationEstimator estimator(config);

  qfolio::domain::MarketSnapshot snapshot;
  std::vector<std::string> assets;
  for (int i = 0; i < 5; ++i) {
    const std::string name = "C" + std::to_string(i);
    snapshot[name] = makeSeries(randomWalk(80, 11 + i, 0.0, 0.02));
    assets.push_back(name);
  }

  auto rho = estimator.estimate(snapshot, assets);
  ASSERT_TRUE(rho.ok());
  const auto& m = rho.value();
  ASSERT_EQ(m.size(), 5u);
  for (std::size_t i = 0; i < 5; ++i) {
    EXPECT_DOUBLE_EQ(m(i, i), 1.0);
    for (std::size_t j = 0; j < 5; ++j) {
      EXPECT_DOUBLE_EQ(m(i, j), m(j, i));
      EXPECT_GE(m(i, j), -1.0);
      EXPECT_LE(m(i, j), 1.0);
    }
  }
}

// -----------------------------------------------------------------------------
// 2. Same returns → +1; returns in opposite phase → -1.
// -----------------------------------------------------------------------------
TEST_F(CorrelationEstimatorTest, PerfectAndInverseCorrelation) {
  qfolio::CorrelationEstimator estimator(config);

  auto base = zigzag(100, 0.02);
  auto shifted = zigzag(101, 0.02);
  shifted.erase(shifted.begin());

  qfolio::domain::MarketSnapshot snapshot{
      {"A", makeSeries(base)},
      {"A2", makeSeries(base)},
      {"B", makeSeries(shifted)}};

  auto rho = estimator.estimate(snapshot, {"A", "A2", "B"});
  ASSERT_TRUE(rho.ok());
  EXPECT_NEAR(rho.value()(0, 1), 1.0, 1e-9);
  EXPECT_NEAR(rho.value()(0, 2), -1.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 3. A constant series has no variance; its correlations are 0.
// -----------------------------------------------------------------------------
TEST_F(CorrelationEstimatorTest, ConstantSeriesIsUncorrelated) {
  qfolio::CorrelationEstimator estimator(config);

  qfolio::domain::MarketSnapshot snapshot{
      {"FLAT", makeSeries(steadyTrend(60, 0.0))},
      {"MOVE", makeSeries(randomWalk(60, 3, 0.0, 0.02))}};

  auto rho = estimator.estimate(snapshot, {"FLAT", "MOVE"});
  ASSERT_TRUE(rho.ok());
  EXPECT_DOUBLE_EQ(rho.value()(0, 1), 0.0);
}

// -----------------------------------------------------------------------------
// 4. Errors: unknown asset, too few aligned returns.
// -----------------------------------------------------------------------------
TEST_F(CorrelationEstimatorTest, ReportsMissingAndShortSeries) {
  qfolio::CorrelationEstimator estimator(config);

  qfolio::domain::MarketSnapshot snapshot{
      {"LONG", makeSeries(randomWalk(60, 1, 0.0, 0.02))},
      {"SHORT", makeSeries(randomWalk(5, 2, 0.0, 0.02))}};

  auto missing = estimator.estimate(snapshot, {"LONG", "GHOST"});
  ASSERT_FALSE(missing.ok());
  EXPECT_EQ(missing.error().kind, qfolio::ErrorKind::InvalidInput);
  EXPECT_EQ(missing.error().asset, "GHOST");

  auto shorty = estimator.estimate(snapshot, {"LONG", "SHORT"});
  ASSERT_FALSE(shorty.ok());
  EXPECT_EQ(shorty.error().kind, qfolio::ErrorKind::InsufficientHistory);
}
