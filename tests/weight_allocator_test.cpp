// =============================================================================
// weight_allocator_test.cpp
// =============================================================================
// Unit tests for qfolio::WeightAllocator.
//
// Validates:
//   - Weights of the selected assets sum to 1 and respect the bounds;
//     unselected assets carry 0
//   - Infeasible bounds are relaxed to 1/k
//   - Lower-tail-risk assets receive more weight
//   - Empirical CVaR including the fractional tail observation
//   - Projection onto the bounded simplex
//   - Degenerate inputs → DegenerateSelection; equalWeights() fallback
//   - No return periods is degenerate even with min_observations 0
// =============================================================================

#include "qfolio/selection/weight_allocator.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <numeric>
#include <utility>
#include <string>
#include <vector>

using qfolio_test::makeSeries;
using qfolio_test::randomWalk;
using qfolio_test::steadyTrend;

class WeightAllocatorTest : public ::testing::Test {
 protected:
  qfolio::AllocatorConfig config;
  qfolio::domain::MarketSnapshot snapshot;

  void SetUp() override {
    for (int i = 0; i < 5; ++i) {
      snapshot["W" + std::to_string(i)] =
          makeSeries(randomWalk(100, 50 + i, 0.0, 0.01 + 0.005 * i));
    }
  }

  qfolio::domain::Selection select(std::vector<std::uint8_t> bits) {
    qfolio::domain::Selection s;
    for (const auto& [asset, bars] : snapshot) {
      s.assets.push_back(asset);
    }
    s.bits = std::move(bits);
    return s;
  }

  static double sum(const qfolio::domain::TargetWeights& w) {
    double total = 0.0;
    for (const auto& [asset, weight] : w) {
      total += weight;
    }
    return total;
  }
};

// -----------------------------------------------------------------------------
// 1. Σw = 1, bounds hold, unselected assets are present with weight 0.
// -----------------------------------------------------------------------------
TEST_F(WeightAllocatorTest, WeightsFormBoundedSimplex) {
  qfolio::WeightAllocator allocator(config);

  auto result = allocator.allocate(select({1, 1, 0, 1, 1}), snapshot);
  ASSERT_TRUE(result.ok()) << qfolio::describe(result.error());

  const auto& w = result.value().weights;
  ASSERT_EQ(w.size(), 5u);
  EXPECT_NEAR(sum(w), 1.0, 1e-9);
  EXPECT_DOUBLE_EQ(w.at("W2"), 0.0);
  for (const auto& asset : {"W0", "W1", "W3", "W4"}) {
    EXPECT_GE(w.at(asset), config.min_weight - 1e-9) << asset;
    EXPECT_LE(w.at(asset), config.max_weight + 1e-9) << asset;
  }
  EXPECT_FALSE(result.value().bounds_relaxed);
  EXPECT_EQ(result.value().observations, 99u);
  EXPECT_GE(result.value().cvar, -1.0);
}

// -----------------------------------------------------------------------------
// 2. Two assets with max_weight 0.4 cannot sum to 1: max rises to 1/2.
// -----------------------------------------------------------------------------
TEST_F(WeightAllocatorTest, InfeasibleBoundsAreRelaxed) {
  qfolio::WeightAllocator allocator(config);

  auto result = allocator.allocate(select({1, 1, 0, 0, 0}), snapshot);
  ASSERT_TRUE(result.ok());

  EXPECT_TRUE(result.value().bounds_relaxed);
  EXPECT_DOUBLE_EQ(result.value().max_weight, 0.5);
  EXPECT_NEAR(result.value().weights.at("W0"), 0.5, 1e-9);
  EXPECT_NEAR(result.value().weights.at("W1"), 0.5, 1e-9);
}

// -----------------------------------------------------------------------------
// 3. The calmer asset gets the larger weight.
//
// Why: the objective is dominated by CVaR when risk aversion is high.
// -----------------------------------------------------------------------------
TEST_F(WeightAllocatorTest, PrefersLowerTailRisk) {
  config.max_weight = 0.95;
  config.min_weight = 0.05;
  config.risk_aversion = 10.0;
  qfolio::WeightAllocator allocator(config);

  qfolio::domain::MarketSnapshot pair{
      {"CALM", makeSeries(randomWalk(200, 1, 0.0, 0.002))},
      {"WILD", makeSeries(randomWalk(200, 2, 0.0, 0.05))}};
  qfolio::domain::Selection sel{{"CALM", "WILD"}, {1, 1}, 0.0};

  auto result = allocator.allocate(sel, pair);
  ASSERT_TRUE(result.ok());
  EXPECT_GT(result.value().weights.at("CALM"),
            result.value().weights.at("WILD"));
  EXPECT_GT(result.value().iterations, 0u);
}

// -----------------------------------------------------------------------------
// 4. A single selected asset takes everything.
// -----------------------------------------------------------------------------
TEST_F(WeightAllocatorTest, SingleAssetGetsFullWeight) {
  qfolio::WeightAllocator allocator(config);

  auto result = allocator.allocate(select({0, 0, 0, 1, 0}), snapshot);
  ASSERT_TRUE(result.ok());
  EXPECT_DOUBLE_EQ(result.value().weights.at("W3"), 1.0);
  EXPECT_NEAR(sum(result.value().weights), 1.0, 1e-12);
}

// -----------------------------------------------------------------------------
// 5. CVaR on a hand-checked sample.
// -----------------------------------------------------------------------------
TEST_F(WeightAllocatorTest, EmpiricalCvar) {
  const std::vector<std::vector<double>> returns{
      {-0.10}, {0.0}, {0.05}, {0.02}};
  const std::vector<double> w{1.0};

  // q = 2: mean of the two largest losses {0.10, 0.0}.
  EXPECT_NEAR(qfolio::WeightAllocator::cvar(returns, w, 0.5), 0.05, 1e-12);
  // q = 1: worst loss only.
  EXPECT_NEAR(qfolio::WeightAllocator::cvar(returns, w, 0.75), 0.10, 1e-12);
  // q = 1.5: (0.10 + 0.5·0.0) / 1.5.
  EXPECT_NEAR(qfolio::WeightAllocator::cvar(returns, w, 0.625), 0.10 / 1.5,
              1e-12);
}

// -----------------------------------------------------------------------------
// 6. Projection onto {Σw = 1, lo ≤ w ≤ hi}.
// -----------------------------------------------------------------------------
TEST_F(WeightAllocatorTest, ProjectsOntoBoundedSimplex) {
  auto even = qfolio::WeightAllocator::projectBoundedSimplex(
      {0.5, 0.5, 0.5}, 0.0, 1.0);
  for (double x : even) {
    EXPECT_NEAR(x, 1.0 / 3.0, 1e-9);
  }

  auto capped = qfolio::WeightAllocator::projectBoundedSimplex(
      {1.0, 0.0, 0.0}, 0.1, 0.6);
  EXPECT_NEAR(capped[0], 0.6, 1e-9);
  EXPECT_NEAR(capped[1], 0.2, 1e-9);
  EXPECT_NEAR(capped[2], 0.2, 1e-9);
  EXPECT_NEAR(std::accumulate(capped.begin(), capped.end(), 0.0), 1.0, 1e-12);
}

// -----------------------------------------------------------------------------
// 7. Degenerate inputs are reported; equalWeights() is the fallback.
// -----------------------------------------------------------------------------
TEST_F(WeightAllocatorTest, DegenerateInputs) {
  qfolio::WeightAllocator allocator(config);

  auto none = allocator.allocate(select({0, 0, 0, 0, 0}), snapshot);
  ASSERT_FALSE(none.ok());
  EXPECT_EQ(none.error().kind, qfolio::ErrorKind::DegenerateSelection);

  qfolio::domain::MarketSnapshot flat{
      {"F1", makeSeries(steadyTrend(50, 0.0))},
      {"F2", makeSeries(steadyTrend(50, 0.0, 20.0))}};
  qfolio::domain::Selection both{{"F1", "F2"}, {1, 1}, 0.0};
  auto identical = allocator.allocate(both, flat);
  ASSERT_FALSE(identical.ok());
  EXPECT_EQ(identical.error().kind, qfolio::ErrorKind::DegenerateSelection);

  qfolio::domain::MarketSnapshot shorty{
      {"F1", makeSeries(randomWalk(5, 1, 0.0, 0.02))},
      {"F2", makeSeries(randomWalk(50, 2, 0.0, 0.02))}};
  auto too_short = allocator.allocate(both, shorty);
  ASSERT_FALSE(too_short.ok());
  EXPECT_EQ(too_short.error().kind, qfolio::ErrorKind::DegenerateSelection);

  auto fallback = qfolio::WeightAllocator::equalWeights(select({1, 0, 1, 0, 1}));
  EXPECT_NEAR(fallback.at("W0"), 1.0 / 3.0, 1e-12);
  EXPECT_DOUBLE_EQ(fallback.at("W1"), 0.0);
  EXPECT_NEAR(sum(fallback), 1.0, 1e-12);
}

// -----------------------------------------------------------------------------
// 8. One bar per asset leaves no returns at all.
//
// Why: min_observations 0 would otherwise let the empty history through.
// -----------------------------------------------------------------------------
TEST_F(WeightAllocatorTest, NoReturnPeriodsIsDegenerate) {
  config.min_observations = 0;
  qfolio::WeightAllocator allocator(config);

  qfolio::domain::MarketSnapshot single_bar{{"A", makeSeries({100.0})},
                                            {"B", makeSeries({50.0})}};
  qfolio::domain::Selection both{{"A", "B"}, {1, 1}, 0.0};

  auto result = allocator.allocate(both, single_bar);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().kind, qfolio::ErrorKind::DegenerateSelection);
}
