// =============================================================================
// selection_pipeline_test.cpp
// =============================================================================
// Integration tests for qfolio::SelectionPipeline (regime → alpha →
// correlation → QUBO → annealing → repair → weights).
//
// Validates:
//   - Seeded runs are idempotent across pipeline instances
//   - Selection size matches the clamped target; weights form a simplex
//   - Regime fallback to configured defaults
//   - EmptyUniverse propagates; the failing stage is published
//   - DegenerateSelection falls back to equal weights
//   - topByAlpha ranking and tie order
// =============================================================================

#include "qfolio/engine/selection_pipeline.hpp"
#include "qfolio/time/simulation_time_provider.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using qfolio_test::makeSeries;
using qfolio_test::randomWalk;

class SelectionPipelineTest : public ::testing::Test {
 protected:
  qfolio::SimulationTimeProvider clock{qfolio_test::kEpochMs};
  qfolio::EventBus bus;
  qfolio::EngineConfig config;

  std::vector<qfolio::SelectionEvent> selections;
  std::vector<qfolio::WeightsEvent> weights;
  std::vector<qfolio::StageEvent> stages;

  void SetUp() override {
    config.annealer.seed = 7;
    config.annealer.reads = 8;
    config.annealer.steps = 200;
    config.annealer.parallel = false;

    bus.subscribe<qfolio::SelectionEvent>(
        [this](const qfolio::SelectionEvent& e) { selections.push_back(e); });
    bus.subscribe<qfolio::WeightsEvent>(
        [this](const qfolio::WeightsEvent& e) { weights.push_back(e); });
    bus.subscribe<qfolio::StageEvent>(
        [this](const qfolio::StageEvent& e) { stages.push_back(e); });
  }

  // `assets` random walks of `bars` hourly bars, one seed per asset.
  static qfolio::domain::MarketSnapshot market(std::size_t assets,
                                               std::size_t bars) {
    qfolio::domain::MarketSnapshot snapshot;
    for (std::size_t i = 0; i < assets; ++i) {
      const double drift = (static_cast<double>(i) - 5.0) * 0.0004;
      snapshot["A" + std::to_string(10 + i)] =
          makeSeries(randomWalk(bars, 100 + i, drift, 0.01));
    }
    return snapshot;
  }

  static double sum(const qfolio::domain::TargetWeights& w) {
    double s = 0.0;
    for (const auto& [asset, weight] : w) {
      s += weight;
    }
    return s;
  }

  bool stageFailed(const std::string& stage) const {
    for (const auto& e : stages) {
      if (e.stage == stage && !e.ok) {
        return true;
      }
    }
    return false;
  }
};

// -----------------------------------------------------------------------------
// 1. Same inputs, same seed → same selection and weights.
// -----------------------------------------------------------------------------
TEST_F(SelectionPipelineTest, SeededRunIsIdempotent) {
  const auto snapshot = market(12, 100);
  qfolio::SelectionPipeline first(config, bus, clock);
  qfolio::SelectionPipeline second(config, bus, clock);

  auto a = first.run(1, snapshot, {});
  auto b = second.run(1, snapshot, {});
  auto c = first.run(2, snapshot, {});
  ASSERT_TRUE(a.ok()) << qfolio::describe(a.error());
  ASSERT_TRUE(b.ok());
  ASSERT_TRUE(c.ok());

  EXPECT_EQ(a.value().selection.bits, b.value().selection.bits);
  EXPECT_EQ(a.value().selection.bits, c.value().selection.bits);
  for (const auto& [asset, w] : a.value().weights) {
    EXPECT_NEAR(w, b.value().weights.at(asset), 1e-12) << asset;
  }
  EXPECT_EQ(a.value().method, "annealer");
}

// -----------------------------------------------------------------------------
// 2. Selection has exactly the target count and the weights are a bounded
//    simplex over it.
// -----------------------------------------------------------------------------
TEST_F(SelectionPipelineTest, ProducesTargetCountAndSimplex) {
  qfolio::SelectionPipeline pipeline(config, bus, clock);

  auto out = pipeline.run(1, market(12, 100), {});
  ASSERT_TRUE(out.ok()) << qfolio::describe(out.error());
  const auto& o = out.value();

  EXPECT_FALSE(o.regime_fallback);
  EXPECT_GE(o.regime.n, config.regime.min_n);
  EXPECT_LE(o.regime.n, config.regime.max_n);
  EXPECT_EQ(o.target_count, std::min(o.regime.n, 12));
  EXPECT_EQ(o.selection.count(), o.target_count);
  EXPECT_NEAR(sum(o.weights), 1.0, 1e-9);

  for (const auto& asset : o.selection.selectedAssets()) {
    EXPECT_GE(o.weights.at(asset), config.allocator.min_weight - 1e-9);
    EXPECT_LE(o.weights.at(asset), config.allocator.max_weight + 1e-9);
  }
  EXPECT_FALSE(o.equal_weight_fallback);
  ASSERT_TRUE(pipeline.lastRegime().has_value());
  EXPECT_EQ(pipeline.lastRegime()->n, o.regime.n);

  ASSERT_EQ(selections.size(), 1u);
  EXPECT_EQ(selections[0].selection.bits, o.selection.bits);
  ASSERT_EQ(weights.size(), 1u);
  EXPECT_GT(selections[0].penalty, 0.0);
}

// -----------------------------------------------------------------------------
// 3. Regime detection fails → configured defaults, n clamped to the
//    scored universe.
// -----------------------------------------------------------------------------
TEST_F(SelectionPipelineTest, RegimeFallsBackToDefaults) {
  config.regime.min_observations = 500;
  qfolio::SelectionPipeline pipeline(config, bus, clock);

  auto out = pipeline.run(1, market(8, 100), {});
  ASSERT_TRUE(out.ok()) << qfolio::describe(out.error());

  EXPECT_TRUE(out.value().regime_fallback);
  EXPECT_EQ(out.value().regime.n, config.regime.default_n);
  EXPECT_DOUBLE_EQ(out.value().regime.lambda, config.regime.default_lambda);
  EXPECT_EQ(out.value().target_count, 8);
  EXPECT_EQ(out.value().selection.count(), 8);
  EXPECT_FALSE(pipeline.lastRegime().has_value());
}

// -----------------------------------------------------------------------------
// 4. No asset has enough history for alpha → EmptyUniverse.
// -----------------------------------------------------------------------------
TEST_F(SelectionPipelineTest, EmptyUniverseIsReturned) {
  qfolio::SelectionPipeline pipeline(config, bus, clock);

  auto out = pipeline.run(1, market(6, 40), {});
  ASSERT_FALSE(out.ok());
  EXPECT_EQ(out.error().kind, qfolio::ErrorKind::EmptyUniverse);
  EXPECT_TRUE(stageFailed("alpha"));
  EXPECT_TRUE(selections.empty());
}

// -----------------------------------------------------------------------------
// 5. Flat prices: the allocator cannot optimise, equal weights are used.
//
// Why: a flat market yields identical (zero) returns, which the allocator
// reports as DegenerateSelection rather than dividing by zero.
// -----------------------------------------------------------------------------
TEST_F(SelectionPipelineTest, DegenerateAllocationUsesEqualWeights) {
  qfolio::domain::MarketSnapshot flat;
  for (const char* asset : {"AAA", "BBB", "CCC", "DDD", "EEE", "FFF"}) {
    flat[asset] = makeSeries(std::vector<double>(100, 50.0));
  }
  qfolio::SelectionPipeline pipeline(config, bus, clock);

  auto out = pipeline.run(1, flat, {});
  ASSERT_TRUE(out.ok()) << qfolio::describe(out.error());
  const auto& o = out.value();

  EXPECT_EQ(o.regime.n, config.regime.min_n);
  EXPECT_TRUE(o.equal_weight_fallback);
  EXPECT_TRUE(stageFailed("allocation"));
  const double share = 1.0 / o.selection.count();
  for (const auto& asset : o.selection.selectedAssets()) {
    EXPECT_NEAR(o.weights.at(asset), share, 1e-12);
  }
  ASSERT_EQ(weights.size(), 1u);
  EXPECT_TRUE(weights[0].equal_weight_fallback);
}

// -----------------------------------------------------------------------------
// 6. Alpha ranking used when the optimizer is unavailable.
// -----------------------------------------------------------------------------
TEST(SelectionPipelineTopByAlpha, RanksAndBreaksTiesByIndex) {
  qfolio::domain::AlphaVector alpha;
  alpha.assets = {"W", "X", "Y", "Z"};
  alpha.scores = {0.1, 0.5, 0.5, -0.2};

  auto two = qfolio::SelectionPipeline::topByAlpha(alpha, 2);
  EXPECT_EQ(two.selectedAssets(), (std::vector<std::string>{"X", "Y"}));

  auto three = qfolio::SelectionPipeline::topByAlpha(alpha, 3);
  EXPECT_EQ(three.selectedAssets(),
            (std::vector<std::string>{"W", "X", "Y"}));

  EXPECT_EQ(qfolio::SelectionPipeline::topByAlpha(alpha, 0).count(), 0);
  EXPECT_EQ(qfolio::SelectionPipeline::topByAlpha(alpha, 9).count(), 4);
}
