// =============================================================================
// retry_policy_test.cpp
// =============================================================================
// Unit tests for qfolio::withRetry() and qfolio::OrderRateLimiter.
//
// Validates:
//   - Only TransientFailure is retried
//   - Exponential backoff schedule, capped at max_backoff_ms
//   - Attempt limit and total time budget; attempts recorded on the error
//   - Order spacing: first order free, later ones wait out the interval
//
// Design: SimulationTimeProvider turns every wait into a clock jump, so the
// schedule is asserted from the clock and nothing sleeps.
// =============================================================================

#include "qfolio/execution/order_rate_limiter.hpp"
#include "qfolio/execution/retry_policy.hpp"
#include "qfolio/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

class RetryPolicyTest : public ::testing::Test {
 protected:
  static constexpr std::int64_t kStart = 1704067200000;

  qfolio::SimulationTimeProvider clock{kStart};
  qfolio::RetryConfig config;
  int calls = 0;

  // Fails transiently `failures` times, then returns 42.
  std::function<qfolio::Result<int>()> flaky(int failures) {
    return [this, failures]() -> qfolio::Result<int> {
      ++calls;
      if (calls <= failures) {
        return qfolio::makeError(qfolio::ErrorKind::TransientFailure,
                                 "timeout", "test");
      }
      return 42;
    };
  }
};

// -----------------------------------------------------------------------------
// 1. Success on the first attempt costs nothing.
// -----------------------------------------------------------------------------
TEST_F(RetryPolicyTest, FirstAttemptSuccess) {
  auto r = qfolio::withRetry<int>(config, clock, "op", flaky(0));

  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.value(), 42);
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(clock.now_ms(), kStart);
}

// -----------------------------------------------------------------------------
// 2. Two transient failures: waits 200 then 400 ms, third call succeeds.
// -----------------------------------------------------------------------------
TEST_F(RetryPolicyTest, BacksOffExponentially) {
  auto r = qfolio::withRetry<int>(config, clock, "op", flaky(2));

  ASSERT_TRUE(r.ok());
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(clock.now_ms(), kStart + 200 + 400);
}

// -----------------------------------------------------------------------------
// 3. Out of attempts: last error returned with the attempt count.
// -----------------------------------------------------------------------------
TEST_F(RetryPolicyTest, GivesUpAfterMaxAttempts) {
  auto r = qfolio::withRetry<int>(config, clock, "op", flaky(100));

  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.error().kind, qfolio::ErrorKind::TransientFailure);
  EXPECT_EQ(calls, config.max_attempts);
  EXPECT_DOUBLE_EQ(r.error().inputs.at("attempts"), 3.0);
  EXPECT_DOUBLE_EQ(r.error().inputs.at("elapsed_ms"), 600.0);
}

// -----------------------------------------------------------------------------
// 4. Business errors are final on the first attempt.
// -----------------------------------------------------------------------------
TEST_F(RetryPolicyTest, NonTransientIsNotRetried) {
  std::function<qfolio::Result<int>()> blocked = [this]() -> qfolio::Result<int> {
    ++calls;
    return qfolio::makeError(qfolio::ErrorKind::PriceUnavailable, "no price",
                             "price_discovery", "BTC");
  };

  auto r = qfolio::withRetry<int>(config, clock, "op", blocked);

  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.error().kind, qfolio::ErrorKind::PriceUnavailable);
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(clock.now_ms(), kStart);
}

// -----------------------------------------------------------------------------
// 5. A retry whose wait would overrun the budget is skipped.
// -----------------------------------------------------------------------------
TEST_F(RetryPolicyTest, TotalBudgetStopsRetries) {
  config.max_attempts = 10;
  config.total_budget_ms = 500;

  auto r = qfolio::withRetry<int>(config, clock, "op", flaky(100));

  ASSERT_FALSE(r.ok());
  // 200 ms fits, the following 400 ms would end at 600 > 500.
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(clock.now_ms(), kStart + 200);
}

// -----------------------------------------------------------------------------
// 6. Individual waits never exceed max_backoff_ms.
// -----------------------------------------------------------------------------
TEST_F(RetryPolicyTest, BackoffIsCapped) {
  config.initial_backoff_ms = 1000;
  config.backoff_multiplier = 10.0;
  config.max_backoff_ms = 1500;

  auto r = qfolio::withRetry<int>(config, clock, "op", flaky(2));

  ASSERT_TRUE(r.ok());
  EXPECT_EQ(clock.now_ms(), kStart + 1000 + 1500);
}

// -----------------------------------------------------------------------------
// 7. Orders are spaced at least min_interval_ms apart.
// -----------------------------------------------------------------------------
TEST_F(RetryPolicyTest, RateLimiterSpacesOrders) {
  qfolio::OrderRateLimiter limiter(clock, 300);

  EXPECT_EQ(limiter.acquire(), 0);
  EXPECT_EQ(limiter.acquire(), 300);
  EXPECT_EQ(clock.now_ms(), kStart + 300);

  clock.advance_by(500);
  EXPECT_EQ(limiter.acquire(), 0);

  clock.advance_by(100);
  EXPECT_EQ(limiter.acquire(), 200);
  EXPECT_EQ(clock.now_ms(), kStart + 300 + 500 + 300);
}
