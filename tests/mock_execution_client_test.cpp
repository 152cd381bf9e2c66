// =============================================================================
// mock_execution_client_test.cpp
// =============================================================================
// Unit tests for qfolio::MockExecutionClient, the paper exchange.
//
// Validates:
//   - Fills at the reference price with commission debited from cash
//   - Buys capped by cash, sells by balance → PartiallyFilled / Rejected
//   - Scripted rejections, transient failures and cash-query failures
//   - Submission log with timestamps
// =============================================================================

#include "qfolio/execution/mock_execution_client.hpp"
#include "qfolio/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

using qfolio::domain::OrderStatus;
using qfolio::domain::Side;

class MockExecutionClientTest : public ::testing::Test {
 protected:
  qfolio::SimulationTimeProvider clock{1704067200000};

  static qfolio::domain::OrderRequest order(const std::string& asset,
                                            Side side, double qty,
                                            double price) {
    qfolio::domain::OrderRequest r;
    r.asset = asset;
    r.side = side;
    r.quantity = qty;
    r.reference_price = price;
    return r;
  }
};

// -----------------------------------------------------------------------------
// 1. A buy fills in full at the reference price.
// -----------------------------------------------------------------------------
TEST_F(MockExecutionClientTest, BuyFillsAtReferencePrice) {
  qfolio::MockExecutionClient client(clock, 0.001, 1000.0);

  auto fill = client.submitOrder(order("BTC", Side::Buy, 2.0, 100.0));
  ASSERT_TRUE(fill.ok());

  EXPECT_EQ(fill.value().status, OrderStatus::Filled);
  EXPECT_EQ(fill.value().order_id, 1u);
  EXPECT_DOUBLE_EQ(fill.value().filled_quantity, 2.0);
  EXPECT_DOUBLE_EQ(fill.value().fill_price, 100.0);
  EXPECT_NEAR(fill.value().commission, 0.2, 1e-12);
  EXPECT_NEAR(client.queryCash().value(), 1000.0 - 200.2, 1e-9);
  EXPECT_DOUBLE_EQ(client.balance("BTC"), 2.0);
  EXPECT_DOUBLE_EQ(client.queryHoldings().value().at("BTC"), 2.0);
}

// -----------------------------------------------------------------------------
// 2. Cash and balance caps.
// -----------------------------------------------------------------------------
TEST_F(MockExecutionClientTest, CapsByCashAndBalance) {
  qfolio::MockExecutionClient client(clock, 0.0, 150.0);

  auto buy = client.submitOrder(order("ETH", Side::Buy, 2.0, 100.0));
  ASSERT_TRUE(buy.ok());
  EXPECT_EQ(buy.value().status, OrderStatus::PartiallyFilled);
  EXPECT_NEAR(buy.value().filled_quantity, 1.5, 1e-12);
  EXPECT_NEAR(client.queryCash().value(), 0.0, 1e-9);

  auto sell = client.submitOrder(order("ETH", Side::Sell, 5.0, 100.0));
  ASSERT_TRUE(sell.ok());
  EXPECT_EQ(sell.value().status, OrderStatus::PartiallyFilled);
  EXPECT_NEAR(sell.value().filled_quantity, 1.5, 1e-12);

  auto nothing = client.submitOrder(order("ETH", Side::Sell, 1.0, 100.0));
  ASSERT_TRUE(nothing.ok());
  EXPECT_EQ(nothing.value().status, OrderStatus::Rejected);
  EXPECT_EQ(nothing.value().message, "insufficient balance");
}

// -----------------------------------------------------------------------------
// 3. fill_ratio produces partial fills.
// -----------------------------------------------------------------------------
TEST_F(MockExecutionClientTest, FillRatioPartiallyFills) {
  qfolio::MockExecutionClient client(clock, 0.0, 1000.0);
  client.setFillRatio(0.5);

  auto fill = client.submitOrder(order("SOL", Side::Buy, 4.0, 10.0));
  ASSERT_TRUE(fill.ok());
  EXPECT_EQ(fill.value().status, OrderStatus::PartiallyFilled);
  EXPECT_DOUBLE_EQ(fill.value().filled_quantity, 2.0);
  EXPECT_DOUBLE_EQ(fill.value().requested_quantity, 4.0);
}

// -----------------------------------------------------------------------------
// 4. Scripted failures.
//
// Why: transient errors must not touch state or the submission log, so a
// retried order is submitted exactly once.
// -----------------------------------------------------------------------------
TEST_F(MockExecutionClientTest, ScriptedFailures) {
  qfolio::MockExecutionClient client(clock, 0.0, 1000.0);

  client.rejectNext("ADA");
  auto rejected = client.submitOrder(order("ADA", Side::Buy, 1.0, 1.0));
  ASSERT_TRUE(rejected.ok());
  EXPECT_EQ(rejected.value().status, OrderStatus::Rejected);
  auto next = client.submitOrder(order("ADA", Side::Buy, 1.0, 1.0));
  EXPECT_EQ(next.value().status, OrderStatus::Filled);

  client.failTransiently(1);
  auto transient = client.submitOrder(order("ADA", Side::Buy, 1.0, 1.0));
  ASSERT_FALSE(transient.ok());
  EXPECT_EQ(transient.error().kind, qfolio::ErrorKind::TransientFailure);
  EXPECT_EQ(client.submissions().size(), 2u);

  client.failCashQueries(1);
  EXPECT_FALSE(client.queryCash().ok());
  EXPECT_TRUE(client.queryCash().ok());
}

// -----------------------------------------------------------------------------
// 5. Every accepted submission is logged with the clock time.
// -----------------------------------------------------------------------------
TEST_F(MockExecutionClientTest, SubmissionLogCarriesTimestamps) {
  qfolio::MockExecutionClient client(clock, 0.0, 1000.0);
  client.setBalance("BTC", 1.0);

  client.submitOrder(order("BTC", Side::Sell, 1.0, 100.0));
  clock.advance_by(300);
  client.submitOrder(order("ETH", Side::Buy, 1.0, 50.0));

  auto log = client.submissions();
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(log[0].request.side, Side::Sell);
  EXPECT_EQ(log[1].timestamp_ms - log[0].timestamp_ms, 300);
}
