#pragma once

#include "qfolio/concurrent/order_id_generator.hpp"
#include "qfolio/execution/i_execution_client.hpp"
#include "qfolio/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace qfolio {

// -----------------------------------------------------------------------------
// MockExecutionClient — deterministic paper exchange
// -----------------------------------------------------------------------------
//
// @brief  In-memory IExecutionClient with cash, balances and commission.
//
// @details
// Fill model:
//   - Market orders fill at request.reference_price (no slippage).
//   - fill_ratio (default 1.0) below 1 produces PartiallyFilled with
//     quantity·fill_ratio.
//   - A BUY is capped at what cash can pay for including commission; a SELL
//     at the balance held. A cap that leaves nothing fillable → Rejected.
//   - commission = commission_rate · filled notional, debited from cash.
//
// Scripting for tests:
//   rejectNext(asset)        — the next order for asset is Rejected.
//   failTransiently(n)       — the next n calls to submitOrder() return
//                              TransientFailure without touching state.
//   failCashQueries(n)       — the next n queryCash() calls fail.
//
// Every submitted request is recorded together with the clock's now_ms()
// at submission (submissions()), which is what order-spacing and
// sells-before-buys tests inspect.
//
// Thread model: one mutex around all state.
// -----------------------------------------------------------------------------
class MockExecutionClient final : public IExecutionClient {
 public:
  struct Submission {
    domain::OrderRequest request;
    std::int64_t timestamp_ms{0};
  };

  MockExecutionClient(const ITimeProvider& clock, double commission_rate,
                      double initial_cash);

  Result<domain::OrderFill> submitOrder(
      const domain::OrderRequest& request) override;
  Result<domain::Balances> queryHoldings() override;
  Result<double> queryCash() override;

  void setBalance(const std::string& asset, double quantity);
  void setCash(double cash);
  void setFillRatio(double ratio);
  void rejectNext(const std::string& asset);
  void failTransiently(int count);
  void failCashQueries(int count);

  std::vector<Submission> submissions() const;
  double balance(const std::string& asset) const;

 private:
  const ITimeProvider& clock_;
  const double commission_rate_;
  OrderIdGenerator id_gen_;

  mutable std::mutex mutex_;
  double cash_;
  domain::Balances balances_;
  double fill_ratio_{1.0};
  std::map<std::string, int> pending_rejections_;
  int transient_failures_{0};
  int cash_query_failures_{0};
  std::vector<Submission> submissions_;
};

}  // namespace qfolio
