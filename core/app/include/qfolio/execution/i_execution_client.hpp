#pragma once

#include "qfolio/common/result.hpp"
#include "qfolio/domain/order.hpp"

namespace qfolio {

// -----------------------------------------------------------------------------
// IExecutionClient — the exchange as seen by the orchestrator
// -----------------------------------------------------------------------------
//
// @brief  Submits orders and reports balances.
//
// @details
// submitOrder() blocks until the order reaches a terminal state and returns
// it as an OrderFill (Filled, PartiallyFilled or Rejected). Transport
// problems (timeouts, 5xx, dropped connections) are returned as
// ErrorKind::TransientFailure so the retry wrapper can retry them; anything
// else is final.
//
// TransientFailure means the order was definitely not placed: the
// orchestrator resubmits it as-is, with no idempotency key. An
// implementation that cannot tell (a timeout after the request left) must
// look the order up before answering, or return a non-transient error.
//
// Request signing, authentication and transport belong to implementations.
//
// Implementations:
//   MockExecutionClient — deterministic paper exchange (tests, paper mode).
//
// Ownership: owned by the PortfolioEngine's creator; the engine and the
// orchestrator hold references.
// -----------------------------------------------------------------------------
class IExecutionClient {
 public:
  virtual ~IExecutionClient() = default;

  virtual Result<domain::OrderFill> submitOrder(
      const domain::OrderRequest& request) = 0;

  // asset → quantity held on the exchange.
  virtual Result<domain::Balances> queryHoldings() = 0;

  // Free quote-currency balance.
  virtual Result<double> queryCash() = 0;
};

}  // namespace qfolio
