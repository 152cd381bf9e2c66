#include "qfolio/execution/mock_execution_client.hpp"

#include <algorithm>

namespace qfolio {

MockExecutionClient::MockExecutionClient(const ITimeProvider& clock,
                                         double commission_rate,
                                         double initial_cash)
    : clock_(clock), commission_rate_(commission_rate), cash_(initial_cash) {}

// -----------------------------------------------------------------------------
// submitOrder(): scripted failures first, then the fill model
// -----------------------------------------------------------------------------
Result<domain::OrderFill> MockExecutionClient::submitOrder(
    const domain::OrderRequest& request) {
  std::lock_guard lock(mutex_);
  const std::int64_t now = clock_.now_ms();

  if (transient_failures_ > 0) {
    --transient_failures_;
    return makeError(ErrorKind::TransientFailure, "simulated timeout",
                     "execution", request.asset);
  }

  submissions_.push_back(Submission{request, now});

  domain::OrderFill fill;
  fill.order_id = id_gen_.next_id();
  fill.requested_quantity = request.quantity;
  fill.timestamp_ms = now;
  fill.fill_price = request.reference_price;

  auto rejection = pending_rejections_.find(request.asset);
  if (rejection != pending_rejections_.end() && rejection->second > 0) {
    if (--rejection->second == 0) {
      pending_rejections_.erase(rejection);
    }
    fill.status = domain::OrderStatus::Rejected;
    fill.message = "rejected by exchange";
    return fill;
  }

  if (request.quantity <= 0.0 || request.reference_price <= 0.0) {
    fill.status = domain::OrderStatus::Rejected;
    fill.message = "invalid quantity or price";
    return fill;
  }

  double qty = request.quantity * fill_ratio_;
  const double price = request.reference_price;

  if (request.side == domain::Side::Buy) {
    const double affordable =
        std::max(cash_, 0.0) / (price * (1.0 + commission_rate_));
    qty = std::min(qty, affordable);
  } else {
    qty = std::min(qty, balances_[request.asset]);
  }

  if (qty <= 0.0) {
    fill.status = domain::OrderStatus::Rejected;
    fill.message = request.side == domain::Side::Buy ? "insufficient cash"
                                                     : "insufficient balance";
    return fill;
  }

  const double notional = qty * price;
  fill.filled_quantity = qty;
  fill.commission = notional * commission_rate_;
  fill.status = qty < request.quantity ? domain::OrderStatus::PartiallyFilled
                                       : domain::OrderStatus::Filled;

  if (request.side == domain::Side::Buy) {
    cash_ -= notional + fill.commission;
    balances_[request.asset] += qty;
  } else {
    cash_ += notional - fill.commission;
    balances_[request.asset] -= qty;
  }
  return fill;
}

Result<domain::Balances> MockExecutionClient::queryHoldings() {
  std::lock_guard lock(mutex_);
  domain::Balances out;
  for (const auto& [asset, qty] : balances_) {
    if (qty > 0.0) {
      out[asset] = qty;
    }
  }
  return out;
}

Result<double> MockExecutionClient::queryCash() {
  std::lock_guard lock(mutex_);
  if (cash_query_failures_ > 0) {
    --cash_query_failures_;
    return makeError(ErrorKind::TransientFailure, "simulated balance timeout",
                     "cash_resync");
  }
  return cash_;
}

void MockExecutionClient::setBalance(const std::string& asset,
                                     double quantity) {
  std::lock_guard lock(mutex_);
  balances_[asset] = quantity;
}

void MockExecutionClient::setCash(double cash) {
  std::lock_guard lock(mutex_);
  cash_ = cash;
}

void MockExecutionClient::setFillRatio(double ratio) {
  std::lock_guard lock(mutex_);
  fill_ratio_ = std::max(0.0, std::min(1.0, ratio));
}

void MockExecutionClient::rejectNext(const std::string& asset) {
  std::lock_guard lock(mutex_);
  ++pending_rejections_[asset];
}

void MockExecutionClient::failTransiently(int count) {
  std::lock_guard lock(mutex_);
  transient_failures_ = count;
}

void MockExecutionClient::failCashQueries(int count) {
  std::lock_guard lock(mutex_);
  cash_query_failures_ = count;
}

std::vector<MockExecutionClient::Submission>
MockExecutionClient::submissions() const {
  std::lock_guard lock(mutex_);
  return submissions_;
}

double MockExecutionClient::balance(const std::string& asset) const {
  std::lock_guard lock(mutex_);
  auto it = balances_.find(asset);
  return it != balances_.end() ? it->second : 0.0;
}

}  // namespace qfolio
