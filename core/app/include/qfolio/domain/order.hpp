#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace qfolio {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Identifier assigned by the execution client. 0 is reserved as "unset".
// -----------------------------------------------------------------------------
using OrderId = std::uint64_t;

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

enum class OrderType {
  Market,
  Limit,
};

// -----------------------------------------------------------------------------
// OrderStatus — terminal outcome reported by the execution client
// -----------------------------------------------------------------------------
//
// @details
// The rebalancer submits market orders and waits for the final outcome, so
// only terminal states are modelled:
//
//   Filled           — the full requested quantity executed.
//   PartiallyFilled  — some quantity executed; the rest was cancelled.
//                      Holdings are reconciled to filled_quantity.
//   Rejected         — nothing executed.
//
// Transport failures are not an OrderStatus; they surface as a
// TransientFailure error from IExecutionClient::submitOrder().
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Filled,
  PartiallyFilled,
  Rejected,
};

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
// What the orchestrator asks the execution client to do. reference_price is
// the price discovered in stage 1; market orders use it for sizing and the
// paper exchange fills at it.
// -----------------------------------------------------------------------------
struct OrderRequest {
  std::string asset;
  Side side{Side::Buy};
  double quantity{0.0};
  OrderType type{OrderType::Market};
  double reference_price{0.0};
};

// -----------------------------------------------------------------------------
// OrderFill
// -----------------------------------------------------------------------------
// Execution client response: {status, filled_quantity, fill_price, order_id}
// plus the commission charged, so that cash can be reconciled exactly.
// -----------------------------------------------------------------------------
struct OrderFill {
  OrderId order_id{0};
  OrderStatus status{OrderStatus::Rejected};
  double requested_quantity{0.0};
  double filled_quantity{0.0};
  double fill_price{0.0};
  double commission{0.0};
  std::int64_t timestamp_ms{0};
  std::string message;
};

// asset → quantity as reported by the exchange.
using Balances = std::map<std::string, double>;

inline const char* sideToString(Side side) {
  switch (side) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

inline const char* orderTypeToString(OrderType type) {
  switch (type) {
    case OrderType::Market: return "MARKET";
    case OrderType::Limit:  return "LIMIT";
  }
  return "UNKNOWN";
}

inline const char* orderStatusToString(OrderStatus status) {
  switch (status) {
    case OrderStatus::Filled:          return "Filled";
    case OrderStatus::PartiallyFilled: return "PartiallyFilled";
    case OrderStatus::Rejected:        return "Rejected";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace qfolio
