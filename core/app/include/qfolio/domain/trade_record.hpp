#pragma once

#include "qfolio/domain/holding.hpp"
#include "qfolio/domain/order.hpp"

#include <cstdint>
#include <string>

namespace qfolio {
namespace domain {

// -----------------------------------------------------------------------------
// TradeRecord — immutable log entry for one confirmed fill
// -----------------------------------------------------------------------------
//
// @details
// Appended by PortfolioLedger::applyFill() and never modified afterwards.
// The history of these records is what the WashComplianceEngine's state
// store is built from.
//
//   sequence      — ledger-wide monotonic counter, starting at 1.
//   quantity      — filled quantity (not the requested one).
//   realized_pnl  — gross P&L realized by this fill (sells only).
//   net_pnl       — realized_pnl minus this sell's commission and the share
//                   of buy commission attributed to the closed quantity.
//                   This is the round trip's net result. 0 for buys.
//   holding_after — snapshot of the holding after the fill was applied.
// -----------------------------------------------------------------------------
struct TradeRecord {
  std::uint64_t sequence{0};
  OrderId order_id{0};
  std::string asset;
  Side side{Side::Buy};
  double quantity{0.0};
  double price{0.0};
  std::int64_t timestamp_ms{0};
  double commission{0.0};
  double realized_pnl{0.0};
  double net_pnl{0.0};
  Holding holding_after;
};

}  // namespace domain
}  // namespace qfolio
