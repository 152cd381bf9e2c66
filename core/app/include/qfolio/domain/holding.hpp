#pragma once

#include <cstdint>
#include <string>

namespace qfolio {
namespace domain {

// -----------------------------------------------------------------------------
// Holding — per-asset position state
// -----------------------------------------------------------------------------
//
// @brief  Quantity held, weighted-average entry price, entry time and the
//         realized P&L basis for one asset.
//
// @details
// The portfolio is long-only (spot). quantity is never negative.
//
//   average_entry_price — weighted average cost of the open quantity. Updated
//                         on buys, unchanged on sells, reset when flat.
//   entry_timestamp_ms  — time of the buy that opened the position from
//                         flat. Used by the minimum-hold rule when no
//                         last-buy time is known (hydrated positions).
//   entry_commission    — buy commission still attributed to the open
//                         quantity; released pro rata on sells so that a
//                         round trip's net P&L includes both legs.
//   realized_pnl        — cumulative gross realized P&L of closed quantity.
//
// Thread model:
//   Value type. The authoritative copy lives in the PortfolioLedger and is
//   mutated only by the RebalanceOrchestrator after a confirmed fill.
//   Everyone else works on snapshots.
// -----------------------------------------------------------------------------
struct Holding {
  std::string asset;
  double quantity{0.0};
  double average_entry_price{0.0};
  std::int64_t entry_timestamp_ms{0};
  double entry_commission{0.0};
  double realized_pnl{0.0};

  double marketValue(double price) const { return quantity * price; }

  double unrealizedPnl(double price) const {
    if (quantity <= 0.0 || average_entry_price <= 0.0) {
      return 0.0;
    }
    return quantity * (price - average_entry_price);
  }
};

}  // namespace domain
}  // namespace qfolio
