#pragma once

#include "qfolio/domain/holding.hpp"
#include "qfolio/domain/order.hpp"
#include "qfolio/domain/trade_record.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace qfolio {

// -----------------------------------------------------------------------------
// PortfolioLedger — holdings, cash and the append-only trade history
// -----------------------------------------------------------------------------
//
// @brief  The only state that outlives a cycle: per-asset Holdings, the
//         locally reconciled cash figure, and every TradeRecord.
//
// @details
// applyFill() is the single mutation path and is called by the
// RebalanceOrchestrator after a fill is confirmed by the execution client,
// with the quantity actually filled.
//
// P&L math (long-only spot):
//
//   BUY  f @ p, commission c:
//     opening from flat: avg = p, entry time = fill time
//     otherwise:         avg = (q·avg + f·p) / (q + f)
//     entry_commission += c;  cash -= f·p + c
//
//   SELL f @ p, commission c:
//     closed  = min(f, q)                  — never goes short
//     gross   = closed·(p - avg)
//     carried = entry_commission · closed/q   (released buy commission)
//     net     = gross - c - carried          — the round trip's result
//     realized_pnl += gross;  cash += closed·p - c
//     Flat afterwards → avg, entry time and entry_commission reset.
//
// Thread model:
//   std::shared_mutex: one writer (cycle thread), concurrent readers (the
//   command thread answering STATUS, the breaker's equity valuation).
//   holding() returns a copy so callers never hold a pointer into the map.
// -----------------------------------------------------------------------------
class PortfolioLedger {
 public:
  explicit PortfolioLedger(double initial_cash = 0.0);

  PortfolioLedger(const PortfolioLedger&) = delete;
  PortfolioLedger& operator=(const PortfolioLedger&) = delete;

  // -------------------------------------------------------------------------
  // hydrateHolding(holding)
  // -------------------------------------------------------------------------
  // @brief  Installs a position reported by the exchange at start-up.
  //
  // @details
  // Replaces any existing entry for the asset. No TradeRecord is written:
  // the position predates this process.
  // -------------------------------------------------------------------------
  void hydrateHolding(const domain::Holding& holding);

  std::optional<domain::Holding> holding(const std::string& asset) const;

  // Open positions (quantity > 0), ordered by asset.
  std::vector<domain::Holding> snapshots() const;

  std::vector<domain::TradeRecord> history() const;

  // -------------------------------------------------------------------------
  // applyFill(...)
  // -------------------------------------------------------------------------
  // @brief  Applies a confirmed fill and appends its TradeRecord.
  // @return The appended record (sequence numbers start at 1).
  // -------------------------------------------------------------------------
  domain::TradeRecord applyFill(const std::string& asset, domain::Side side,
                                double quantity, double price,
                                double commission, std::int64_t timestamp_ms,
                                domain::OrderId order_id);

  double cash() const;
  void setCash(double cash);

  // cash + Σ quantity·price over open positions. Positions without a price
  // in the map are valued at their average entry price.
  double equity(const std::map<std::string, double>& prices) const;

 private:
  static constexpr double kFlatEpsilon = 1e-12;

  mutable std::shared_mutex mutex_;
  std::map<std::string, domain::Holding> holdings_;
  std::vector<domain::TradeRecord> history_;
  double cash_{0.0};
  std::uint64_t next_sequence_{1};
};

}  // namespace qfolio
