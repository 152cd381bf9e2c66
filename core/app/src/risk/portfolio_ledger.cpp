#include "qfolio/risk/portfolio_ledger.hpp"

#include <algorithm>
#include <mutex>

namespace qfolio {

PortfolioLedger::PortfolioLedger(double initial_cash) : cash_(initial_cash) {}

void PortfolioLedger::hydrateHolding(const domain::Holding& holding) {
  std::unique_lock lock(mutex_);
  holdings_[holding.asset] = holding;
}

std::optional<domain::Holding> PortfolioLedger::holding(
    const std::string& asset) const {
  std::shared_lock lock(mutex_);
  auto it = holdings_.find(asset);
  if (it == holdings_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Holding> PortfolioLedger::snapshots() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Holding> out;
  out.reserve(holdings_.size());
  for (const auto& [asset, h] : holdings_) {
    if (h.quantity > kFlatEpsilon) {
      out.push_back(h);
    }
  }
  return out;
}

std::vector<domain::TradeRecord> PortfolioLedger::history() const {
  std::shared_lock lock(mutex_);
  return history_;
}

double PortfolioLedger::cash() const {
  std::shared_lock lock(mutex_);
  return cash_;
}

void PortfolioLedger::setCash(double cash) {
  std::unique_lock lock(mutex_);
  cash_ = cash;
}

double PortfolioLedger::equity(
    const std::map<std::string, double>& prices) const {
  std::shared_lock lock(mutex_);
  double total = cash_;
  for (const auto& [asset, h] : holdings_) {
    if (h.quantity <= kFlatEpsilon) {
      continue;
    }
    auto it = prices.find(asset);
    const double price =
        (it != prices.end() && it->second > 0.0) ? it->second
                                                 : h.average_entry_price;
    total += h.quantity * price;
  }
  return total;
}

// -----------------------------------------------------------------------------
// applyFill: holding update, cash update, history append
// -----------------------------------------------------------------------------
domain::TradeRecord PortfolioLedger::applyFill(
    const std::string& asset, domain::Side side, double quantity,
    double price, double commission, std::int64_t timestamp_ms,
    domain::OrderId order_id) {
  std::unique_lock lock(mutex_);

  domain::Holding& h = holdings_[asset];
  h.asset = asset;

  domain::TradeRecord record;
  record.order_id = order_id;
  record.asset = asset;
  record.side = side;
  record.price = price;
  record.timestamp_ms = timestamp_ms;
  record.commission = commission;

  if (side == domain::Side::Buy) {
    // --- Buy: open or add ---------------------------------------------------
    if (h.quantity <= kFlatEpsilon) {
      h.quantity = 0.0;
      h.average_entry_price = price;
      h.entry_timestamp_ms = timestamp_ms;
      h.entry_commission = 0.0;
    } else {
      h.average_entry_price =
          (h.quantity * h.average_entry_price + quantity * price) /
          (h.quantity + quantity);
    }
    h.quantity += quantity;
    h.entry_commission += commission;
    cash_ -= quantity * price + commission;
    record.quantity = quantity;
  } else {
    // --- Sell: close part or all, never short ---------------------------------
    const double closed = std::min(quantity, std::max(h.quantity, 0.0));
    const double gross = closed * (price - h.average_entry_price);
    const double share = h.quantity > kFlatEpsilon ? closed / h.quantity : 0.0;
    const double carried = h.entry_commission * share;

    h.entry_commission -= carried;
    h.realized_pnl += gross;
    h.quantity -= closed;
    cash_ += closed * price - commission;

    record.quantity = closed;
    record.realized_pnl = gross;
    record.net_pnl = gross - commission - carried;

    if (h.quantity <= kFlatEpsilon) {
      h.quantity = 0.0;
      h.average_entry_price = 0.0;
      h.entry_timestamp_ms = 0;
      h.entry_commission = 0.0;
    }
  }

  record.sequence = next_sequence_++;
  record.holding_after = h;
  history_.push_back(record);
  return record;
}

}  // namespace qfolio
