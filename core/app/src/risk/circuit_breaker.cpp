#include "qfolio/risk/circuit_breaker.hpp"

#include <iostream>
#include <sstream>
#include <utility>

namespace qfolio {

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, EventBus& bus,
                               const ITimeProvider& clock)
    : config_(std::move(config)), bus_(bus), clock_(clock) {}

// -----------------------------------------------------------------------------
// beginCycle: auto-clear when trips do not persist
// -----------------------------------------------------------------------------
void CircuitBreaker::beginCycle(std::uint64_t cycle_id) {
  {
    std::lock_guard lock(mutex_);
    cycle_id_ = cycle_id;
  }
  if (tripped_.load() && !config_.persist_across_cycles) {
    clear();
  }
}

bool CircuitBreaker::observeEquity(double equity) {
  bool fired = false;
  Snapshot snap;
  std::string why;
  {
    std::lock_guard lock(mutex_);
    last_equity_ = equity;
    if (equity > peak_equity_) {
      peak_equity_ = equity;
    }
    const double dd = drawdownLocked();
    if (dd > config_.max_drawdown) {
      std::ostringstream os;
      os << "drawdown " << dd << " > " << config_.max_drawdown;
      why = os.str();
      fired = tripLocked(why);
      snap = snapshotLocked();
    }
  }
  if (fired) {
    publish(true, why, snap);
  }
  return isTripped();
}

bool CircuitBreaker::observeRoundTrip(double net_pnl) {
  bool fired = false;
  Snapshot snap;
  std::string why;
  {
    std::lock_guard lock(mutex_);
    round_trips_.push_back(net_pnl < 0.0);
    while (round_trips_.size() > config_.loss_window) {
      round_trips_.pop_front();
    }
    const double rate = lossRateLocked();
    if (round_trips_.size() >= config_.min_round_trips &&
        rate > config_.max_loss_rate) {
      std::ostringstream os;
      os << "loss rate " << rate << " > " << config_.max_loss_rate
         << " over " << round_trips_.size() << " round trips";
      why = os.str();
      fired = tripLocked(why);
      snap = snapshotLocked();
    }
  }
  if (fired) {
    publish(true, why, snap);
  }
  return isTripped();
}

void CircuitBreaker::trip(const std::string& reason) {
  bool fired = false;
  Snapshot snap;
  {
    std::lock_guard lock(mutex_);
    fired = tripLocked(reason);
    snap = snapshotLocked();
  }
  if (fired) {
    publish(true, reason, snap);
  }
}

void CircuitBreaker::clear() {
  Snapshot snap;
  {
    std::lock_guard lock(mutex_);
    tripped_.store(false);
    reason_.clear();
    peak_equity_ = last_equity_;
    round_trips_.clear();
    snap = snapshotLocked();
  }
  std::cout << "[CircuitBreaker] cleared.\n";
  publish(false, "cleared", snap);
}

bool CircuitBreaker::isTripped() const { return tripped_.load(); }

std::string CircuitBreaker::reason() const {
  std::lock_guard lock(mutex_);
  return reason_;
}

double CircuitBreaker::peakEquity() const {
  std::lock_guard lock(mutex_);
  return peak_equity_;
}

double CircuitBreaker::drawdown() const {
  std::lock_guard lock(mutex_);
  return drawdownLocked();
}

double CircuitBreaker::lossRate() const {
  std::lock_guard lock(mutex_);
  return lossRateLocked();
}

bool CircuitBreaker::tripLocked(const std::string& reason) {
  if (tripped_.exchange(true)) {
    return false;
  }
  reason_ = reason;
  std::cerr << "[CircuitBreaker] CRITICAL: tripped (" << reason
            << "). Order submission halted.\n";
  return true;
}

double CircuitBreaker::lossRateLocked() const {
  if (round_trips_.empty()) {
    return 0.0;
  }
  std::size_t losing = 0;
  for (bool l : round_trips_) {
    losing += l ? 1 : 0;
  }
  return static_cast<double>(losing) /
         static_cast<double>(round_trips_.size());
}

double CircuitBreaker::drawdownLocked() const {
  if (peak_equity_ <= 0.0) {
    return 0.0;
  }
  return (peak_equity_ - last_equity_) / peak_equity_;
}

CircuitBreaker::Snapshot CircuitBreaker::snapshotLocked() const {
  Snapshot s;
  s.cycle_id = cycle_id_;
  s.equity = last_equity_;
  s.peak = peak_equity_;
  s.drawdown = drawdownLocked();
  s.loss_rate = lossRateLocked();
  return s;
}

void CircuitBreaker::publish(bool tripped, const std::string& reason,
                             const Snapshot& s) {
  CircuitBreakerEvent event;
  event.cycle_id = s.cycle_id;
  event.timestamp_ms = clock_.now_ms();
  event.tripped = tripped;
  event.reason = reason;
  event.equity = s.equity;
  event.peak_equity = s.peak;
  event.drawdown = s.drawdown;
  event.loss_rate = s.loss_rate;
  bus_.publish(event);
}

}  // namespace qfolio
