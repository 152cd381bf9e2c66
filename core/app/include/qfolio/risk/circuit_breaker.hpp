#pragma once

#include "qfolio/config/engine_config.hpp"
#include "qfolio/eventbus/event_bus.hpp"
#include "qfolio/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace qfolio {

// -----------------------------------------------------------------------------
// CircuitBreaker — halts order submission on excessive losses
// -----------------------------------------------------------------------------
//
// @brief  Tracks the equity peak and the loss rate of recent round trips,
//         and trips when either exceeds its configured limit.
//
// @details
// Trip conditions:
//   - drawdown  = (peak - equity) / peak  >  max_drawdown
//   - loss rate = losing / total over the last loss_window round trips
//                 > max_loss_rate, once min_round_trips are in the window
//   - operator HALT (trip()).
//
// Once tripped, isTripped() stays true for the rest of the cycle. With
// persist_across_cycles (the default) it also stays true for subsequent
// cycles until clear() is called; otherwise beginCycle() clears it.
//
// clear() re-bases the peak on the last observed equity and empties the
// loss window, so a cleared breaker does not re-trip on the same losses.
//
// Every trip and every clear publishes a CircuitBreakerEvent.
//
// Thread model:
//   The tripped flag is atomic: the orchestrator checks it before each order
//   and the command thread may set it (HALT). The remaining state sits under
//   a mutex. Events are published after the lock is released.
// -----------------------------------------------------------------------------
class CircuitBreaker {
 public:
  CircuitBreaker(CircuitBreakerConfig config, EventBus& bus,
                 const ITimeProvider& clock);

  CircuitBreaker(const CircuitBreaker&) = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;

  void beginCycle(std::uint64_t cycle_id);

  // Returns isTripped() after the observation.
  bool observeEquity(double equity);
  bool observeRoundTrip(double net_pnl);

  // Operator halt.
  void trip(const std::string& reason);

  void clear();

  bool isTripped() const;
  std::string reason() const;
  double peakEquity() const;
  double drawdown() const;
  double lossRate() const;

 private:
  struct Snapshot {
    std::uint64_t cycle_id{0};
    double equity{0.0};
    double peak{0.0};
    double drawdown{0.0};
    double loss_rate{0.0};
  };

  // Caller holds mutex_. Returns true if this call tripped the breaker.
  bool tripLocked(const std::string& reason);
  double lossRateLocked() const;
  double drawdownLocked() const;
  Snapshot snapshotLocked() const;
  void publish(bool tripped, const std::string& reason, const Snapshot& s);

  const CircuitBreakerConfig config_;
  EventBus& bus_;
  const ITimeProvider& clock_;

  std::atomic<bool> tripped_{false};

  mutable std::mutex mutex_;
  std::uint64_t cycle_id_{0};
  double peak_equity_{0.0};
  double last_equity_{0.0};
  std::deque<bool> round_trips_;  // true = losing
  std::string reason_;
};

}  // namespace qfolio
