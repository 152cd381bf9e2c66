#pragma once

#include "qfolio/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace qfolio {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock for replay and tests
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is set explicitly, and whose sleeps move
//         the clock forward instead of blocking.
//
// @details
// Used in three places:
//   - Tests: place a trade at t0, advance_time(t0 + MIN_HOLD_HOURS - 1s) and
//     check that the sell is blocked, without waiting for hours.
//   - Rate limiting: the orchestrator's 300 ms order spacing becomes a clock
//     jump, so order timestamps are exact and the test is instantaneous.
//   - Replay: the MarketDataGateway advances the clock to each bar's
//     timestamp before storing it.
//
// Storage is a single std::atomic<int64_t>; readers on other threads (the
// audit publisher's STATUS command, the gateway) see a consistent value
// without a mutex.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // Starts at start_ms (0 means "no data replayed yet").
  explicit SimulationTimeProvider(std::int64_t start_ms = 0);

  std::int64_t now_ms() const override;

  // Advances the clock by duration_ms. Never blocks.
  void sleep_for_ms(std::int64_t duration_ms) override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to new_time_ms.
  //
  // @details
  // Monotonicity is the caller's responsibility. Tests occasionally rewind
  // the clock on purpose, so it is not enforced here.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Convenience for tests: moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_;
};

}  // namespace qfolio
