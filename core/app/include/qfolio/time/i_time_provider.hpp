#pragma once

#include <cstdint>

namespace qfolio {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract clock for every time-dependent component
// -----------------------------------------------------------------------------
//
// @brief  Supplies "now" and a way to wait, so that hold-time windows, daily
//         trade counters and the inter-order delay can be driven either by
//         the wall clock or by a test/replay clock.
//
// @details
// Two operations:
//   - now_ms():       epoch milliseconds.
//   - sleep_for_ms(): blocks (live) or advances the clock (simulation).
//
// The compliance engine only reads time. The orchestrator's rate limiter and
// the retry wrapper also wait on it, which is why sleep lives on the same
// interface: a simulated clock can honour a 300 ms order spacing without the
// test actually sleeping.
//
// Thread-safety contract:
//   now_ms() must be safe for concurrent readers. sleep_for_ms() is called
//   from the cycle thread only.
//
// Ownership:
//   Components hold a reference; the provider outlives them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time in milliseconds since the Unix epoch (UTC).
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;

  // -------------------------------------------------------------------------
  // sleep_for_ms(duration_ms)
  // -------------------------------------------------------------------------
  // @brief  Waits for duration_ms. Non-positive durations return at once.
  //
  // @details
  // LiveTimeProvider blocks the calling thread. SimulationTimeProvider moves
  // its clock forward by duration_ms and returns immediately.
  // -------------------------------------------------------------------------
  virtual void sleep_for_ms(std::int64_t duration_ms) = 0;
};

}  // namespace qfolio
