#pragma once

#include "qfolio/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>

namespace qfolio {

// -----------------------------------------------------------------------------
// OrderRateLimiter — minimum spacing between outbound orders
// -----------------------------------------------------------------------------
// acquire() waits (through the time provider) until at least
// min_interval_ms have passed since the previous acquire(), then records the
// new send time. The first call never waits. Used from the cycle thread
// only.
// -----------------------------------------------------------------------------
class OrderRateLimiter {
 public:
  OrderRateLimiter(ITimeProvider& clock, std::int64_t min_interval_ms);

  // Returns the time actually waited.
  std::int64_t acquire();

 private:
  ITimeProvider& clock_;
  const std::int64_t min_interval_ms_;
  std::optional<std::int64_t> last_send_ms_;
};

}  // namespace qfolio
