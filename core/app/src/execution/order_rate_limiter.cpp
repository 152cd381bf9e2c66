#include "qfolio/execution/order_rate_limiter.hpp"

namespace qfolio {

OrderRateLimiter::OrderRateLimiter(ITimeProvider& clock,
                                   std::int64_t min_interval_ms)
    : clock_(clock), min_interval_ms_(min_interval_ms) {}

std::int64_t OrderRateLimiter::acquire() {
  std::int64_t waited = 0;
  if (last_send_ms_) {
    const std::int64_t since = clock_.now_ms() - *last_send_ms_;
    if (since < min_interval_ms_) {
      waited = min_interval_ms_ - since;
      clock_.sleep_for_ms(waited);
    }
  }
  last_send_ms_ = clock_.now_ms();
  return waited;
}

}  // namespace qfolio
