#pragma once

#include "qfolio/time/i_time_provider.hpp"

namespace qfolio {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
// now_ms() reads std::chrono::system_clock; sleep_for_ms() blocks the calling
// thread with std::this_thread::sleep_for. Stateless, so one instance can be
// shared by every component of the engine.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  LiveTimeProvider() = default;

  std::int64_t now_ms() const override;
  void sleep_for_ms(std::int64_t duration_ms) override;
};

}  // namespace qfolio
