#include "qfolio/time/simulation_time_provider.hpp"

namespace qfolio {

SimulationTimeProvider::SimulationTimeProvider(std::int64_t start_ms)
    : current_time_ms_(start_ms) {}

// -----------------------------------------------------------------------------
// now_ms(): atomic read of the simulated clock
// -----------------------------------------------------------------------------
std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// -----------------------------------------------------------------------------
// sleep_for_ms(): a simulated wait is a clock jump
// -----------------------------------------------------------------------------
void SimulationTimeProvider::sleep_for_ms(std::int64_t duration_ms) {
  if (duration_ms <= 0) {
    return;
  }
  current_time_ms_.fetch_add(duration_ms);
}

void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

void SimulationTimeProvider::advance_by(std::int64_t delta_ms) {
  current_time_ms_.fetch_add(delta_ms);
}

}  // namespace qfolio
