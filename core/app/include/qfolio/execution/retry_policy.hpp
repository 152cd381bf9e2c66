#pragma once

#include "qfolio/common/result.hpp"
#include "qfolio/config/engine_config.hpp"
#include "qfolio/time/i_time_provider.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>

namespace qfolio {

// -----------------------------------------------------------------------------
// withRetry(config, clock, what, call)
// -----------------------------------------------------------------------------
//
// @brief  Bounded retry with exponential backoff around an external call.
//
// @details
// Only ErrorKind::TransientFailure is retried. Every other outcome, success
// or error, is returned as-is on the first attempt. Business-rule blocks
// never reach this wrapper.
//
// Backoff before attempt k (k ≥ 2):
//   min(initial_backoff_ms · multiplier^(k-2), max_backoff_ms)
// A retry is skipped when its backoff would push the time spent past
// total_budget_ms; the last error is then returned with the attempt count
// and elapsed time added to its inputs.
//
// Waiting goes through ITimeProvider::sleep_for_ms(), so tests with a
// SimulationTimeProvider run instantly and can assert the backoff schedule
// from the clock.
// -----------------------------------------------------------------------------
template <typename T>
Result<T> withRetry(const RetryConfig& config, ITimeProvider& clock,
                    const std::string& what,
                    const std::function<Result<T>()>& call) {
  const std::int64_t started = clock.now_ms();
  double backoff = static_cast<double>(config.initial_backoff_ms);
  int attempt = 1;

  while (true) {
    Result<T> result = call();
    if (result.ok() || result.error().kind != ErrorKind::TransientFailure) {
      return result;
    }

    const std::int64_t wait = std::min(
        static_cast<std::int64_t>(std::llround(backoff)), config.max_backoff_ms);
    const std::int64_t elapsed = clock.now_ms() - started;

    if (attempt >= config.max_attempts ||
        elapsed + wait > config.total_budget_ms) {
      Error error = result.error();
      error.inputs["attempts"] = static_cast<double>(attempt);
      error.inputs["elapsed_ms"] = static_cast<double>(elapsed);
      std::cerr << "[Retry] " << what << " gave up after " << attempt
                << " attempt(s): " << describe(error) << "\n";
      return error;
    }

    std::cerr << "[Retry] " << what << " attempt " << attempt
              << " failed (" << result.error().message << "), retrying in "
              << wait << " ms\n";
    clock.sleep_for_ms(wait);
    backoff *= config.backoff_multiplier;
    ++attempt;
  }
}

}  // namespace qfolio
