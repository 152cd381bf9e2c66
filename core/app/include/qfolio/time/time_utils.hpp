#pragma once

#include <cmath>
#include <cstdint>

namespace qfolio {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions for the millisecond arithmetic used by hold-time,
//         cooldown and daily-cap rules.
//
// @details
// Every timestamp in the engine is int64 epoch milliseconds (see
// ITimeProvider). Configuration expresses windows in hours (MIN_HOLD_HOURS,
// COOLDOWN_HOURS_AFTER_SELL) and daily caps reset at the UTC day boundary;
// these helpers perform those conversions in one place.
// -----------------------------------------------------------------------------

inline constexpr std::int64_t kMsPerSecond = 1000;
inline constexpr std::int64_t kMsPerMinute = 60 * kMsPerSecond;
inline constexpr std::int64_t kMsPerHour = 60 * kMsPerMinute;
inline constexpr std::int64_t kMsPerDay = 24 * kMsPerHour;

// Fractional hours to milliseconds, rounded to the nearest millisecond.
inline std::int64_t hours_to_ms(double hours) {
  return static_cast<std::int64_t>(std::llround(hours * kMsPerHour));
}

inline double ms_to_hours(std::int64_t ms) {
  return static_cast<double>(ms) / static_cast<double>(kMsPerHour);
}

// -------------------------------------------------------------------------
// utc_day_index
// -------------------------------------------------------------------------
// @brief  Number of whole UTC days since the epoch for the given instant.
//
// @details
// Floor division, so instants before the epoch map to negative days instead
// of collapsing onto day 0. Two trades fall on the same "trading day" for the
// daily caps iff their day indices are equal.
// -------------------------------------------------------------------------
inline std::int64_t utc_day_index(std::int64_t epoch_ms) {
  std::int64_t day = epoch_ms / kMsPerDay;
  if (epoch_ms % kMsPerDay < 0) {
    --day;
  }
  return day;
}

}  // namespace qfolio
