#pragma once

#include "qfolio/common/result.hpp"
#include "qfolio/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace qfolio {

// -----------------------------------------------------------------------------
// Configuration loading
// -----------------------------------------------------------------------------
//
// @brief  Builds an EngineConfig from a JSON document.
//
// @details
// Layout (every key optional; absent keys keep the EngineConfig defaults):
//
//   {
//     "MIN_HOLD_HOURS": 4, "MIN_NET_PROFIT": 0.001,
//     "MAX_DAILY_TRADES_PER_ASSET": 2, "MAX_DAILY_TOTAL_TRADES": 20,
//     "MIN_TRADE_VALUE": 10, "COMMISSION_RATE": 0.001,
//     "COOLDOWN_HOURS_AFTER_SELL": 6,
//     "regime":       { "window": 100, "min_n": 5, ... },
//     "alpha":        { "momentum_weight": 0.5, ... },
//     "correlation":  { "window": 48, ... },
//     "hamiltonian":  { "penalty_multiplier": 2.0, ... },
//     "annealer":     { "T_start": 10, "T_end": 0.01, "K": 1000, "M": 0,
//                       "reads": 100, "seed": 42, ... },
//     "allocator":    { "confidence": 0.95, ... },
//     "rebalance":    { "threshold": 0.05, "step_sizes": {"BTC": 0.00001} },
//     "retry":        { ... },
//     "circuit_breaker": { ... },
//     "cycle":        { "interval_hours": 4, "universe": ["BTC", ...] },
//     "service":      { "market_data_endpoint": "tcp://...", ... }
//   }
//
// The compliance thresholds sit at the top level under their upper-case
// names; a "compliance" object with the same keys is accepted as well.
//
// Errors:
//   Type mismatches and malformed files produce InvalidConfiguration with
//   the offending key in the message. parseConfig() runs validateConfig()
//   before returning.
// -----------------------------------------------------------------------------

Result<EngineConfig> parseConfig(const nlohmann::json& document);

// Reads and parses the file at path.
Result<EngineConfig> loadConfig(const std::string& path);

// -----------------------------------------------------------------------------
// validateConfig(config)
// -----------------------------------------------------------------------------
// Range checks: positive windows, min <= max for every clamped pair,
// t_start > t_end > 0, confidence in (0, 1), non-negative thresholds, and
// min_weight <= max_weight. Returns the first violation.
// -----------------------------------------------------------------------------
Status validateConfig(const EngineConfig& config);

}  // namespace qfolio
