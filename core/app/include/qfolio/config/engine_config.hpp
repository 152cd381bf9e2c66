#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace qfolio {

// -----------------------------------------------------------------------------
// Engine configuration
// -----------------------------------------------------------------------------
//
// @brief  Immutable per-component configuration structs, aggregated into
//         EngineConfig.
//
// @details
// Every component receives its own struct by value at construction and never
// reads configuration from anywhere else. Defaults below are the values the
// engine runs with when a key is absent from the JSON file (see
// config_loader.hpp for the key names).
//
// Units:
//   - Durations in hours are doubles (fractional hours allowed).
//   - Durations in milliseconds are int64.
//   - Volatility is annualized (per-bar stdev × sqrt(periods_per_year)).
// -----------------------------------------------------------------------------

// Hourly bars, 24/7 market.
inline constexpr double kDefaultPeriodsPerYear = 8760.0;

// -----------------------------------------------------------------------------
// RegimeConfig
// -----------------------------------------------------------------------------
// Volatility → (n, lambda) mapping. Below low_volatility the outputs sit at
// their minimum, above high_volatility at their maximum, linear in between.
// The thresholds correspond to 2% and 5% per-bar stdev on hourly bars.
// -----------------------------------------------------------------------------
struct RegimeConfig {
  std::size_t window{100};
  std::size_t min_observations{20};
  double periods_per_year{kDefaultPeriodsPerYear};
  double low_volatility{1.8719};
  double high_volatility{4.6797};
  int min_n{5};
  int max_n{20};
  double min_lambda{0.25};
  double max_lambda{1.0};
  int default_n{10};
  double default_lambda{0.5};
  // Empty → the whole universe is the reference set.
  std::vector<std::string> reference_assets;
};

struct AlphaConfig {
  double momentum_weight{0.5};
  double mean_reversion_weight{0.2};
  double sentiment_weight{0.3};
  std::size_t short_window{24};
  std::size_t long_window{72};
  std::size_t moving_average_window{24};
  double mean_reversion_scale{1.0};
};

struct CorrelationConfig {
  std::size_t window{48};
  std::size_t min_observations{10};
};

// -----------------------------------------------------------------------------
// HamiltonianConfig
// -----------------------------------------------------------------------------
//   penalty_multiplier   — P = multiplier × max|alpha|.
//   zero_alpha_penalty   — P used when every alpha is 0.
//   enforce_dominance    — floor P at max|alpha| + lambda·n·max|rho| + margin.
//   fixed_penalty        — > 0 overrides everything above.
// -----------------------------------------------------------------------------
struct HamiltonianConfig {
  double penalty_multiplier{2.0};
  double zero_alpha_penalty{2.0};
  bool enforce_dominance{true};
  double dominance_margin{0.1};
  double fixed_penalty{0.0};
};

// -----------------------------------------------------------------------------
// AnnealerConfig
// -----------------------------------------------------------------------------
//   steps (K)            — temperature levels from t_start to t_end.
//   sweeps_per_step (M)  — single-bit-flip proposals per level; 0 → one per
//                          variable.
//   max_iterations       — cap on total proposals per read; 0 → unlimited.
//   seed                 — fixed seed for reproducible runs; empty → entropy.
//   count_tolerance      — accepted |Σx - n| before greedy repair runs.
// -----------------------------------------------------------------------------
struct AnnealerConfig {
  double t_start{10.0};
  double t_end{0.01};
  std::size_t steps{1000};
  std::size_t sweeps_per_step{0};
  std::size_t reads{100};
  std::size_t max_iterations{0};
  std::optional<std::uint64_t> seed;
  bool parallel{true};
  int count_tolerance{0};
};

enum class PerformanceMetric {
  Sortino,
  Sharpe,
  Calmar,
};

struct AllocatorConfig {
  double confidence{0.95};
  double risk_aversion{1.0};
  double min_weight{0.02};
  double max_weight{0.4};
  std::size_t min_observations{10};
  std::size_t iterations{400};
  double initial_step{0.05};
  // 0 disables the historical-performance tilt.
  double performance_weight{0.0};
  PerformanceMetric performance_metric{PerformanceMetric::Sortino};
  double periods_per_year{kDefaultPeriodsPerYear};
};

// -----------------------------------------------------------------------------
// ComplianceConfig — anti-wash-trading thresholds
// -----------------------------------------------------------------------------
// JSON keys are the upper-case names (MIN_HOLD_HOURS, ...).
// -----------------------------------------------------------------------------
struct ComplianceConfig {
  double min_hold_hours{4.0};
  double min_net_profit{0.001};
  int max_daily_trades_per_asset{2};
  int max_daily_total_trades{20};
  double min_trade_value{10.0};
  double commission_rate{0.001};
  double cooldown_hours_after_sell{6.0};
};

struct RebalanceConfig {
  double threshold{0.05};
  double default_step_size{0.000001};
  std::map<std::string, double> step_sizes;
  std::int64_t min_order_interval_ms{300};
  // Holdings at or below this quantity are treated as empty.
  double dust_quantity{0.000001};
};

struct RetryConfig {
  int max_attempts{3};
  std::int64_t initial_backoff_ms{200};
  double backoff_multiplier{2.0};
  std::int64_t max_backoff_ms{2000};
  std::int64_t total_budget_ms{10000};
};

struct CircuitBreakerConfig {
  double max_drawdown{0.2};
  double max_loss_rate{0.6};
  std::size_t min_round_trips{5};
  std::size_t loss_window{20};
  bool persist_across_cycles{true};
};

// -----------------------------------------------------------------------------
// CycleConfig — scheduling and universe
// -----------------------------------------------------------------------------
struct CycleConfig {
  double interval_hours{4.0};
  std::size_t history_bars{100};
  std::vector<std::string> universe{
      "BTC", "ETH",  "SOL",  "BNB",  "XRP",  "ADA",  "AVAX",
      "DOT", "LINK", "LTC",  "MATIC", "ATOM", "ETC",  "XLM",
      "ALGO", "UNI", "AAVE", "FIL",  "EOS",  "XTZ"};
  double initial_cash{10000.0};
  double periods_per_year{kDefaultPeriodsPerYear};
};

// -----------------------------------------------------------------------------
// ServiceConfig — outward-facing endpoints. Empty string disables.
// -----------------------------------------------------------------------------
struct ServiceConfig {
  std::string market_data_endpoint;
  std::string audit_pub_endpoint;
  std::string command_endpoint;
  std::string audit_log_path;
};

struct EngineConfig {
  RegimeConfig regime;
  AlphaConfig alpha;
  CorrelationConfig correlation;
  HamiltonianConfig hamiltonian;
  AnnealerConfig annealer;
  AllocatorConfig allocator;
  ComplianceConfig compliance;
  RebalanceConfig rebalance;
  RetryConfig retry;
  CircuitBreakerConfig circuit_breaker;
  CycleConfig cycle;
  ServiceConfig service;
};

inline const char* performanceMetricToString(PerformanceMetric metric) {
  switch (metric) {
    case PerformanceMetric::Sortino: return "sortino";
    case PerformanceMetric::Sharpe:  return "sharpe";
    case PerformanceMetric::Calmar:  return "calmar";
  }
  return "unknown";
}

}  // namespace qfolio
