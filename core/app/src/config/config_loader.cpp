#include "qfolio/config/config_loader.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace qfolio {

namespace {

using nlohmann::json;

// Raised by the readers below; converted to InvalidConfiguration in
// parseConfig().
class ConfigKeyError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

std::string qualified(const std::string& section, const char* key) {
  return section.empty() ? std::string(key) : section + "." + key;
}

// -----------------------------------------------------------------------------
// read(obj, key, out)
// -----------------------------------------------------------------------------
// Leaves out untouched when key is absent. A present key of the wrong type
// is an error naming the fully qualified key.
// -----------------------------------------------------------------------------
template <typename T>
void read(const json& obj, const std::string& section, const char* key,
          T& out) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return;
  }
  try {
    out = it->template get<T>();
  } catch (const json::exception& e) {
    throw ConfigKeyError(qualified(section, key) + ": " + e.what());
  }
}

// Counts and windows: must be non-negative integers.
void readCount(const json& obj, const std::string& section, const char* key,
               std::size_t& out) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return;
  }
  if (!it->is_number_integer() || it->get<std::int64_t>() < 0) {
    throw ConfigKeyError(qualified(section, key) +
                         ": expected a non-negative integer");
  }
  out = it->get<std::size_t>();
}

const json* section(const json& document, const char* name) {
  auto it = document.find(name);
  if (it == document.end()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw ConfigKeyError(std::string(name) + ": expected an object");
  }
  return &*it;
}

void readCompliance(const json& obj, const std::string& sec,
                    ComplianceConfig& c) {
  read(obj, sec, "MIN_HOLD_HOURS", c.min_hold_hours);
  read(obj, sec, "MIN_NET_PROFIT", c.min_net_profit);
  read(obj, sec, "MAX_DAILY_TRADES_PER_ASSET", c.max_daily_trades_per_asset);
  read(obj, sec, "MAX_DAILY_TOTAL_TRADES", c.max_daily_total_trades);
  read(obj, sec, "MIN_TRADE_VALUE", c.min_trade_value);
  read(obj, sec, "COMMISSION_RATE", c.commission_rate);
  read(obj, sec, "COOLDOWN_HOURS_AFTER_SELL", c.cooldown_hours_after_sell);
}

PerformanceMetric parseMetric(const std::string& name) {
  if (name == "sortino") return PerformanceMetric::Sortino;
  if (name == "sharpe") return PerformanceMetric::Sharpe;
  if (name == "calmar") return PerformanceMetric::Calmar;
  throw ConfigKeyError("allocator.performance_metric: unknown metric '" +
                       name + "'");
}

EngineConfig parseSections(const json& doc) {
  EngineConfig cfg;

  readCompliance(doc, "", cfg.compliance);
  if (const json* s = section(doc, "compliance")) {
    readCompliance(*s, "compliance", cfg.compliance);
  }

  if (const json* s = section(doc, "regime")) {
    RegimeConfig& r = cfg.regime;
    readCount(*s, "regime", "window", r.window);
    readCount(*s, "regime", "min_observations", r.min_observations);
    read(*s, "regime", "periods_per_year", r.periods_per_year);
    read(*s, "regime", "low_volatility", r.low_volatility);
    read(*s, "regime", "high_volatility", r.high_volatility);
    read(*s, "regime", "min_n", r.min_n);
    read(*s, "regime", "max_n", r.max_n);
    read(*s, "regime", "min_lambda", r.min_lambda);
    read(*s, "regime", "max_lambda", r.max_lambda);
    read(*s, "regime", "default_n", r.default_n);
    read(*s, "regime", "default_lambda", r.default_lambda);
    read(*s, "regime", "reference_assets", r.reference_assets);
  }

  if (const json* s = section(doc, "alpha")) {
    AlphaConfig& a = cfg.alpha;
    read(*s, "alpha", "momentum_weight", a.momentum_weight);
    read(*s, "alpha", "mean_reversion_weight", a.mean_reversion_weight);
    read(*s, "alpha", "sentiment_weight", a.sentiment_weight);
    readCount(*s, "alpha", "short_window", a.short_window);
    readCount(*s, "alpha", "long_window", a.long_window);
    readCount(*s, "alpha", "moving_average_window", a.moving_average_window);
    read(*s, "alpha", "mean_reversion_scale", a.mean_reversion_scale);
  }

  if (const json* s = section(doc, "correlation")) {
    readCount(*s, "correlation", "window", cfg.correlation.window);
    readCount(*s, "correlation", "min_observations",
              cfg.correlation.min_observations);
  }

  if (const json* s = section(doc, "hamiltonian")) {
    HamiltonianConfig& h = cfg.hamiltonian;
    read(*s, "hamiltonian", "penalty_multiplier", h.penalty_multiplier);
    read(*s, "hamiltonian", "zero_alpha_penalty", h.zero_alpha_penalty);
    read(*s, "hamiltonian", "enforce_dominance", h.enforce_dominance);
    read(*s, "hamiltonian", "dominance_margin", h.dominance_margin);
    read(*s, "hamiltonian", "fixed_penalty", h.fixed_penalty);
  }

  if (const json* s = section(doc, "annealer")) {
    AnnealerConfig& a = cfg.annealer;
    read(*s, "annealer", "T_start", a.t_start);
    read(*s, "annealer", "T_end", a.t_end);
    readCount(*s, "annealer", "K", a.steps);
    readCount(*s, "annealer", "M", a.sweeps_per_step);
    readCount(*s, "annealer", "reads", a.reads);
    readCount(*s, "annealer", "max_iterations", a.max_iterations);
    read(*s, "annealer", "parallel", a.parallel);
    read(*s, "annealer", "count_tolerance", a.count_tolerance);
    auto seed = s->find("seed");
    if (seed != s->end() && !seed->is_null()) {
      std::uint64_t value = 0;
      read(*s, "annealer", "seed", value);
      a.seed = value;
    }
  }

  if (const json* s = section(doc, "allocator")) {
    AllocatorConfig& a = cfg.allocator;
    read(*s, "allocator", "confidence", a.confidence);
    read(*s, "allocator", "risk_aversion", a.risk_aversion);
    read(*s, "allocator", "min_weight", a.min_weight);
    read(*s, "allocator", "max_weight", a.max_weight);
    readCount(*s, "allocator", "min_observations", a.min_observations);
    readCount(*s, "allocator", "iterations", a.iterations);
    read(*s, "allocator", "initial_step", a.initial_step);
    read(*s, "allocator", "performance_weight", a.performance_weight);
    read(*s, "allocator", "periods_per_year", a.periods_per_year);
    std::string metric;
    read(*s, "allocator", "performance_metric", metric);
    if (!metric.empty()) {
      a.performance_metric = parseMetric(metric);
    }
  }

  if (const json* s = section(doc, "rebalance")) {
    RebalanceConfig& r = cfg.rebalance;
    read(*s, "rebalance", "threshold", r.threshold);
    read(*s, "rebalance", "default_step_size", r.default_step_size);
    read(*s, "rebalance", "step_sizes", r.step_sizes);
    read(*s, "rebalance", "min_order_interval_ms", r.min_order_interval_ms);
    read(*s, "rebalance", "dust_quantity", r.dust_quantity);
  }

  if (const json* s = section(doc, "retry")) {
    RetryConfig& r = cfg.retry;
    read(*s, "retry", "max_attempts", r.max_attempts);
    read(*s, "retry", "initial_backoff_ms", r.initial_backoff_ms);
    read(*s, "retry", "backoff_multiplier", r.backoff_multiplier);
    read(*s, "retry", "max_backoff_ms", r.max_backoff_ms);
    read(*s, "retry", "total_budget_ms", r.total_budget_ms);
  }

  if (const json* s = section(doc, "circuit_breaker")) {
    CircuitBreakerConfig& c = cfg.circuit_breaker;
    read(*s, "circuit_breaker", "max_drawdown", c.max_drawdown);
    read(*s, "circuit_breaker", "max_loss_rate", c.max_loss_rate);
    readCount(*s, "circuit_breaker", "min_round_trips", c.min_round_trips);
    readCount(*s, "circuit_breaker", "loss_window", c.loss_window);
    read(*s, "circuit_breaker", "persist_across_cycles",
         c.persist_across_cycles);
  }

  if (const json* s = section(doc, "cycle")) {
    CycleConfig& c = cfg.cycle;
    read(*s, "cycle", "interval_hours", c.interval_hours);
    readCount(*s, "cycle", "history_bars", c.history_bars);
    read(*s, "cycle", "universe", c.universe);
    read(*s, "cycle", "initial_cash", c.initial_cash);
    read(*s, "cycle", "periods_per_year", c.periods_per_year);
  }

  if (const json* s = section(doc, "service")) {
    ServiceConfig& v = cfg.service;
    read(*s, "service", "market_data_endpoint", v.market_data_endpoint);
    read(*s, "service", "audit_pub_endpoint", v.audit_pub_endpoint);
    read(*s, "service", "command_endpoint", v.command_endpoint);
    read(*s, "service", "audit_log_path", v.audit_log_path);
  }

  return cfg;
}

Status invalid(const std::string& message) {
  return makeError(ErrorKind::InvalidConfiguration, message, "config");
}

}  // namespace

// -----------------------------------------------------------------------------
// parseConfig
// -----------------------------------------------------------------------------
Result<EngineConfig> parseConfig(const nlohmann::json& document) {
  if (!document.is_object()) {
    return makeError(ErrorKind::InvalidConfiguration,
                     "configuration root must be a JSON object", "config");
  }

  EngineConfig cfg;
  try {
    cfg = parseSections(document);
  } catch (const ConfigKeyError& e) {
    return makeError(ErrorKind::InvalidConfiguration, e.what(), "config");
  }

  Status valid = validateConfig(cfg);
  if (!valid) {
    return valid.error();
  }
  return cfg;
}

// -----------------------------------------------------------------------------
// loadConfig
// -----------------------------------------------------------------------------
Result<EngineConfig> loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    return makeError(ErrorKind::InvalidConfiguration,
                     "cannot open configuration file '" + path + "'",
                     "config");
  }

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    return makeError(ErrorKind::InvalidConfiguration,
                     "malformed configuration file '" + path + "': " +
                         e.what(),
                     "config");
  }

  std::cout << "[Config] loaded " << path << "\n";
  return parseConfig(document);
}

// -----------------------------------------------------------------------------
// validateConfig
// -----------------------------------------------------------------------------
Status validateConfig(const EngineConfig& c) {
  const RegimeConfig& r = c.regime;
  if (r.window < 2 || r.min_observations < 2) {
    return invalid("regime.window and regime.min_observations must be >= 2");
  }
  if (r.min_n < 1 || r.min_n > r.max_n) {
    return invalid("regime: require 1 <= min_n <= max_n");
  }
  if (r.min_lambda < 0.0 || r.min_lambda > r.max_lambda) {
    return invalid("regime: require 0 <= min_lambda <= max_lambda");
  }
  if (!(r.low_volatility < r.high_volatility)) {
    return invalid("regime: low_volatility must be below high_volatility");
  }
  if (r.default_n < 1 || r.periods_per_year <= 0.0) {
    return invalid("regime: default_n and periods_per_year must be positive");
  }

  const AlphaConfig& a = c.alpha;
  if (a.short_window == 0 || a.short_window >= a.long_window ||
      a.moving_average_window == 0) {
    return invalid("alpha: require 0 < short_window < long_window and "
                   "moving_average_window > 0");
  }

  if (c.correlation.window < 2 || c.correlation.min_observations < 2) {
    return invalid(
        "correlation.window and correlation.min_observations must be >= 2");
  }

  const HamiltonianConfig& h = c.hamiltonian;
  if (h.penalty_multiplier <= 0.0 || h.zero_alpha_penalty <= 0.0 ||
      h.dominance_margin < 0.0 || h.fixed_penalty < 0.0) {
    return invalid("hamiltonian: penalties must be positive");
  }

  const AnnealerConfig& an = c.annealer;
  if (!(an.t_end > 0.0) || !(an.t_start > an.t_end)) {
    return invalid("annealer: require T_start > T_end > 0");
  }
  if (an.steps == 0 || an.reads == 0 || an.count_tolerance < 0) {
    return invalid("annealer: K and reads must be positive");
  }

  const AllocatorConfig& al = c.allocator;
  if (!(al.confidence > 0.0 && al.confidence < 1.0)) {
    return invalid("allocator.confidence must lie in (0, 1)");
  }
  if (al.min_weight < 0.0 || al.min_weight > al.max_weight ||
      al.max_weight <= 0.0) {
    return invalid("allocator: require 0 <= min_weight <= max_weight, "
                   "max_weight > 0");
  }
  if (al.min_observations < 2) {
    return invalid("allocator.min_observations must be >= 2");
  }
  if (al.iterations == 0 || al.initial_step <= 0.0 ||
      al.risk_aversion < 0.0 || al.performance_weight < 0.0) {
    return invalid("allocator: iterations, initial_step must be positive");
  }

  const ComplianceConfig& co = c.compliance;
  if (co.min_hold_hours < 0.0 || co.cooldown_hours_after_sell < 0.0 ||
      co.min_trade_value < 0.0 || co.commission_rate < 0.0 ||
      co.max_daily_trades_per_asset < 0 || co.max_daily_total_trades < 0) {
    return invalid("compliance thresholds must be non-negative");
  }

  const RebalanceConfig& rb = c.rebalance;
  if (rb.threshold < 0.0 || rb.default_step_size <= 0.0 ||
      rb.min_order_interval_ms < 0 || rb.dust_quantity < 0.0) {
    return invalid("rebalance: threshold/interval must be non-negative and "
                   "default_step_size positive");
  }
  for (const auto& [asset, step] : rb.step_sizes) {
    if (step <= 0.0) {
      return invalid("rebalance.step_sizes." + asset + " must be positive");
    }
  }

  const RetryConfig& rt = c.retry;
  if (rt.max_attempts < 1 || rt.initial_backoff_ms < 0 ||
      rt.backoff_multiplier < 1.0 || rt.total_budget_ms < 0) {
    return invalid("retry: max_attempts >= 1, backoff_multiplier >= 1");
  }

  const CircuitBreakerConfig& cb = c.circuit_breaker;
  if (cb.max_drawdown <= 0.0 || cb.max_drawdown > 1.0 ||
      cb.max_loss_rate <= 0.0 || cb.max_loss_rate > 1.0 ||
      cb.loss_window == 0) {
    return invalid("circuit_breaker: limits must lie in (0, 1]");
  }

  if (c.cycle.interval_hours <= 0.0 || c.cycle.history_bars < 2 ||
      c.cycle.universe.empty() || c.cycle.initial_cash < 0.0) {
    return invalid("cycle: interval_hours > 0, history_bars >= 2 and a "
                   "non-empty universe are required");
  }

  return okStatus();
}

}  // namespace qfolio
