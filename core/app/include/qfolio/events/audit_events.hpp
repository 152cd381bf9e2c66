#pragma once

#include "qfolio/domain/compliance_decision.hpp"
#include "qfolio/domain/order.hpp"
#include "qfolio/domain/portfolio_types.hpp"
#include "qfolio/risk/performance_metrics.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace qfolio {

// -----------------------------------------------------------------------------
// Audit events
// -----------------------------------------------------------------------------
//
// @brief  One struct per decision the engine makes during a cycle.
//
// @details
// Every event carries the cycle it belongs to and the time it was produced.
// Components publish these on the EventBus as they go; the AuditRecorder
// turns each one into a structured record. Taken together, the records of a
// cycle are enough to reconstruct every decision without re-running it.
//
// Plain value types, copied into the Event variant.
// -----------------------------------------------------------------------------

struct RegimeEvent {
  std::uint64_t cycle_id{0};
  std::int64_t timestamp_ms{0};
  domain::RegimeParameters params;
  // True when params are the previous cycle's or the configured defaults.
  bool fallback{false};
  std::string fallback_reason;
};

struct AlphaEvent {
  std::uint64_t cycle_id{0};
  std::int64_t timestamp_ms{0};
  domain::AlphaVector alpha;
};

// -----------------------------------------------------------------------------
// SelectionEvent
// -----------------------------------------------------------------------------
//   method  — "annealer" or "alpha_top_n" (optimizer unavailable).
//   energy  — Hamiltonian of the final vector (after repair).
// -----------------------------------------------------------------------------
struct SelectionEvent {
  std::uint64_t cycle_id{0};
  std::int64_t timestamp_ms{0};
  domain::Selection selection;
  std::string method;
  int target_count{0};
  double lambda{0.0};
  double penalty{0.0};
  double best_read_energy{0.0};
  std::size_t best_read{0};
  int count_before_repair{0};
  std::vector<std::string> repair_removed;
  std::vector<std::string> repair_added;
};

struct WeightsEvent {
  std::uint64_t cycle_id{0};
  std::int64_t timestamp_ms{0};
  domain::TargetWeights weights;
  double cvar{0.0};
  double expected_return{0.0};
  bool equal_weight_fallback{false};
  bool bounds_relaxed{false};
};

struct ComplianceDecisionEvent {
  std::uint64_t cycle_id{0};
  std::int64_t timestamp_ms{0};
  domain::ComplianceDecision decision;
};

struct TradeAttemptEvent {
  std::uint64_t cycle_id{0};
  std::int64_t timestamp_ms{0};
  domain::OrderRequest request;
};

// -----------------------------------------------------------------------------
// TradeOutcomeEvent
// -----------------------------------------------------------------------------
// accepted == false means the client returned an error (error holds the
// described Error); otherwise fill holds the terminal outcome, which may
// still be Rejected or PartiallyFilled.
// -----------------------------------------------------------------------------
struct TradeOutcomeEvent {
  std::uint64_t cycle_id{0};
  std::int64_t timestamp_ms{0};
  domain::OrderRequest request;
  bool accepted{false};
  domain::OrderFill fill;
  std::string error;
};

// -----------------------------------------------------------------------------
// StageEvent — outcome of one rebalancing stage (optionally per asset)
// -----------------------------------------------------------------------------
struct StageEvent {
  std::uint64_t cycle_id{0};
  std::int64_t timestamp_ms{0};
  std::string stage;
  std::string asset;
  bool ok{true};
  std::string detail;
  std::string error_kind;
  std::map<std::string, double> values;
};

struct CircuitBreakerEvent {
  std::uint64_t cycle_id{0};
  std::int64_t timestamp_ms{0};
  // false → the breaker was cleared.
  bool tripped{true};
  std::string reason;
  double equity{0.0};
  double peak_equity{0.0};
  double drawdown{0.0};
  double loss_rate{0.0};
};

struct CycleSummaryEvent {
  std::uint64_t cycle_id{0};
  std::int64_t timestamp_ms{0};
  double equity{0.0};
  double cash{0.0};
  std::size_t intents{0};
  std::size_t blocked{0};
  std::size_t orders_submitted{0};
  std::size_t orders_filled{0};
  std::size_t orders_failed{0};
  bool cancelled{false};
  bool halted{false};
  PerformanceMetrics performance;
};

}  // namespace qfolio
