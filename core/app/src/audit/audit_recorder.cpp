#include "qfolio/audit/audit_recorder.hpp"

#include <iostream>

namespace qfolio {

namespace {

using nlohmann::json;

json encodeRequest(const domain::OrderRequest& r) {
  return json{{"asset", r.asset},
              {"side", domain::sideToString(r.side)},
              {"quantity", r.quantity},
              {"type", domain::orderTypeToString(r.type)},
              {"reference_price", r.reference_price}};
}

json encodeFill(const domain::OrderFill& f) {
  return json{{"order_id", f.order_id},
              {"status", domain::orderStatusToString(f.status)},
              {"requested_quantity", f.requested_quantity},
              {"filled_quantity", f.filled_quantity},
              {"fill_price", f.fill_price},
              {"commission", f.commission},
              {"timestamp_ms", f.timestamp_ms},
              {"message", f.message}};
}

json encodeMetrics(const PerformanceMetrics& m) {
  return json{{"observations", m.observations},
              {"total_return", m.total_return},
              {"annual_return", m.annual_return},
              {"annual_volatility", m.annual_volatility},
              {"sharpe", m.sharpe},
              {"sortino", m.sortino},
              {"max_drawdown", m.max_drawdown},
              {"calmar", m.calmar},
              {"var_95", m.var_95},
              {"cvar_95", m.cvar_95}};
}

// -----------------------------------------------------------------------------
// Per-event payloads. One overload per Event alternative.
// -----------------------------------------------------------------------------
const char* typeName(const RegimeEvent&) { return "regime"; }
const char* typeName(const AlphaEvent&) { return "alpha"; }
const char* typeName(const SelectionEvent&) { return "selection"; }
const char* typeName(const WeightsEvent&) { return "weights"; }
const char* typeName(const ComplianceDecisionEvent&) { return "compliance_decision"; }
const char* typeName(const TradeAttemptEvent&) { return "trade_attempt"; }
const char* typeName(const TradeOutcomeEvent&) { return "trade_outcome"; }
const char* typeName(const StageEvent&) { return "stage"; }
const char* typeName(const CircuitBreakerEvent&) { return "circuit_breaker"; }
const char* typeName(const CycleSummaryEvent&) { return "cycle_summary"; }

json payload(const RegimeEvent& e) {
  return json{{"n", e.params.n},
              {"lambda", e.params.lambda},
              {"volatility", e.params.volatility},
              {"regime", domain::volatilityRegimeToString(e.params.regime)},
              {"observations", e.params.observations},
              {"fallback", e.fallback},
              {"fallback_reason", e.fallback_reason}};
}

json payload(const AlphaEvent& e) {
  json scores = json::object();
  for (std::size_t i = 0; i < e.alpha.size(); ++i) {
    scores[e.alpha.assets[i]] = e.alpha.scores[i];
  }
  return json{{"scores", scores}};
}

json payload(const SelectionEvent& e) {
  std::vector<int> bits(e.selection.bits.begin(), e.selection.bits.end());
  return json{{"assets", e.selection.assets},
              {"bits", bits},
              {"selected", e.selection.selectedAssets()},
              {"energy", e.selection.energy},
              {"method", e.method},
              {"target_count", e.target_count},
              {"lambda", e.lambda},
              {"penalty", e.penalty},
              {"best_read_energy", e.best_read_energy},
              {"best_read", e.best_read},
              {"count_before_repair", e.count_before_repair},
              {"repair_removed", e.repair_removed},
              {"repair_added", e.repair_added}};
}

json payload(const WeightsEvent& e) {
  return json{{"weights", e.weights},
              {"cvar", e.cvar},
              {"expected_return", e.expected_return},
              {"equal_weight_fallback", e.equal_weight_fallback},
              {"bounds_relaxed", e.bounds_relaxed}};
}

json payload(const ComplianceDecisionEvent& e) {
  const auto& d = e.decision;
  json violations = json::array();
  for (auto rule : d.violations) {
    violations.push_back(domain::complianceRuleCode(rule));
  }
  return json{{"asset", d.asset},
              {"side", domain::sideToString(d.side)},
              {"quantity", d.quantity},
              {"price", d.price},
              {"verdict", d.approved() ? "APPROVE" : "BLOCK"},
              {"rule", domain::complianceRuleCode(d.rule)},
              {"reason", d.reason},
              {"violations", violations}};
}

json payload(const TradeAttemptEvent& e) {
  return json{{"request", encodeRequest(e.request)}};
}

json payload(const TradeOutcomeEvent& e) {
  json out{{"request", encodeRequest(e.request)}, {"accepted", e.accepted}};
  if (e.accepted) {
    out["fill"] = encodeFill(e.fill);
  } else {
    out["error"] = e.error;
  }
  return out;
}

json payload(const StageEvent& e) {
  return json{{"stage", e.stage},
              {"asset", e.asset},
              {"ok", e.ok},
              {"detail", e.detail},
              {"error_kind", e.error_kind},
              {"values", e.values}};
}

json payload(const CircuitBreakerEvent& e) {
  return json{{"tripped", e.tripped},
              {"reason", e.reason},
              {"equity", e.equity},
              {"peak_equity", e.peak_equity},
              {"drawdown", e.drawdown},
              {"loss_rate", e.loss_rate}};
}

json payload(const CycleSummaryEvent& e) {
  return json{{"equity", e.equity},
              {"cash", e.cash},
              {"intents", e.intents},
              {"blocked", e.blocked},
              {"orders_submitted", e.orders_submitted},
              {"orders_filled", e.orders_filled},
              {"orders_failed", e.orders_failed},
              {"cancelled", e.cancelled},
              {"halted", e.halted},
              {"performance", encodeMetrics(e.performance)}};
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor / destructor: bus subscription lifetime == recorder lifetime
// -----------------------------------------------------------------------------
AuditRecorder::AuditRecorder(EventBus& bus) : bus_(bus) {
  subscription_id_ =
      bus_.subscribe([this](const Event& event) { onEvent(event); });
}

AuditRecorder::~AuditRecorder() { bus_.unsubscribe(subscription_id_); }

void AuditRecorder::addSink(IAuditSink& sink) {
  std::lock_guard lock(sinks_mutex_);
  sinks_.push_back(&sink);
}

nlohmann::json AuditRecorder::encode(const Event& event,
                                     std::uint64_t sequence) {
  return std::visit(
      [sequence](const auto& e) {
        return json{{"sequence", sequence},
                    {"type", typeName(e)},
                    {"cycle_id", e.cycle_id},
                    {"timestamp_ms", e.timestamp_ms},
                    {"payload", payload(e)}};
      },
      event);
}

void AuditRecorder::onEvent(const Event& event) {
  std::lock_guard lock(sinks_mutex_);
  const json record = encode(event, next_sequence_.fetch_add(1));
  for (IAuditSink* sink : sinks_) {
    Status appended = sink->append(record);
    if (!appended) {
      sink_failures_.fetch_add(1);
      std::cerr << "[AuditRecorder] sink append failed: "
                << describe(appended.error()) << "\n";
    }
  }
}

}  // namespace qfolio
