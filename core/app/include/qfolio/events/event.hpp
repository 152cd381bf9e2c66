#pragma once

#include "qfolio/events/audit_events.hpp"

#include <variant>

namespace qfolio {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// The envelope carried by the EventBus. Adding an event kind means adding it
// here and to the AuditRecorder's encoder; std::visit there will not compile
// until the encoder handles it.
// -----------------------------------------------------------------------------
using Event = std::variant<
    RegimeEvent,
    AlphaEvent,
    SelectionEvent,
    WeightsEvent,
    ComplianceDecisionEvent,
    TradeAttemptEvent,
    TradeOutcomeEvent,
    StageEvent,
    CircuitBreakerEvent,
    CycleSummaryEvent>;

}  // namespace qfolio
