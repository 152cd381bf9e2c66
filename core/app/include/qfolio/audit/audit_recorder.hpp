#pragma once

#include "qfolio/audit/audit_sink.hpp"
#include "qfolio/eventbus/event_bus.hpp"
#include "qfolio/events/event.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <vector>

namespace qfolio {

// -----------------------------------------------------------------------------
// AuditRecorder — EventBus → structured records → sinks
// -----------------------------------------------------------------------------
//
// @brief  Subscribes to every event on the bus, encodes it, and appends the
//         record to each registered sink.
//
// @details
// Record layout:
//
//   {
//     "sequence":     <monotonic, from 1>,
//     "type":         "regime" | "alpha" | "selection" | "weights" |
//                     "compliance_decision" | "trade_attempt" |
//                     "trade_outcome" | "stage" | "circuit_breaker" |
//                     "cycle_summary",
//     "cycle_id":     <cycle the event belongs to>,
//     "timestamp_ms": <event time>,
//     "payload":      { ...event fields... }
//   }
//
// A sink that fails is logged on std::cerr; the remaining sinks still get
// the record and the publisher is never affected.
//
// Thread model:
//   Runs on the publishing thread. The sink list is guarded by a mutex and
//   the sequence counter is atomic, so several publishers are fine.
//
// Ownership:
//   Sinks are not owned; they must outlive the recorder.
// -----------------------------------------------------------------------------
class AuditRecorder {
 public:
  explicit AuditRecorder(EventBus& bus);
  ~AuditRecorder();

  AuditRecorder(const AuditRecorder&) = delete;
  AuditRecorder& operator=(const AuditRecorder&) = delete;

  void addSink(IAuditSink& sink);

  std::uint64_t recordsWritten() const { return next_sequence_.load() - 1; }
  std::uint64_t sinkFailures() const { return sink_failures_.load(); }

  // Encodes an event into the record layout above with the given sequence.
  static nlohmann::json encode(const Event& event, std::uint64_t sequence);

 private:
  void onEvent(const Event& event);

  EventBus& bus_;
  EventBus::SubscriptionId subscription_id_{0};

  std::mutex sinks_mutex_;
  std::vector<IAuditSink*> sinks_;

  std::atomic<std::uint64_t> next_sequence_{1};
  std::atomic<std::uint64_t> sink_failures_{0};
};

}  // namespace qfolio
