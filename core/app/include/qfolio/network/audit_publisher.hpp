#pragma once

#include "qfolio/audit/audit_sink.hpp"
#include "qfolio/concurrent/thread_safe_queue.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace qfolio {

// -----------------------------------------------------------------------------
// AuditPublisher — ZeroMQ audit stream and operator command channel
// -----------------------------------------------------------------------------
//
// @brief  Broadcasts every audit record on a PUB socket and answers
//         operator commands (STATUS, HALT, CLEAR_BREAKER) on a REP socket.
//
// @details
// Registered with the AuditRecorder as an ordinary sink. append() only
// serializes the record and enqueues the string; the worker thread drains
// the queue and publishes, so a slow subscriber never stalls a cycle.
//
// The REP socket has ZMQ_RCVTIMEO = kPollTimeoutMs; the worker alternates
// between draining the queue and polling for one command. Each command is
// passed to the CommandHandler and its JSON reply is sent back.
//
// Thread model:
//   start()/stop() on the owning thread. append() from any thread (usually
//   the cycle thread). CommandHandler runs on the worker thread and must be
//   thread-safe against the cycle.
//
// Ownership:
//   Owns the ZMQ context, both sockets, the queue and the worker thread.
// -----------------------------------------------------------------------------
class AuditPublisher final : public IAuditSink {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  AuditPublisher(CommandHandler command_handler, std::string pub_endpoint,
                 std::string cmd_endpoint);

  // Calls stop().
  ~AuditPublisher() override;

  AuditPublisher(const AuditPublisher&) = delete;
  AuditPublisher& operator=(const AuditPublisher&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Binds both sockets and spawns the worker. No-op when running.
  //
  // @details
  // zmq::error_t from bind() propagates; nothing is left running.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, publishes what is still queued, joins. Idempotent.
  void stop();

  Status append(const nlohmann::json& record) override;

  bool running() const { return running_.load(); }
  std::size_t published() const { return published_.load(); }
  std::size_t dropped() const { return outbound_.dropped(); }

 private:
  static constexpr int kPollTimeoutMs = 50;
  // Oldest unpublished records are dropped beyond this.
  static constexpr std::size_t kMaxQueuedRecords = 10000;

  void run();
  void processRecords();
  void processCommands();

  CommandHandler command_handler_;
  std::string pub_endpoint_;
  std::string cmd_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> pub_socket_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;

  ThreadSafeQueue<std::string> outbound_{kMaxQueuedRecords};
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> published_{0};
};

}  // namespace qfolio
