// -----------------------------------------------------------------------------
// qfolio — paper-trading executable.
//
//   1) Load EngineConfig from argv[1] or $QFOLIO_CONFIG (defaults otherwise).
//   2) Create the live clock, the in-memory BarStore and the paper exchange
//      (MockExecutionClient).
//   3) Optionally start the MarketDataGateway on its own thread so the
//      external feeder can stream bars and sentiment into the BarStore.
//   4) Create the PortfolioEngine, attach audit sinks (JSON-lines file,
//      ZeroMQ publisher with the operator command socket) and run the
//      reconciliation gate.
//   5) Run one cycle every interval_hours until SIGINT.
//
// Thread layout:
//   main thread      → cycles
//   gateway thread   → MarketDataGateway::run() (ZMQ SUB recv loop)
//   publisher thread → AuditPublisher (ZMQ PUB + REP)
// -----------------------------------------------------------------------------

#include "qfolio/audit/audit_sink.hpp"
#include "qfolio/config/config_loader.hpp"
#include "qfolio/engine/portfolio_engine.hpp"
#include "qfolio/execution/mock_execution_client.hpp"
#include "qfolio/gateway/market_data_gateway.hpp"
#include "qfolio/market/bar_store.hpp"
#include "qfolio/network/audit_publisher.hpp"
#include "qfolio/time/live_time_provider.hpp"
#include "qfolio/time/time_utils.hpp"

#include <zmq.hpp>

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// The only global: a lock-free flag the SIGINT handler may touch.
static std::atomic<bool> g_shutdown{false};

static void sigint_handler(int /*signum*/) { g_shutdown.store(true); }

namespace {

constexpr std::int64_t kShutdownPollMs = 200;

std::string configPath(int argc, char** argv) {
  if (argc > 1) {
    return argv[1];
  }
  const char* env = std::getenv("QFOLIO_CONFIG");
  return env != nullptr ? std::string(env) : std::string();
}

// Sleeps until the deadline or until shutdown was requested.
void waitUntil(qfolio::ITimeProvider& clock, std::int64_t deadline_ms) {
  while (!g_shutdown.load()) {
    const std::int64_t remaining = deadline_ms - clock.now_ms();
    if (remaining <= 0) {
      return;
    }
    clock.sleep_for_ms(std::min(remaining, kShutdownPollMs));
  }
}

}  // namespace

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  qfolio::EngineConfig config;
  const std::string path = configPath(argc, argv);
  if (!path.empty()) {
    auto loaded = qfolio::loadConfig(path);
    if (!loaded) {
      std::cerr << "[main] " << qfolio::describe(loaded.error()) << "\n";
      return 1;
    }
    config = std::move(loaded).value();
  } else {
    std::cout << "[main] no config given, using built-in defaults\n";
  }

  // -------------------------------------------------------------------------
  // 2) Clock, market data store, paper exchange
  // -------------------------------------------------------------------------
  qfolio::LiveTimeProvider clock;
  qfolio::BarStore bars(std::max<std::size_t>(config.cycle.history_bars * 2,
                                              500));
  qfolio::MockExecutionClient exchange(
      clock, config.compliance.commission_rate, config.cycle.initial_cash);

  std::signal(SIGINT, sigint_handler);

  // -------------------------------------------------------------------------
  // 3) Market data gateway thread
  // -------------------------------------------------------------------------
  std::unique_ptr<qfolio::MarketDataGateway> gateway;
  std::thread gateway_thread;
  if (!config.service.market_data_endpoint.empty()) {
    gateway = std::make_unique<qfolio::MarketDataGateway>(
        bars, config.service.market_data_endpoint);
    gateway_thread = std::thread([&gateway] {
      try {
        gateway->run();
      } catch (const zmq::error_t& e) {
        std::cerr << "[main] market data gateway stopped: " << e.what()
                  << "\n";
      }
    });
  }

  // -------------------------------------------------------------------------
  // 4) Engine, audit sinks, reconciliation
  // -------------------------------------------------------------------------
  qfolio::PortfolioEngine engine(config, bars, &bars, exchange, clock);

  std::unique_ptr<qfolio::JsonLinesAuditSink> audit_file;
  if (!config.service.audit_log_path.empty()) {
    audit_file = std::make_unique<qfolio::JsonLinesAuditSink>(
        config.service.audit_log_path);
    if (!audit_file->isOpen()) {
      std::cerr << "[main] cannot open audit log "
                << config.service.audit_log_path << "\n";
    }
    engine.auditRecorder().addSink(*audit_file);
  }

  std::unique_ptr<qfolio::AuditPublisher> publisher;
  if (!config.service.audit_pub_endpoint.empty() &&
      !config.service.command_endpoint.empty()) {
    publisher = std::make_unique<qfolio::AuditPublisher>(
        [&engine](const std::string& cmd) {
          return engine.executeCommand(cmd);
        },
        config.service.audit_pub_endpoint, config.service.command_endpoint);
    try {
      publisher->start();
      engine.auditRecorder().addSink(*publisher);
    } catch (const zmq::error_t& e) {
      std::cerr << "[main] audit publisher disabled: " << e.what() << "\n";
      publisher.reset();
    }
  }

  int exit_code = 0;
  qfolio::Status started = engine.start();
  if (!started) {
    std::cerr << "[main] " << qfolio::describe(started.error()) << "\n";
    exit_code = 1;
    g_shutdown.store(true);
  }

  // -------------------------------------------------------------------------
  // 5) Cycle loop
  // -------------------------------------------------------------------------
  const std::int64_t interval_ms =
      qfolio::hours_to_ms(config.cycle.interval_hours);
  std::cout << "[main] running a cycle every " << config.cycle.interval_hours
            << " h. Press Ctrl-C to shut down.\n";

  while (!g_shutdown.load()) {
    const std::int64_t cycle_start = clock.now_ms();
    auto report = engine.runCycle();
    if (!report) {
      std::cerr << "[main] " << qfolio::describe(report.error()) << "\n";
    }
    waitUntil(clock, cycle_start + interval_ms);
  }

  // -------------------------------------------------------------------------
  // 6) Shutdown: inflow first, then the publisher
  // -------------------------------------------------------------------------
  std::cout << "[main] shutting down...\n";
  if (gateway) {
    gateway->stop();
  }
  if (gateway_thread.joinable()) {
    gateway_thread.join();
  }
  if (publisher) {
    publisher->stop();
  }
  return exit_code;
}
