// -----------------------------------------------------------------------------
// folio: accounting engine entry point
//
//   folio [config.json]
//
//   1) Load the configuration (currencies, instruments, mark price
//      convention, endpoints). Without an argument the built-in defaults are
//      used: default currency table, no instruments, side-dependent marks,
//      feed on tcp://127.0.0.1:5555, IPC on 5556 / 5557.
//   2) Start the AccountingEngine. The feed thread subscribes to the upstream
//      publisher; the IPC server answers commands such as
//      "OPEN_VALUE FXCM" and publishes position / account telemetry.
//   3) Log position lifecycle events on the accounting loop.
//   4) Idle on the main thread until SIGINT, then stop the engine.
// -----------------------------------------------------------------------------

#include "folio/domain/errors.hpp"
#include "folio/engine/accounting_engine.hpp"

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

// Set by the SIGINT handler, polled by main().
static volatile std::sig_atomic_t g_shutdown_requested = 0;

static void sigint_handler(int /*signum*/) { g_shutdown_requested = 1; }

static void logPosition(const char* what, const folio::domain::Position& pos) {
  std::cout << "[Position] " << what << " id=" << pos.id().value()
            << " symbol=" << pos.symbol().toString()
            << " side=" << folio::domain::toString(pos.side())
            << " qty=" << pos.quantity().toString() << " avg="
            << (pos.averageEntryPrice() ? pos.averageEntryPrice()->toString()
                                        : std::string("-"))
            << " realized=" << pos.realizedPnl().toString() << "\n";
}

int main(int argc, char** argv) {
  folio::AccountingConfig config;
  if (argc > 1) {
    try {
      config = folio::loadConfig(argv[1]);
    } catch (const folio::domain::ConfigError& e) {
      std::cerr << "[main] ERROR: " << e.what() << "\n";
      return 1;
    }
    std::cout << "[main] Loaded " << argv[1] << ": "
              << config.currencies.size() << " currencies, "
              << config.instruments.size() << " instruments.\n";
  }

  folio::AccountingEngine engine(std::move(config));

  engine.eventBus().subscribe<folio::PositionOpenedEvent>(
      [](const folio::PositionOpenedEvent& e) {
        logPosition("OPENED", e.position);
      });
  engine.eventBus().subscribe<folio::PositionModifiedEvent>(
      [](const folio::PositionModifiedEvent& e) {
        logPosition("MODIFIED", e.position);
      });
  engine.eventBus().subscribe<folio::PositionClosedEvent>(
      [](const folio::PositionClosedEvent& e) {
        logPosition("CLOSED", e.position);
      });

  std::signal(SIGINT, sigint_handler);

  try {
    engine.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] ERROR: engine failed to start: " << e.what() << "\n";
    return 1;
  }
  std::cout << "[main] Press Ctrl-C to shut down.\n";

  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Stopping engine...\n";
  engine.stop();
  return 0;
}
