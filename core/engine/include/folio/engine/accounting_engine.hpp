#pragma once

#include "folio/concurrent/event_loop_thread.hpp"
#include "folio/config/accounting_config.hpp"
#include "folio/network/feed_thread.hpp"
#include "folio/network/ipc_server.hpp"
#include "folio/portfolio/i_reconciler.hpp"
#include "folio/portfolio/portfolio.hpp"
#include "folio/portfolio/position_engine.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace folio {

// -----------------------------------------------------------------------------
// AccountingEngine: top-level orchestrator
// -----------------------------------------------------------------------------
//
// @brief  Owns the accounting loop, the Portfolio, the PositionEngine and the
//         optional network components, and wires them together.
//
// @details
// Data flow (every arrow into the loop goes through its ThreadSafeQueue):
//
//   FeedThread --+
//   pushEvent() -+--> accounting loop --> EventBus
//                                          |-- OrderFilledEvent  -> PositionEngine
//                                          |     publishes PositionOpened/Modified/Closed
//                                          |-- Position*Event    -> Portfolio::updatePosition
//                                          |-- QuoteTick         -> Portfolio::updateTick
//                                          |-- AccountStateEvent -> Portfolio::updateAccount
//                                          `-- telemetry kinds   -> IpcServer (PUB)
//
//   IpcServer (REP) --> executeCommand() --> Portfolio queries (shared lock)
//
// start(reconciler):
//   1. Create the PositionEngine and subscribe the Portfolio to the bus.
//   2. Warm-up gate: if a reconciler is given, register its account states in
//      the Portfolio and hydrate its positions, before any event is applied.
//   3. Start the loop, then the IpcServer, then the FeedThread last so no
//      input arrives before the consumers exist.
// stop() tears down in reverse: the feed first, then the loop (which drains
// what is already queued), then the IpcServer. Both are idempotent; the
// destructor stops. If any step of start() throws, everything built so far
// is torn down the same way before the exception propagates, so the engine
// is back in its stopped state and start() may be retried.
//
// An empty endpoint in the NetworkConfig disables that component, which is
// how tests drive the engine purely through pushEvent().
//
// Thread model:
//   start()/stop() from the owning thread. pushEvent() from any thread.
//   executeCommand() from the IPC thread or the owner.
// -----------------------------------------------------------------------------
class AccountingEngine {
 public:
  explicit AccountingEngine(AccountingConfig config);
  ~AccountingEngine();

  AccountingEngine(const AccountingEngine&) = delete;
  AccountingEngine& operator=(const AccountingEngine&) = delete;
  AccountingEngine(AccountingEngine&&) = delete;
  AccountingEngine& operator=(AccountingEngine&&) = delete;

  void start(IReconciler* reconciler = nullptr);
  void stop();

  void pushEvent(Event event);

  // Text command in, JSON document out. See IpcServer.
  std::string executeCommand(const std::string& cmd);

  Portfolio& portfolio() { return portfolio_; }
  const Portfolio& portfolio() const { return portfolio_; }

  // Null before start() and after stop().
  const PositionEngine* positionEngine() const { return position_engine_.get(); }

  EventBus& eventBus() { return loop_.eventBus(); }

  const AccountingConfig& config() const { return config_; }
  bool isRunning() const { return running_.load(); }

 private:
  void reconcile(IReconciler& reconciler);
  void teardown();
  void subscribePortfolio();
  void subscribeTelemetry();
  void reportFault(const char* component, const std::string& reason,
                   const std::string& reference, Timestamp timestamp,
                   std::uint64_t sequence_id);

  AccountingConfig config_;

  EventLoopThread loop_;
  Portfolio portfolio_;

  std::unique_ptr<PositionEngine> position_engine_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<FeedThread> feed_thread_;

  std::vector<EventBus::SubscriptionId> subscriptions_;
  std::atomic<bool> running_{false};
};

}  // namespace folio
