#include "folio/engine/accounting_engine.hpp"
#include "folio/codec/event_codec.hpp"
#include "folio/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <exception>
#include <sstream>
#include <utility>

namespace folio {

// -----------------------------------------------------------------------------
// Constructor: the Portfolio knows the configured instruments from the start
// -----------------------------------------------------------------------------
AccountingEngine::AccountingEngine(AccountingConfig config)
    : config_(std::move(config)), portfolio_(config_.portfolio) {
  for (const auto& instrument : config_.instruments.all()) {
    portfolio_.registerInstrument(instrument);
  }
}

AccountingEngine::~AccountingEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void AccountingEngine::start(IReconciler* reconciler) {
  if (running_.load()) {
    return;
  }

  // ---  1) Consumers first --------------------------------------------------
  position_engine_ = std::make_unique<PositionEngine>(loop_.eventBus());
  subscribePortfolio();

  // Anything below may throw (a reconciler failure, a port already bound).
  // Unwind what was built so a failed start leaves no thread running over
  // the Portfolio and a retry subscribes only once.
  try {
    // ---  2) Warm-up gate ---------------------------------------------------
    if (reconciler != nullptr) {
      reconcile(*reconciler);
    }

    // ---  3) Loop, then outputs, then inputs --------------------------------
    loop_.start();

    const NetworkConfig& net = config_.network;
    if (!net.ipc_cmd_endpoint.empty() && !net.ipc_pub_endpoint.empty()) {
      ipc_server_ = std::make_unique<IpcServer>(
          [this](const std::string& cmd) { return executeCommand(cmd); },
          net.ipc_cmd_endpoint, net.ipc_pub_endpoint);
      ipc_server_->start();
      subscribeTelemetry();
    }

    if (!net.feed_endpoint.empty()) {
      feed_thread_ = std::make_unique<FeedThread>(
          config_.currencies, config_.instruments,
          [this](Event event) { pushEvent(std::move(event)); },
          net.feed_endpoint);
      feed_thread_->start();
    }
  } catch (const std::exception& e) {
    std::cerr << "[AccountingEngine] ERROR: start failed: " << e.what()
              << ". Rolling back.\n";
    teardown();
    throw;
  }

  running_.store(true);

  std::cout << "[AccountingEngine] started. Threads: accounting"
            << (ipc_server_ ? ", ipc" : "") << (feed_thread_ ? ", feed" : "")
            << ".\n";
}

void AccountingEngine::reconcile(IReconciler& reconciler) {
  auto accounts = reconciler.reconcileAccounts();
  for (const auto& state : accounts) {
    portfolio_.updateAccount(state);
  }

  auto positions = reconciler.reconcilePositions();
  for (const auto& pos : positions) {
    position_engine_->hydratePosition(pos);
    if (pos.isOpen()) {
      portfolio_.updatePosition(PositionOpenedEvent{pos, pos.openedTime(), 0});
    }
  }

  std::cout << "[AccountingEngine] Reconciliation complete: "
            << accounts.size() << " account(s), " << positions.size()
            << " position(s) hydrated.\n";
}

// -----------------------------------------------------------------------------
// stop(): inputs first, then the loop, then outputs
// -----------------------------------------------------------------------------
void AccountingEngine::stop() {
  if (!running_.load()) {
    return;
  }
  teardown();
  running_.store(false);

  std::cout << "[AccountingEngine] stopped. All threads joined.\n";
}

void AccountingEngine::teardown() {
  feed_thread_.reset();

  // Drains what the feed already queued; the IPC thread still reads the
  // PositionEngine, so it goes after the loop and before the engine.
  loop_.stop();
  ipc_server_.reset();

  for (auto id : subscriptions_) {
    loop_.eventBus().unsubscribe(id);
  }
  subscriptions_.clear();
  position_engine_.reset();
}

void AccountingEngine::pushEvent(Event event) { loop_.push(std::move(event)); }

// -----------------------------------------------------------------------------
// Bus wiring
// -----------------------------------------------------------------------------
void AccountingEngine::subscribePortfolio() {
  EventBus& bus = loop_.eventBus();

  subscriptions_.push_back(bus.subscribe<domain::QuoteTick>(
      [this](const domain::QuoteTick& tick) { portfolio_.updateTick(tick); }));

  subscriptions_.push_back(bus.subscribe<AccountStateEvent>(
      [this](const AccountStateEvent& state) {
        try {
          portfolio_.updateAccount(state);
        } catch (const domain::ContractViolation& e) {
          std::cerr << "[AccountingEngine] CONTRACT VIOLATION: " << e.what()
                    << " (account_id=" << state.account_id.value() << ")\n";
          reportFault("Portfolio", e.what(), state.account_id.value(),
                      state.timestamp, state.sequence_id);
        }
      }));

  subscriptions_.push_back(bus.subscribe<PositionOpenedEvent>(
      [this](const PositionOpenedEvent& e) { portfolio_.updatePosition(e); }));
  subscriptions_.push_back(bus.subscribe<PositionModifiedEvent>(
      [this](const PositionModifiedEvent& e) { portfolio_.updatePosition(e); }));
  subscriptions_.push_back(bus.subscribe<PositionClosedEvent>(
      [this](const PositionClosedEvent& e) { portfolio_.updatePosition(e); }));
}

void AccountingEngine::subscribeTelemetry() {
  EventBus& bus = loop_.eventBus();

  // encodeTelemetry() drops the kinds it has no form for.
  subscriptions_.push_back(bus.subscribe([this](const Event& event) {
    if (std::holds_alternative<domain::QuoteTick>(event) ||
        std::holds_alternative<OrderFilledEvent>(event)) {
      return;
    }
    ipc_server_->pushTelemetry(event);
  }));
}

void AccountingEngine::reportFault(const char* component,
                                   const std::string& reason,
                                   const std::string& reference,
                                   Timestamp timestamp,
                                   std::uint64_t sequence_id) {
  loop_.eventBus().publish(
      AccountingFaultEvent{component, reason, reference, timestamp, sequence_id});
}

// -----------------------------------------------------------------------------
// executeCommand(): "VERB [VENUE]" -> JSON
// -----------------------------------------------------------------------------
std::string AccountingEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  std::istringstream in(cmd);
  std::string verb;
  std::string arg;
  in >> verb >> arg;

  auto needsVenue = [&]() -> bool {
    if (arg.empty()) {
      response["status"] = "error";
      response["response"] = "Missing venue: " + cmd;
      return false;
    }
    return true;
  };

  try {
    if (verb == "PING") {
      response["status"] = "ok";
      response["response"] = "PONG";
    } else if (verb == "STATUS") {
      response["status"] = "ok";
      response["running"] = running_.load();

      nlohmann::json venues = nlohmann::json::array();
      for (const auto& acct : portfolio_.accounts()) {
        venues.push_back(acct.venue().value());
      }
      response["venues"] = std::move(venues);

      const EventBus& bus = loop_.eventBus();
      response["events"] = {
          {"quote_ticks", bus.publishedCount<domain::QuoteTick>()},
          {"account_states", bus.publishedCount<AccountStateEvent>()},
          {"fills", bus.publishedCount<OrderFilledEvent>()},
          {"faults", bus.publishedCount<AccountingFaultEvent>()}};

      if (position_engine_) {
        response["open_positions"] = position_engine_->openPositions().size();
        response["closed_positions"] =
            position_engine_->closedPositions().size();
        response["faults"] = position_engine_->faultCount();
      }
    } else if (verb == "ACCOUNT") {
      if (needsVenue()) {
        auto acct = portfolio_.account(domain::Venue(arg));
        response["status"] = "ok";
        response["account"] = acct ? toJson(*acct) : nlohmann::json(nullptr);
      }
    } else if (verb == "UNREALIZED_PNL") {
      if (needsVenue()) {
        response["status"] = "ok";
        response["unrealized_pnl"] =
            toJson(portfolio_.unrealizedPnl(domain::Venue(arg)));
      }
    } else if (verb == "OPEN_VALUE") {
      if (needsVenue()) {
        response["status"] = "ok";
        response["open_value"] = toJson(portfolio_.openValue(domain::Venue(arg)));
      }
    } else if (verb == "ORDER_MARGIN") {
      if (needsVenue()) {
        response["status"] = "ok";
        response["order_margin"] =
            toJson(portfolio_.orderMargin(domain::Venue(arg)));
      }
    } else if (verb == "POSITION_MARGIN") {
      if (needsVenue()) {
        response["status"] = "ok";
        response["position_margin"] =
            toJson(portfolio_.positionMargin(domain::Venue(arg)));
      }
    } else if (verb == "POSITIONS") {
      if (needsVenue()) {
        nlohmann::json positions = nlohmann::json::array();
        for (const auto& pos : portfolio_.openPositions(domain::Venue(arg))) {
          positions.push_back(toJson(pos));
        }
        response["status"] = "ok";
        response["positions"] = std::move(positions);
      }
    } else if (verb == "RESET") {
      portfolio_.reset();
      response["status"] = "ok";
      response["response"] = "Portfolio reset";
    } else {
      response["status"] = "error";
      response["response"] = "Unknown command: " + cmd;
    }
  } catch (const domain::ContractViolation& e) {
    response = nlohmann::json::object();
    response["status"] = "error";
    response["response"] = e.what();
  }

  // The command text is echoed back and may hold bytes that are not UTF-8.
  return response.dump(-1, ' ', false,
                       nlohmann::json::error_handler_t::replace);
}

}  // namespace folio
