#pragma once

#include "folio/domain/enums.hpp"
#include "folio/domain/identifiers.hpp"
#include "folio/domain/objects.hpp"
#include "folio/time/time_utils.hpp"

#include <cstdint>
#include <string>

namespace folio {

// -----------------------------------------------------------------------------
// OrderFilledEvent
// -----------------------------------------------------------------------------
// Responsibility: Confirms that an order executed at a price and quantity and
// names the position it belongs to.
// Why in architecture: Produced by the (out of scope) execution layer. The
// PositionEngine consumes it: the first fill for a position id creates the
// Position, later fills are applied to it.
// -----------------------------------------------------------------------------
struct OrderFilledEvent {
  domain::OrderId order_id;
  domain::PositionId position_id;
  domain::StrategyId strategy_id;
  domain::Symbol symbol;
  domain::OrderSide side{domain::OrderSide::Buy};
  domain::Quantity quantity;
  domain::Price price;
  domain::Currency base_currency;
  domain::Currency quote_currency;
  domain::Money commission;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// AccountStateEvent
// -----------------------------------------------------------------------------
// Responsibility: Authoritative snapshot of an account's balances from the
// venue's ledger.
// Why in architecture: Accounts are never derived from fills locally; each
// AccountStateEvent replaces the previous snapshot wholesale.
//
// margin_used is the locked balance, margin_available the free balance.
// order_margin and position_margin break margin_used down by what it backs;
// venues that do not report the breakdown send zero for both.
// -----------------------------------------------------------------------------
struct AccountStateEvent {
  domain::AccountId account_id;
  domain::Currency currency;
  domain::Money balance;
  domain::Money margin_used;
  domain::Money margin_available;
  domain::Money order_margin;
  domain::Money position_margin;
  std::string event_id;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// AccountingFaultEvent
// -----------------------------------------------------------------------------
// Responsibility: Reports a contract violation caught at the event-loop
// boundary (e.g. a fill for an already closed position) so it reaches
// telemetry instead of terminating the loop thread.
// -----------------------------------------------------------------------------
struct AccountingFaultEvent {
  std::string component;  // Which component rejected the input
  std::string reason;     // Exception message
  std::string reference;  // Offending id (position id, order id, ...)
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace folio
