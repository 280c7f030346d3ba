#pragma once

#include "folio/domain/identifiers.hpp"
#include "folio/domain/objects.hpp"
#include "folio/events/event_types.hpp"
#include "folio/time/time_utils.hpp"

#include <cstddef>
#include <string>

namespace folio {
namespace domain {

// -----------------------------------------------------------------------------
// Account
// -----------------------------------------------------------------------------
//
// @brief  Latest known balances of one venue account, in one currency.
//
// @details
// An Account is a mirror of the venue's ledger, not a ledger of its own: it is
// built from an AccountStateEvent and each later event replaces every balance
// at once. Nothing here is derived from fills.
//
// Every Money carried by a state event must be in the event's currency; a
// mismatch throws CurrencyMismatch. applyState() additionally rejects events
// for a different account id or a different currency (ContractViolation).
//
// Thread model:
//   Value type. The Portfolio stores one per venue behind its own lock and
//   hands out copies.
// -----------------------------------------------------------------------------
class Account {
 public:
  explicit Account(const AccountStateEvent& state);

  // Replaces all balances with the ones in state.
  void applyState(const AccountStateEvent& state);

  const AccountId& id() const { return id_; }
  const Venue& venue() const { return id_.venue(); }
  const Currency& currency() const { return currency_; }

  const Money& balance() const { return balance_; }
  const Money& freeBalance() const { return free_; }
  const Money& lockedBalance() const { return locked_; }
  const Money& orderMargin() const { return order_margin_; }
  const Money& positionMargin() const { return position_margin_; }

  const std::string& lastEventId() const { return last_event_id_; }
  Timestamp lastUpdated() const { return last_updated_; }
  std::size_t eventCount() const { return event_count_; }

 private:
  static void checkCurrencies(const AccountStateEvent& state);

  AccountId id_;
  Currency currency_;
  Money balance_;
  Money free_;
  Money locked_;
  Money order_margin_;
  Money position_margin_;
  std::string last_event_id_;
  Timestamp last_updated_{};
  std::size_t event_count_{0};
};

}  // namespace domain
}  // namespace folio
