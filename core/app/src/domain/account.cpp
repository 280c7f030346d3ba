#include "folio/domain/account.hpp"
#include "folio/domain/errors.hpp"

#include <initializer_list>

namespace folio {
namespace domain {

Account::Account(const AccountStateEvent& state)
    : id_(state.account_id),
      currency_(state.currency),
      balance_(state.balance),
      free_(state.margin_available),
      locked_(state.margin_used),
      order_margin_(state.order_margin),
      position_margin_(state.position_margin),
      last_event_id_(state.event_id),
      last_updated_(state.timestamp),
      event_count_(1) {
  checkCurrencies(state);
}

void Account::applyState(const AccountStateEvent& state) {
  if (state.account_id != id_) {
    throw ContractViolation("account state for " + state.account_id.value() +
                            " applied to account " + id_.value());
  }
  if (state.currency != currency_) {
    throw ContractViolation("account " + id_.value() + " is denominated in " +
                            currency_.code + ", state event is in " +
                            state.currency.code);
  }
  checkCurrencies(state);

  balance_ = state.balance;
  free_ = state.margin_available;
  locked_ = state.margin_used;
  order_margin_ = state.order_margin;
  position_margin_ = state.position_margin;
  last_event_id_ = state.event_id;
  last_updated_ = state.timestamp;
  ++event_count_;
}

void Account::checkCurrencies(const AccountStateEvent& state) {
  for (const Money* m : {&state.balance, &state.margin_used,
                         &state.margin_available, &state.order_margin,
                         &state.position_margin}) {
    if (m->currency() != state.currency) {
      throw CurrencyMismatch(state.currency.code, m->currency().code);
    }
  }
}

}  // namespace domain
}  // namespace folio
