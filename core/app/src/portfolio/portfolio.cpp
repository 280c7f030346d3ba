#include "folio/portfolio/portfolio.hpp"

#include <iostream>
#include <mutex>
#include <type_traits>
#include <variant>

namespace folio {

namespace {

const QuoteIndex& emptyIndex() {
  static const QuoteIndex kEmpty;
  return kEmpty;
}

}  // namespace

Portfolio::Portfolio(PortfolioConfig config) : config_(config) {}

// -----------------------------------------------------------------------------
// Accounts
// -----------------------------------------------------------------------------
void Portfolio::registerAccount(const domain::Account& account) {
  std::unique_lock lock(mutex_);
  accounts_.insert_or_assign(account.venue(), account);
}

void Portfolio::updateAccount(const AccountStateEvent& state) {
  std::unique_lock lock(mutex_);
  const domain::Venue& venue = state.account_id.venue();

  auto it = accounts_.find(venue);
  if (it != accounts_.end() && it->second.id() == state.account_id) {
    if (state.timestamp < it->second.lastUpdated()) {
      std::cerr << "[Portfolio] WARNING: stale account state "
                << state.event_id << " for " << state.account_id.value()
                << ". Skipping.\n";
      return;
    }
    it->second.applyState(state);
    return;
  }

  accounts_.insert_or_assign(venue, domain::Account(state));
}

std::optional<domain::Account> Portfolio::account(
    const domain::Venue& venue) const {
  std::shared_lock lock(mutex_);
  auto it = accounts_.find(venue);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Account> Portfolio::accounts() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Account> result;
  result.reserve(accounts_.size());
  for (const auto& [venue, acct] : accounts_) {
    result.push_back(acct);
  }
  return result;
}

// -----------------------------------------------------------------------------
// Reference data and quotes
// -----------------------------------------------------------------------------
void Portfolio::registerInstrument(const domain::Instrument& instrument) {
  std::unique_lock lock(mutex_);
  learnPair(instrument.symbol, instrument.pair());
}

void Portfolio::updateTick(const domain::QuoteTick& tick) {
  std::unique_lock lock(mutex_);

  auto it = quotes_.find(tick.symbol);
  if (it != quotes_.end()) {
    if (tick.timestamp < it->second.timestamp) {
      std::cerr << "[Portfolio] WARNING: stale quote for "
                << tick.symbol.toString() << ". Skipping.\n";
      return;
    }
    it->second = tick;
  } else {
    quotes_.emplace(tick.symbol, tick);
    if (pairs_.count(tick.symbol) == 0) {
      if (auto inferred = domain::CurrencyPair::inferFromCode(tick.symbol.code())) {
        pairs_.emplace(tick.symbol, *inferred);
      }
    }
  }

  indexQuote(tick);
}

std::optional<domain::QuoteTick> Portfolio::lastQuote(
    const domain::Symbol& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = quotes_.find(symbol);
  if (it == quotes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void Portfolio::learnPair(const domain::Symbol& symbol,
                          const domain::CurrencyPair& pair) {
  pairs_.insert_or_assign(symbol, pair);
  auto quote = quotes_.find(symbol);
  if (quote != quotes_.end()) {
    indexQuote(quote->second);
  }
}

void Portfolio::indexQuote(const domain::QuoteTick& tick) {
  auto pair = pairs_.find(tick.symbol);
  if (pair == pairs_.end()) {
    return;
  }
  quote_index_[tick.symbol.venue()].insert_or_assign(pair->second, tick);
}

// -----------------------------------------------------------------------------
// Positions
// -----------------------------------------------------------------------------
void Portfolio::updatePosition(const PositionEvent& event) {
  std::unique_lock lock(mutex_);

  std::visit(
      [this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        const domain::Position& pos = e.position;

        if constexpr (std::is_same_v<T, PositionOpenedEvent>) {
          if (positions_.count(pos.id()) != 0) {
            std::cerr << "[Portfolio] WARNING: duplicate opened event for "
                         "position_id="
                      << pos.id().value() << ". Replacing snapshot.\n";
          }
          positions_.insert_or_assign(pos.id(), pos);
          learnPair(pos.symbol(), domain::CurrencyPair{pos.baseCurrency().code,
                                                       pos.quoteCurrency().code});
        } else {
          auto it = positions_.find(pos.id());
          if (it == positions_.end()) {
            std::cerr << "[Portfolio] WARNING: "
                      << (std::is_same_v<T, PositionModifiedEvent> ? "modified"
                                                                   : "closed")
                      << " event for unknown position_id=" << pos.id().value()
                      << ". Skipping.\n";
            return;
          }
          if constexpr (std::is_same_v<T, PositionModifiedEvent>) {
            it->second = pos;
          } else {
            positions_.erase(it);
          }
        }
      },
      event);
}

std::vector<domain::Position> Portfolio::openPositions(
    const domain::Venue& venue) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Position> result;
  for (const auto& [id, pos] : positions_) {
    if (pos.symbol().venue() == venue) {
      result.push_back(pos);
    }
  }
  return result;
}

std::optional<domain::Position> Portfolio::position(
    const domain::PositionId& id) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(id);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// Valuation
// -----------------------------------------------------------------------------
domain::PriceType Portfolio::markPriceType(domain::PositionSide side) const {
  switch (config_.mark_price) {
    case MarkPriceConvention::Bid:
      return domain::PriceType::Bid;
    case MarkPriceConvention::Ask:
      return domain::PriceType::Ask;
    case MarkPriceConvention::Mid:
      return domain::PriceType::Mid;
    case MarkPriceConvention::SideDependent:
      break;
  }
  return side == domain::PositionSide::Short ? domain::PriceType::Ask
                                             : domain::PriceType::Bid;
}

std::optional<domain::Money> Portfolio::sumOverVenue(
    const domain::Venue& venue, const Contribution& each) const {
  std::shared_lock lock(mutex_);

  auto acct = accounts_.find(venue);
  if (acct == accounts_.end()) {
    return std::nullopt;
  }
  const domain::Currency& target = acct->second.currency();

  auto index = quote_index_.find(venue);
  ExchangeRateResolver resolver(index != quote_index_.end() ? index->second
                                                            : emptyIndex());

  domain::Money total = domain::Money::zero(target);
  for (const auto& [id, pos] : positions_) {
    if (pos.symbol().venue() != venue) {
      continue;
    }
    auto quote = quotes_.find(pos.symbol());
    if (quote == quotes_.end()) {
      return std::nullopt;
    }
    auto value = each(pos, quote->second, resolver, target,
                      markPriceType(pos.side()));
    if (!value) {
      return std::nullopt;
    }
    total += *value;
  }
  return total;
}

std::optional<domain::Money> Portfolio::unrealizedPnl(
    const domain::Venue& venue) const {
  return sumOverVenue(
      venue, [](const domain::Position& pos, const domain::QuoteTick& quote,
                const ExchangeRateResolver& resolver,
                const domain::Currency& target, domain::PriceType type) {
        return resolver.convert(pos.unrealizedPnl(quote.price(type)), target,
                                type);
      });
}

std::optional<domain::Money> Portfolio::openValue(
    const domain::Venue& venue) const {
  return sumOverVenue(
      venue, [](const domain::Position& pos, const domain::QuoteTick&,
                const ExchangeRateResolver& resolver,
                const domain::Currency& target,
                domain::PriceType type) -> std::optional<domain::Money> {
        if (pos.baseCurrency() == target) {
          return domain::Money(pos.quantity().value(), target);
        }
        return resolver.convert(pos.entryNotional(), target, type);
      });
}

std::optional<domain::Money> Portfolio::realizedPnl(
    const domain::Venue& venue) const {
  return sumOverVenue(
      venue, [](const domain::Position& pos, const domain::QuoteTick&,
                const ExchangeRateResolver& resolver,
                const domain::Currency& target, domain::PriceType type) {
        return resolver.convert(pos.realizedPnl(), target, type);
      });
}

std::optional<domain::Money> Portfolio::orderMargin(
    const domain::Venue& venue) const {
  std::shared_lock lock(mutex_);
  auto it = accounts_.find(venue);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second.orderMargin();
}

std::optional<domain::Money> Portfolio::positionMargin(
    const domain::Venue& venue) const {
  std::shared_lock lock(mutex_);
  auto it = accounts_.find(venue);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second.positionMargin();
}

void Portfolio::reset() {
  std::unique_lock lock(mutex_);
  positions_.clear();
  quotes_.clear();
  quote_index_.clear();
}

}  // namespace folio
