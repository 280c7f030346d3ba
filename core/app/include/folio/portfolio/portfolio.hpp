#pragma once

#include "folio/domain/account.hpp"
#include "folio/domain/enums.hpp"
#include "folio/domain/identifiers.hpp"
#include "folio/domain/instrument.hpp"
#include "folio/domain/objects.hpp"
#include "folio/domain/position.hpp"
#include "folio/domain/quote_tick.hpp"
#include "folio/events/event.hpp"
#include "folio/portfolio/exchange_rate_resolver.hpp"

#include <functional>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace folio {

// Which side of the latest quote positions are marked at.
enum class MarkPriceConvention {
  SideDependent,  // Long at bid, Short at ask
  Bid,
  Ask,
  Mid,
};

struct PortfolioConfig {
  MarkPriceConvention mark_price{MarkPriceConvention::SideDependent};
};

// -----------------------------------------------------------------------------
// Portfolio: per-venue valuation over accounts, open positions and quotes
// -----------------------------------------------------------------------------
//
// @brief  Registry of one Account per venue, the open Positions (by id) and
//         the latest QuoteTick per symbol, with pull-based valuation queries.
//
// @details
// Nothing is cached between queries: unrealizedPnl() and openValue() walk the
// open positions of the venue every time, mark each one against the latest
// quote for its symbol, and convert into the account currency with an
// ExchangeRateResolver over that venue's quotes.
//
// Valuation returns std::nullopt, never a partial sum, when:
//   - no account is registered for the venue,
//   - a contributing position has no quote for its symbol, or
//   - a conversion into the account currency has no direct or inverse quote.
// A venue with an account and no open positions values at zero in the account
// currency.
//
// Open value is the entry basis, not the mark-to-market notional: a position
// whose base currency is the account currency commits its quantity (10 BTC on
// a BTC account); any other position commits avg_entry * qty in its quote
// currency, converted at the mark price type.
//
// Quote index:
//   Each tick is stored by symbol. Once the symbol's currency pair is known it
//   is also indexed by (venue, pair) for the resolver. Pairs come from
//   registerInstrument(), from position snapshots, or are inferred from
//   six-letter codes such as AUDUSD.
//
// Thread model:
//   Mutations arrive on the accounting loop thread; queries may come from the
//   IPC thread. One shared_mutex guards all registries: writers take a unique
//   lock, queries a shared lock. Every query returns copies.
// -----------------------------------------------------------------------------
class Portfolio {
 public:
  explicit Portfolio(PortfolioConfig config = {});

  Portfolio(const Portfolio&) = delete;
  Portfolio& operator=(const Portfolio&) = delete;

  // Registers an account for its venue, replacing any previous one.
  void registerAccount(const domain::Account& account);

  // Applies state to the venue's account when the ids match; otherwise
  // registers a new account built from it. States older than the account's
  // last update are logged and ignored.
  void updateAccount(const AccountStateEvent& state);

  std::optional<domain::Account> account(const domain::Venue& venue) const;
  std::vector<domain::Account> accounts() const;

  void registerInstrument(const domain::Instrument& instrument);

  // Opened inserts, Modified replaces the snapshot, Closed removes. Modified
  // or Closed for an id that is not registered is logged and ignored.
  void updatePosition(const PositionEvent& event);

  // Keeps the latest quote per symbol. A tick older than the cached one is
  // logged and ignored.
  void updateTick(const domain::QuoteTick& tick);

  std::optional<domain::Money> unrealizedPnl(const domain::Venue& venue) const;
  std::optional<domain::Money> openValue(const domain::Venue& venue) const;

  // Realized PnL carried by the venue's open positions, in the account
  // currency.
  std::optional<domain::Money> realizedPnl(const domain::Venue& venue) const;

  std::optional<domain::Money> orderMargin(const domain::Venue& venue) const;
  std::optional<domain::Money> positionMargin(const domain::Venue& venue) const;

  std::vector<domain::Position> openPositions(const domain::Venue& venue) const;
  std::optional<domain::Position> position(const domain::PositionId& id) const;
  std::optional<domain::QuoteTick> lastQuote(const domain::Symbol& symbol) const;

  // Drops every position and quote. Accounts and instruments are kept.
  void reset();

  const PortfolioConfig& config() const { return config_; }

 private:
  // Per-position contribution, or std::nullopt when it cannot be valued.
  using Contribution = std::function<std::optional<domain::Money>(
      const domain::Position&, const domain::QuoteTick&,
      const ExchangeRateResolver&, const domain::Currency&, domain::PriceType)>;

  std::optional<domain::Money> sumOverVenue(const domain::Venue& venue,
                                            const Contribution& each) const;

  domain::PriceType markPriceType(domain::PositionSide side) const;

  // Caller holds the unique lock.
  void learnPair(const domain::Symbol& symbol, const domain::CurrencyPair& pair);
  void indexQuote(const domain::QuoteTick& tick);

  PortfolioConfig config_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::Venue, domain::Account> accounts_;
  std::unordered_map<domain::PositionId, domain::Position> positions_;
  std::unordered_map<domain::Symbol, domain::QuoteTick> quotes_;
  std::unordered_map<domain::Symbol, domain::CurrencyPair> pairs_;
  std::unordered_map<domain::Venue, QuoteIndex> quote_index_;
};

}  // namespace folio
