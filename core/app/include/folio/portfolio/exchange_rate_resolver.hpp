#pragma once

#include "folio/domain/decimal.hpp"
#include "folio/domain/enums.hpp"
#include "folio/domain/instrument.hpp"
#include "folio/domain/objects.hpp"
#include "folio/domain/quote_tick.hpp"

#include <cstdint>
#include <optional>
#include <unordered_map>

namespace folio {

// Latest quote per currency pair, as maintained by the Portfolio.
using QuoteIndex = std::unordered_map<domain::CurrencyPair, domain::QuoteTick>;

// -----------------------------------------------------------------------------
// ExchangeRateResolver
// -----------------------------------------------------------------------------
//
// @brief  Resolves the rate that converts one currency into another from the
//         quotes currently cached.
//
// @details
// Lookup order for rate(from, to, type):
//   1. from == to                    -> 1
//   2. (from, to) is quoted directly -> that quote's price(type)
//   3. (to, from) is quoted          -> 1 / price(type), to kRatePrecision
//   4. otherwise                     -> std::nullopt
//
// There is no triangulation through a third currency: a missing direct or
// inverse quote makes the rate unavailable, and callers treat that as "value
// unknown" rather than guessing.
//
// Thread model:
//   Holds a reference to the index; the caller keeps it alive and stable for
//   the duration of the calls (the Portfolio holds its shared lock).
// -----------------------------------------------------------------------------
class ExchangeRateResolver {
 public:
  static constexpr std::uint8_t kRatePrecision = 12;

  explicit ExchangeRateResolver(const QuoteIndex& quotes) : quotes_(quotes) {}

  std::optional<domain::Decimal> rate(const domain::Currency& from,
                                      const domain::Currency& to,
                                      domain::PriceType type) const;

  // money converted into `to`, rounded to its precision.
  std::optional<domain::Money> convert(const domain::Money& money,
                                       const domain::Currency& to,
                                       domain::PriceType type) const;

 private:
  const QuoteIndex& quotes_;
};

}  // namespace folio
