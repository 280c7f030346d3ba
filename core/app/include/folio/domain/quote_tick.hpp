#pragma once

#include "folio/domain/enums.hpp"
#include "folio/domain/identifiers.hpp"
#include "folio/domain/objects.hpp"
#include "folio/time/time_utils.hpp"

#include <cstdint>

namespace folio {
namespace domain {

// -----------------------------------------------------------------------------
// QuoteTick
// -----------------------------------------------------------------------------
//
// @brief  Immutable two-sided top-of-book quote for one symbol.
//
// @details
// The Portfolio keeps only the latest tick per symbol. Ticks are used twice:
// as the mark price for positions on that symbol, and as exchange rates
// between the symbol's base and quote currencies.
//
// Thread model:
//   Plain value type, copied into events and into the Portfolio cache.
// -----------------------------------------------------------------------------
struct QuoteTick {
  Symbol symbol;
  Price bid;
  Price ask;
  Quantity bid_size;
  Quantity ask_size;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};

  // Bid, ask, or the mid computed with one extra fractional digit so that
  // (0.80501 + 0.80505) / 2 is exact.
  Price price(PriceType type) const;
};

}  // namespace domain
}  // namespace folio
