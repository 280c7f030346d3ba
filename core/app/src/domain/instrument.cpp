#include "folio/domain/instrument.hpp"
#include "folio/domain/quote_tick.hpp"

#include <algorithm>
#include <cctype>

namespace folio {
namespace domain {

std::optional<CurrencyPair> CurrencyPair::inferFromCode(
    const std::string& code) {
  if (code.size() != 6) {
    return std::nullopt;
  }
  bool letters = std::all_of(code.begin(), code.end(), [](char c) {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
  });
  if (!letters) {
    return std::nullopt;
  }
  return CurrencyPair{code.substr(0, 3), code.substr(3, 3)};
}

Price QuoteTick::price(PriceType type) const {
  switch (type) {
    case PriceType::Bid:
      return bid;
    case PriceType::Ask:
      return ask;
    case PriceType::Mid: {
      std::uint8_t p = std::max(bid.precision(), ask.precision());
      if (p < Decimal::kMaxPrecision) {
        ++p;
      }
      Decimal sum = bid.value() + ask.value();
      return Price(sum.divide(Decimal::fromInteger(2), p));
    }
  }
  return bid;
}

}  // namespace domain
}  // namespace folio
