#pragma once

#include "folio/domain/identifiers.hpp"
#include "folio/domain/objects.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace folio {
namespace domain {

// Base/quote currency codes of a quoted instrument: AUDUSD is (AUD, USD).
struct CurrencyPair {
  std::string base;
  std::string quote;

  bool operator==(const CurrencyPair& other) const {
    return base == other.base && quote == other.quote;
  }
  bool operator!=(const CurrencyPair& other) const { return !(*this == other); }

  // Six-letter FX-style codes ("AUDUSD", "BTCUSD") split 3/3. Anything else
  // has to be configured explicitly.
  static std::optional<CurrencyPair> inferFromCode(const std::string& code);
};

// -----------------------------------------------------------------------------
// Instrument
// -----------------------------------------------------------------------------
// Reference data for one symbol: its currency pair and the number of
// fractional digits its prices and sizes are quoted with.
// -----------------------------------------------------------------------------
struct Instrument {
  Symbol symbol;
  Currency base_currency;
  Currency quote_currency;
  std::uint8_t price_precision{5};
  std::uint8_t size_precision{0};

  CurrencyPair pair() const {
    return CurrencyPair{base_currency.code, quote_currency.code};
  }
};

}  // namespace domain
}  // namespace folio

namespace std {

template <>
struct hash<folio::domain::CurrencyPair> {
  size_t operator()(const folio::domain::CurrencyPair& pair) const noexcept {
    return hash<string>{}(pair.base + "/" + pair.quote);
  }
};

}  // namespace std
