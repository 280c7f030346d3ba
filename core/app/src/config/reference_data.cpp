#include "folio/config/reference_data.hpp"
#include "folio/domain/errors.hpp"

namespace folio {

CurrencyTable::CurrencyTable()
    : digits_{{"USD", 2}, {"EUR", 2}, {"GBP", 2}, {"AUD", 2},
              {"JPY", 2}, {"CHF", 2}, {"CAD", 2}, {"NZD", 2},
              {"BTC", 8}, {"XBT", 8}, {"ETH", 8}, {"USDT", 8}} {}

void CurrencyTable::set(const std::string& code, std::uint8_t precision) {
  if (code.empty()) {
    throw domain::ConfigError("currency code must not be empty");
  }
  if (precision > domain::Decimal::kMaxPrecision) {
    throw domain::ConfigError("currency " + code + " precision " +
                              std::to_string(precision) + " exceeds " +
                              std::to_string(domain::Decimal::kMaxPrecision));
  }
  digits_.insert_or_assign(code, precision);
}

domain::Currency CurrencyTable::at(const std::string& code) const {
  auto currency = find(code);
  if (!currency) {
    throw domain::ConfigError("unknown currency: " + code);
  }
  return *currency;
}

std::optional<domain::Currency> CurrencyTable::find(
    const std::string& code) const {
  auto it = digits_.find(code);
  if (it == digits_.end()) {
    return std::nullopt;
  }
  return domain::Currency{it->first, it->second};
}

void InstrumentTable::add(const domain::Instrument& instrument) {
  instruments_.insert_or_assign(instrument.symbol, instrument);
}

std::optional<domain::Instrument> InstrumentTable::find(
    const domain::Symbol& symbol) const {
  auto it = instruments_.find(symbol);
  if (it == instruments_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Instrument> InstrumentTable::all() const {
  std::vector<domain::Instrument> result;
  result.reserve(instruments_.size());
  for (const auto& [symbol, instrument] : instruments_) {
    result.push_back(instrument);
  }
  return result;
}

}  // namespace folio
