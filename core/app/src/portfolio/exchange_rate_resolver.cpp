#include "folio/portfolio/exchange_rate_resolver.hpp"

namespace folio {

std::optional<domain::Decimal> ExchangeRateResolver::rate(
    const domain::Currency& from, const domain::Currency& to,
    domain::PriceType type) const {
  if (from == to) {
    return domain::Decimal::fromInteger(1);
  }

  auto direct = quotes_.find(domain::CurrencyPair{from.code, to.code});
  if (direct != quotes_.end()) {
    return direct->second.price(type).value();
  }

  auto inverse = quotes_.find(domain::CurrencyPair{to.code, from.code});
  if (inverse != quotes_.end()) {
    return domain::Decimal::fromInteger(1).divide(
        inverse->second.price(type).value(), kRatePrecision);
  }

  return std::nullopt;
}

std::optional<domain::Money> ExchangeRateResolver::convert(
    const domain::Money& money, const domain::Currency& to,
    domain::PriceType type) const {
  if (money.currency() == to) {
    return domain::Money(money.amount(), to);
  }
  auto r = rate(money.currency(), to, type);
  if (!r) {
    return std::nullopt;
  }
  return money.convertedTo(to, *r);
}

}  // namespace folio
