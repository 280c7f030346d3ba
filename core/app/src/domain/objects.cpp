#include "folio/domain/objects.hpp"
#include "folio/domain/errors.hpp"

#include <utility>

namespace folio {
namespace domain {

// -----------------------------------------------------------------------------
// Quantity
// -----------------------------------------------------------------------------
Quantity::Quantity(Decimal value) : value_(value) {
  if (value_.isNegative()) {
    throw ContractViolation("quantity cannot be negative: " +
                            value_.toString());
  }
}

Quantity Quantity::fromString(const std::string& text) {
  return Quantity(Decimal::fromString(text));
}

Quantity Quantity::fromInteger(std::int64_t value, std::uint8_t precision) {
  return Quantity(Decimal::fromInteger(value, precision));
}

Quantity Quantity::operator+(const Quantity& other) const {
  return Quantity(value_ + other.value_);
}

Quantity Quantity::operator-(const Quantity& other) const {
  // The constructor rejects a negative result.
  return Quantity(value_ - other.value_);
}

Quantity& Quantity::operator+=(const Quantity& other) {
  *this = *this + other;
  return *this;
}

Quantity& Quantity::operator-=(const Quantity& other) {
  *this = *this - other;
  return *this;
}

// -----------------------------------------------------------------------------
// Price
// -----------------------------------------------------------------------------
Price::Price(Decimal value) : value_(value) {
  if (!value_.isPositive()) {
    throw ContractViolation("price must be positive: " + value_.toString());
  }
}

Price Price::fromString(const std::string& text) {
  return Price(Decimal::fromString(text));
}

// -----------------------------------------------------------------------------
// Money
// -----------------------------------------------------------------------------
Money::Money(const Decimal& amount, Currency currency)
    : amount_(amount.rescaled(currency.precision)),
      currency_(std::move(currency)) {
  if (currency_.code.empty()) {
    throw ContractViolation("money requires a currency code");
  }
}

Money Money::zero(const Currency& currency) {
  return Money(Decimal::fromInteger(0, currency.precision), currency);
}

Money Money::fromString(const std::string& amount, const Currency& currency) {
  return Money(Decimal::fromString(amount), currency);
}

Money Money::convertedTo(const Currency& target, const Decimal& rate) const {
  return Money(amount_.multiply(rate, target.precision), target);
}

Money Money::operator-() const { return Money(-amount_, currency_); }

Money Money::operator+(const Money& other) const {
  requireSameCurrency(other);
  return Money(amount_ + other.amount_, currency_);
}

Money Money::operator-(const Money& other) const {
  requireSameCurrency(other);
  return Money(amount_ - other.amount_, currency_);
}

Money& Money::operator+=(const Money& other) {
  *this = *this + other;
  return *this;
}

Money& Money::operator-=(const Money& other) {
  *this = *this - other;
  return *this;
}

bool Money::operator==(const Money& other) const {
  return currency_ == other.currency_ && amount_ == other.amount_;
}

bool Money::operator<(const Money& other) const {
  requireSameCurrency(other);
  return amount_ < other.amount_;
}

std::string Money::toString() const {
  return amount_.toString() + " " + currency_.code;
}

void Money::requireSameCurrency(const Money& other) const {
  if (currency_ != other.currency_) {
    throw CurrencyMismatch(currency_.code, other.currency_.code);
  }
}

}  // namespace domain
}  // namespace folio
