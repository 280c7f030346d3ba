#pragma once

#include "folio/domain/decimal.hpp"

#include <cstdint>
#include <string>

namespace folio {
namespace domain {

// -----------------------------------------------------------------------------
// Currency
// -----------------------------------------------------------------------------
// An ISO-style code plus the number of fractional digits Money amounts in this
// currency are rounded to. Two currencies are the same when their codes match;
// the precision comes from the configured currency table.
// -----------------------------------------------------------------------------
struct Currency {
  std::string code;
  std::uint8_t precision{2};

  bool operator==(const Currency& other) const { return code == other.code; }
  bool operator!=(const Currency& other) const { return code != other.code; }
};

// -----------------------------------------------------------------------------
// Quantity
// -----------------------------------------------------------------------------
//
// @brief  Non-negative decimal magnitude (order size, position size).
//
// @details
// The precision is the instrument's size precision. Construction from a
// negative value, or a subtraction that would go below zero, throws
// ContractViolation. Quantities never mix with Price in arithmetic: the only
// bridge is the explicit Decimal value().
// -----------------------------------------------------------------------------
class Quantity {
 public:
  Quantity() = default;
  explicit Quantity(Decimal value);

  static Quantity fromString(const std::string& text);
  static Quantity fromInteger(std::int64_t value, std::uint8_t precision = 0);

  const Decimal& value() const { return value_; }
  std::uint8_t precision() const { return value_.precision(); }
  bool isZero() const { return value_.isZero(); }

  Quantity operator+(const Quantity& other) const;
  Quantity operator-(const Quantity& other) const;
  Quantity& operator+=(const Quantity& other);
  Quantity& operator-=(const Quantity& other);

  bool operator==(const Quantity& other) const { return value_ == other.value_; }
  bool operator!=(const Quantity& other) const { return value_ != other.value_; }
  bool operator<(const Quantity& other) const { return value_ < other.value_; }
  bool operator<=(const Quantity& other) const { return value_ <= other.value_; }
  bool operator>(const Quantity& other) const { return value_ > other.value_; }
  bool operator>=(const Quantity& other) const { return value_ >= other.value_; }

  std::string toString() const { return value_.toString(); }

 private:
  Decimal value_;
};

// -----------------------------------------------------------------------------
// Price
// -----------------------------------------------------------------------------
//
// @brief  Strictly positive decimal price in an instrument's quote currency.
//
// @details
// Prices are compared and scaled, never summed: there is deliberately no
// operator+ between prices, and none at all with Quantity. Construction from
// a zero or negative value throws ContractViolation.
// -----------------------------------------------------------------------------
class Price {
 public:
  explicit Price(Decimal value);

  static Price fromString(const std::string& text);

  const Decimal& value() const { return value_; }
  std::uint8_t precision() const { return value_.precision(); }

  bool operator==(const Price& other) const { return value_ == other.value_; }
  bool operator!=(const Price& other) const { return value_ != other.value_; }
  bool operator<(const Price& other) const { return value_ < other.value_; }
  bool operator<=(const Price& other) const { return value_ <= other.value_; }
  bool operator>(const Price& other) const { return value_ > other.value_; }
  bool operator>=(const Price& other) const { return value_ >= other.value_; }

  std::string toString() const { return value_.toString(); }

 private:
  Decimal value_;
};

// -----------------------------------------------------------------------------
// Money
// -----------------------------------------------------------------------------
//
// @brief  A signed amount in one currency, rounded to that currency's
//         precision on construction.
//
// @details
// Addition, subtraction and ordering require both operands to carry the same
// currency code; otherwise CurrencyMismatch is thrown. Equality is false for
// different currencies (Money(0, USD) != Money(0, BTC)).
//
// Conversion to another currency goes through convertedTo() with an explicit
// exchange rate, so every cross-currency step is visible at the call site.
// -----------------------------------------------------------------------------
class Money {
 public:
  Money(const Decimal& amount, Currency currency);

  static Money zero(const Currency& currency);
  static Money fromString(const std::string& amount, const Currency& currency);

  const Decimal& amount() const { return amount_; }
  const Currency& currency() const { return currency_; }

  bool isZero() const { return amount_.isZero(); }
  bool isNegative() const { return amount_.isNegative(); }

  // amount * rate, rounded to the target currency's precision.
  Money convertedTo(const Currency& target, const Decimal& rate) const;

  Money operator-() const;
  Money operator+(const Money& other) const;
  Money operator-(const Money& other) const;
  Money& operator+=(const Money& other);
  Money& operator-=(const Money& other);

  bool operator==(const Money& other) const;
  bool operator!=(const Money& other) const { return !(*this == other); }
  bool operator<(const Money& other) const;

  // "10816.00 USD"
  std::string toString() const;

 private:
  void requireSameCurrency(const Money& other) const;

  Decimal amount_;
  Currency currency_;
};

}  // namespace domain
}  // namespace folio
