#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace folio {
namespace domain {

// -----------------------------------------------------------------------------
// Decimal: signed fixed-point number
// -----------------------------------------------------------------------------
//
// @brief  A decimal value stored as an int64 mantissa and a number of
//         fractional digits: value = raw / 10^precision.
//
// @details
// All monetary arithmetic in the accounting core goes through Decimal so that
// prices such as 1.00010 and amounts such as 0.00004762 are represented
// exactly. Binary floating point is only used at the wire boundary
// (fromDouble) and for display (toDouble).
//
// Precision rules:
//   - add / subtract: result precision = max(lhs, rhs).
//   - multiply:       result precision = min(lhs + rhs, kMaxPrecision), or an
//                     explicit precision via multiply(other, precision).
//   - divide:         explicit result precision, always.
//   - weightedMean:   explicit result precision; no intermediate rounding.
//   - Any reduction in precision rounds half-to-even.
//
// Intermediate products use 128-bit integers. A result that does not fit in
// the int64 mantissa throws ContractViolation rather than wrapping.
//
// Equality and ordering are by value: 1.0 == 1.00.
// -----------------------------------------------------------------------------
class Decimal {
 public:
  static constexpr std::uint8_t kMaxPrecision = 12;

  Decimal() = default;

  // raw mantissa at the given precision: fromRaw(105, 2) == 1.05
  static Decimal fromRaw(std::int64_t raw, std::uint8_t precision);

  static Decimal fromInteger(std::int64_t value, std::uint8_t precision = 0);

  // Parses "-12.3400". The precision is the number of fractional digits
  // written. Throws ContractViolation on malformed text.
  static Decimal fromString(std::string_view text);

  // Rounds value to the given precision. Throws ContractViolation for NaN,
  // infinity, or magnitudes that do not fit.
  static Decimal fromDouble(double value, std::uint8_t precision);

  std::int64_t raw() const { return raw_; }
  std::uint8_t precision() const { return precision_; }

  bool isZero() const { return raw_ == 0; }
  bool isNegative() const { return raw_ < 0; }
  bool isPositive() const { return raw_ > 0; }

  Decimal abs() const;

  // Returns the same value at new_precision, rounding half-to-even when
  // digits are dropped.
  Decimal rescaled(std::uint8_t new_precision) const;

  Decimal multiply(const Decimal& other, std::uint8_t precision) const;
  Decimal divide(const Decimal& divisor, std::uint8_t precision) const;

  // (a * weight_a + b * weight_b) / (weight_a + weight_b) at `precision`,
  // rounded once at the end. The weighted sum is kept in 128 bits, so it may
  // exceed what an int64 mantissa holds at `precision` as long as the mean
  // itself fits. Throws ContractViolation when the weights sum to zero.
  static Decimal weightedMean(const Decimal& a, const Decimal& weight_a,
                              const Decimal& b, const Decimal& weight_b,
                              std::uint8_t precision);

  Decimal operator-() const;
  Decimal operator+(const Decimal& other) const;
  Decimal operator-(const Decimal& other) const;
  Decimal operator*(const Decimal& other) const;

  Decimal& operator+=(const Decimal& other);
  Decimal& operator-=(const Decimal& other);

  bool operator==(const Decimal& other) const { return compare(other) == 0; }
  bool operator!=(const Decimal& other) const { return compare(other) != 0; }
  bool operator<(const Decimal& other) const { return compare(other) < 0; }
  bool operator<=(const Decimal& other) const { return compare(other) <= 0; }
  bool operator>(const Decimal& other) const { return compare(other) > 0; }
  bool operator>=(const Decimal& other) const { return compare(other) >= 0; }

  // -1, 0 or +1.
  int compare(const Decimal& other) const;

  double toDouble() const;

  // Always prints exactly precision() fractional digits: "10500.00".
  std::string toString() const;

 private:
  Decimal(std::int64_t raw, std::uint8_t precision)
      : raw_(raw), precision_(precision) {}

  std::int64_t raw_{0};
  std::uint8_t precision_{0};
};

}  // namespace domain
}  // namespace folio
