#include "folio/domain/decimal.hpp"
#include "folio/domain/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace folio {
namespace domain {

namespace {

// 128-bit intermediate. Products of two int64 mantissas always fit; scaling
// by at most 10^24 is checked before it happens.
using Wide = __int128;

constexpr Wide kInt64Max = std::numeric_limits<std::int64_t>::max();
constexpr Wide kInt64Min = std::numeric_limits<std::int64_t>::min();

Wide pow10(unsigned exponent) {
  Wide result = 1;
  for (unsigned i = 0; i < exponent; ++i) {
    result *= 10;
  }
  return result;
}

std::int64_t narrow(Wide value) {
  if (value > kInt64Max || value < kInt64Min) {
    throw ContractViolation("decimal overflow");
  }
  return static_cast<std::int64_t>(value);
}

void checkPrecision(unsigned precision) {
  if (precision > Decimal::kMaxPrecision) {
    throw ContractViolation("decimal precision " + std::to_string(precision) +
                            " exceeds maximum of " +
                            std::to_string(Decimal::kMaxPrecision));
  }
}

// Rounds a non-negative quotient q with remainder r over denominator den
// half-to-even.
Wide roundHalfEven(Wide q, Wide r, Wide den) {
  Wide twice = r * 2;
  if (twice > den || (twice == den && (q % 2) != 0)) {
    ++q;
  }
  return q;
}

// num / den (den > 0), rounded half-to-even.
Wide divideRounded(Wide num, Wide den) {
  bool negative = num < 0;
  Wide magnitude = negative ? -num : num;
  Wide q = roundHalfEven(magnitude / den, magnitude % den, den);
  return negative ? -q : q;
}

constexpr Wide kWideMax =
    static_cast<Wide>((static_cast<unsigned __int128>(1) << 127) - 1);

Wide magnitudeOf(Wide value) { return value < 0 ? -value : value; }

// a * b, throwing instead of overflowing 128 bits.
Wide checkedMultiply(Wide a, Wide b) {
  if (a != 0 && magnitudeOf(b) > kWideMax / magnitudeOf(a)) {
    throw ContractViolation("decimal overflow");
  }
  return a * b;
}

Wide checkedAdd(Wide a, Wide b) {
  if ((b > 0 && a > kWideMax - b) || (b < 0 && a < -kWideMax - b)) {
    throw ContractViolation("decimal overflow");
  }
  return a + b;
}

// Mantissa of `d` at `precision` (>= d's own), widened.
Wide widenedRaw(const Decimal& d, unsigned precision) {
  return checkedMultiply(d.raw(), pow10(precision - d.precision()));
}

ContractViolation malformed(std::string_view text) {
  return ContractViolation("malformed decimal: '" + std::string(text) + "'");
}

}  // namespace

Decimal Decimal::fromRaw(std::int64_t raw, std::uint8_t precision) {
  checkPrecision(precision);
  return Decimal(raw, precision);
}

Decimal Decimal::fromInteger(std::int64_t value, std::uint8_t precision) {
  checkPrecision(precision);
  return Decimal(narrow(static_cast<Wide>(value) * pow10(precision)),
                 precision);
}

Decimal Decimal::fromString(std::string_view text) {
  std::string_view s = text;
  if (s.empty()) {
    throw malformed(text);
  }

  bool negative = false;
  if (s.front() == '-' || s.front() == '+') {
    negative = s.front() == '-';
    s.remove_prefix(1);
  }

  auto dot = s.find('.');
  std::string_view int_part = s.substr(0, dot);
  std::string_view frac_part =
      (dot == std::string_view::npos) ? std::string_view{} : s.substr(dot + 1);

  if (int_part.empty() ||
      (dot != std::string_view::npos && frac_part.empty())) {
    throw malformed(text);
  }
  if (frac_part.size() > kMaxPrecision) {
    throw ContractViolation("decimal '" + std::string(text) +
                            "' has more than " +
                            std::to_string(kMaxPrecision) +
                            " fractional digits");
  }

  Wide value = 0;
  auto accumulate = [&](std::string_view digits) {
    for (char c : digits) {
      if (c < '0' || c > '9') {
        throw malformed(text);
      }
      value = value * 10 + (c - '0');
      if (value > kInt64Max) {
        throw ContractViolation("decimal overflow: '" + std::string(text) +
                                "'");
      }
    }
  };
  accumulate(int_part);
  accumulate(frac_part);

  return Decimal(narrow(negative ? -value : value),
                 static_cast<std::uint8_t>(frac_part.size()));
}

Decimal Decimal::fromDouble(double value, std::uint8_t precision) {
  checkPrecision(precision);
  if (!std::isfinite(value)) {
    throw ContractViolation("decimal from non-finite double");
  }
  double scaled = value * std::pow(10.0, precision);
  if (std::fabs(scaled) >= 9.2e18) {
    throw ContractViolation("decimal overflow from double");
  }
  return Decimal(static_cast<std::int64_t>(std::llround(scaled)), precision);
}

Decimal Decimal::abs() const {
  return Decimal(narrow(raw_ < 0 ? -static_cast<Wide>(raw_) : raw_),
                 precision_);
}

Decimal Decimal::rescaled(std::uint8_t new_precision) const {
  checkPrecision(new_precision);
  if (new_precision == precision_) {
    return *this;
  }
  if (new_precision > precision_) {
    return Decimal(
        narrow(static_cast<Wide>(raw_) * pow10(new_precision - precision_)),
        new_precision);
  }
  return Decimal(
      narrow(divideRounded(raw_, pow10(precision_ - new_precision))),
      new_precision);
}

Decimal Decimal::multiply(const Decimal& other, std::uint8_t precision) const {
  checkPrecision(precision);
  Wide product = static_cast<Wide>(raw_) * other.raw_;
  unsigned source = precision_ + other.precision_;

  if (precision >= source) {
    // Scaling up can only grow the magnitude; anything already beyond int64
    // cannot come back into range.
    if (product > kInt64Max || product < kInt64Min) {
      throw ContractViolation("decimal overflow");
    }
    return Decimal(narrow(product * pow10(precision - source)), precision);
  }
  return Decimal(narrow(divideRounded(product, pow10(source - precision))),
                 precision);
}

Decimal Decimal::divide(const Decimal& divisor, std::uint8_t precision) const {
  checkPrecision(precision);
  if (divisor.raw_ == 0) {
    throw ContractViolation("decimal division by zero");
  }

  // value = (a / 10^pa) / (b / 10^pb); at result precision p the mantissa is
  // a * 10^(pb + p) / (b * 10^pa). Long division keeps every intermediate
  // below den * 10.
  bool negative = (raw_ < 0) != (divisor.raw_ < 0);
  Wide num = raw_ < 0 ? -static_cast<Wide>(raw_) : raw_;
  Wide den = (divisor.raw_ < 0 ? -static_cast<Wide>(divisor.raw_)
                               : divisor.raw_) *
             pow10(precision_);

  Wide q = num / den;
  Wide r = num % den;
  unsigned shift = divisor.precision_ + precision;
  for (unsigned i = 0; i < shift; ++i) {
    r *= 10;
    q = q * 10 + r / den;
    r %= den;
    if (q > kInt64Max) {
      throw ContractViolation("decimal overflow");
    }
  }
  q = roundHalfEven(q, r, den);

  return Decimal(narrow(negative ? -q : q), precision);
}

Decimal Decimal::weightedMean(const Decimal& a, const Decimal& weight_a,
                              const Decimal& b, const Decimal& weight_b,
                              std::uint8_t precision) {
  checkPrecision(precision);

  // Align the values to one scale and the weights to another; the weighted
  // sum is then at scale pv + pw and the weight total at scale pw.
  unsigned pv = std::max(a.precision(), b.precision());
  unsigned pw = std::max(weight_a.precision(), weight_b.precision());

  Wide wa = widenedRaw(weight_a, pw);
  Wide wb = widenedRaw(weight_b, pw);
  Wide total_weight = checkedAdd(wa, wb);
  if (total_weight == 0) {
    throw ContractViolation("decimal weighted mean with zero total weight");
  }

  Wide sum = checkedAdd(checkedMultiply(widenedRaw(a, pv), wa),
                        checkedMultiply(widenedRaw(b, pv), wb));

  // mean mantissa at p = sum * 10^p / (total_weight * 10^pv). Long division
  // as in divide(), so the sum is never scaled up.
  bool negative = (sum < 0) != (total_weight < 0);
  Wide num = magnitudeOf(sum);
  Wide den = checkedMultiply(magnitudeOf(total_weight), pow10(pv));
  if (den > kWideMax / 10) {
    throw ContractViolation("decimal overflow");
  }

  Wide q = num / den;
  Wide r = num % den;
  if (q > kInt64Max) {
    throw ContractViolation("decimal overflow");
  }
  for (unsigned i = 0; i < precision; ++i) {
    r *= 10;
    q = q * 10 + r / den;
    r %= den;
    if (q > kInt64Max) {
      throw ContractViolation("decimal overflow");
    }
  }
  q = roundHalfEven(q, r, den);

  return Decimal(narrow(negative ? -q : q), precision);
}

Decimal Decimal::operator-() const {
  return Decimal(narrow(-static_cast<Wide>(raw_)), precision_);
}

Decimal Decimal::operator+(const Decimal& other) const {
  std::uint8_t p = std::max(precision_, other.precision_);
  return Decimal(narrow(static_cast<Wide>(rescaled(p).raw_) +
                        other.rescaled(p).raw_),
                 p);
}

Decimal Decimal::operator-(const Decimal& other) const {
  std::uint8_t p = std::max(precision_, other.precision_);
  return Decimal(narrow(static_cast<Wide>(rescaled(p).raw_) -
                        other.rescaled(p).raw_),
                 p);
}

Decimal Decimal::operator*(const Decimal& other) const {
  unsigned p = precision_ + other.precision_;
  return multiply(other, static_cast<std::uint8_t>(
                             std::min<unsigned>(p, kMaxPrecision)));
}

Decimal& Decimal::operator+=(const Decimal& other) {
  *this = *this + other;
  return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
  *this = *this - other;
  return *this;
}

int Decimal::compare(const Decimal& other) const {
  unsigned p = std::max(precision_, other.precision_);
  Wide lhs = static_cast<Wide>(raw_) * pow10(p - precision_);
  Wide rhs = static_cast<Wide>(other.raw_) * pow10(p - other.precision_);
  if (lhs < rhs) {
    return -1;
  }
  return lhs > rhs ? 1 : 0;
}

double Decimal::toDouble() const {
  return static_cast<double>(raw_) / std::pow(10.0, precision_);
}

std::string Decimal::toString() const {
  Wide magnitude = raw_ < 0 ? -static_cast<Wide>(raw_) : raw_;
  std::string digits =
      std::to_string(static_cast<unsigned long long>(magnitude));

  if (precision_ > 0) {
    if (digits.size() <= precision_) {
      digits.insert(0, precision_ + 1 - digits.size(), '0');
    }
    digits.insert(digits.size() - precision_, 1, '.');
  }
  return raw_ < 0 ? "-" + digits : digits;
}

}  // namespace domain
}  // namespace folio
