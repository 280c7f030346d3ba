#pragma once

#include <stdexcept>
#include <string>

namespace folio {
namespace domain {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// Missing data (no account for a venue, no exchange rate, no mark quote) is
// never an exception: queries return std::nullopt.
//
// ContractViolation and its subclasses signal programming errors by the
// caller of a mutating operation (a fill for the wrong position, mixing
// currencies, a negative quantity). They derive from std::logic_error and are
// thrown to the caller, never retried.
//
// ConfigError and CodecError are data conditions at the edges of the system
// (configuration file, wire messages). They derive from std::runtime_error.
// -----------------------------------------------------------------------------
class ContractViolation : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

// A fill whose identity (position id, symbol, currencies) disagrees with the
// position it is applied to, or a fill for a position that is already closed.
class InvalidFill : public ContractViolation {
 public:
  using ContractViolation::ContractViolation;
};

// Arithmetic or comparison between two Money values of different currencies.
class CurrencyMismatch : public ContractViolation {
 public:
  CurrencyMismatch(const std::string& lhs, const std::string& rhs)
      : ContractViolation("currency mismatch: " + lhs + " vs " + rhs) {}
};

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class CodecError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace domain
}  // namespace folio
