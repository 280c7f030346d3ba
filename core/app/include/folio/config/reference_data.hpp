#pragma once

#include "folio/domain/identifiers.hpp"
#include "folio/domain/instrument.hpp"
#include "folio/domain/objects.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace folio {

// -----------------------------------------------------------------------------
// CurrencyTable
// -----------------------------------------------------------------------------
// Currency code -> fractional digits. Constructed with the built-in defaults
// (fiat 2, crypto 8); configuration entries override or extend them. Every
// Currency the codec builds comes from here, so Money rounding is uniform.
// -----------------------------------------------------------------------------
class CurrencyTable {
 public:
  CurrencyTable();

  void set(const std::string& code, std::uint8_t precision);

  // Throws ConfigError for an unknown code.
  domain::Currency at(const std::string& code) const;

  std::optional<domain::Currency> find(const std::string& code) const;

  std::size_t size() const { return digits_.size(); }

 private:
  std::unordered_map<std::string, std::uint8_t> digits_;
};

// Configured instruments, keyed by symbol.
class InstrumentTable {
 public:
  // Replaces an existing entry for the same symbol.
  void add(const domain::Instrument& instrument);

  std::optional<domain::Instrument> find(const domain::Symbol& symbol) const;

  std::vector<domain::Instrument> all() const;

  std::size_t size() const { return instruments_.size(); }

 private:
  std::unordered_map<domain::Symbol, domain::Instrument> instruments_;
};

}  // namespace folio
