#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace folio {
namespace domain {

// -----------------------------------------------------------------------------
// Identifier<Tag>
// -----------------------------------------------------------------------------
//
// @brief  Strongly typed, non-empty string identifier.
//
// @details
// Each identifier kind gets its own Tag so that a PositionId cannot be passed
// where a StrategyId is expected, while all of them stay cheap value types
// that hash and compare like the underlying string. An empty value throws
// ContractViolation.
// -----------------------------------------------------------------------------
template <typename Tag>
class Identifier {
 public:
  explicit Identifier(std::string value);

  const std::string& value() const { return value_; }

  bool operator==(const Identifier& other) const { return value_ == other.value_; }
  bool operator!=(const Identifier& other) const { return value_ != other.value_; }
  bool operator<(const Identifier& other) const { return value_ < other.value_; }

 private:
  std::string value_;
};

// Throws ContractViolation naming the identifier kind.
void requireNonEmpty(const std::string& value, const char* kind);

template <typename Tag>
Identifier<Tag>::Identifier(std::string value) : value_(std::move(value)) {
  requireNonEmpty(value_, Tag::kName);
}

struct VenueTag { static constexpr const char* kName = "Venue"; };
struct PositionIdTag { static constexpr const char* kName = "PositionId"; };
struct StrategyIdTag { static constexpr const char* kName = "StrategyId"; };
struct OrderIdTag { static constexpr const char* kName = "OrderId"; };

using Venue = Identifier<VenueTag>;
using PositionId = Identifier<PositionIdTag>;
using StrategyId = Identifier<StrategyIdTag>;
using OrderId = Identifier<OrderIdTag>;

// -----------------------------------------------------------------------------
// Symbol
// -----------------------------------------------------------------------------
// Instrument code bound to a venue: the join key between quotes, positions and
// accounts. Text form is "CODE.VENUE", e.g. "AUDUSD.FXCM".
// -----------------------------------------------------------------------------
class Symbol {
 public:
  Symbol(std::string code, Venue venue);

  // Parses "CODE.VENUE" (split at the last '.').
  static Symbol fromString(std::string_view text);

  const std::string& code() const { return code_; }
  const Venue& venue() const { return venue_; }

  std::string toString() const { return code_ + "." + venue_.value(); }

  bool operator==(const Symbol& other) const {
    return code_ == other.code_ && venue_ == other.venue_;
  }
  bool operator!=(const Symbol& other) const { return !(*this == other); }

 private:
  std::string code_;
  Venue venue_;
};

// -----------------------------------------------------------------------------
// AccountId
// -----------------------------------------------------------------------------
// "ISSUER-IDENTIFIER-TYPE", e.g. "BINANCE-1513111-SIMULATED". The issuer is the
// venue the account belongs to; each venue has at most one account.
// -----------------------------------------------------------------------------
class AccountId {
 public:
  static AccountId fromString(std::string_view text);

  const std::string& value() const { return value_; }
  const std::string& identifier() const { return identifier_; }
  const std::string& accountType() const { return account_type_; }
  const Venue& venue() const { return issuer_; }

  bool operator==(const AccountId& other) const { return value_ == other.value_; }
  bool operator!=(const AccountId& other) const { return value_ != other.value_; }

 private:
  AccountId(Venue issuer, std::string identifier, std::string account_type);

  Venue issuer_;
  std::string identifier_;
  std::string account_type_;
  std::string value_;
};

}  // namespace domain
}  // namespace folio

namespace std {

template <typename Tag>
struct hash<folio::domain::Identifier<Tag>> {
  size_t operator()(const folio::domain::Identifier<Tag>& id) const noexcept {
    return hash<string>{}(id.value());
  }
};

template <>
struct hash<folio::domain::Symbol> {
  size_t operator()(const folio::domain::Symbol& symbol) const noexcept {
    size_t h = hash<string>{}(symbol.code());
    return h ^ (hash<string>{}(symbol.venue().value()) + 0x9e3779b9 +
                (h << 6) + (h >> 2));
  }
};

}  // namespace std
