#include "folio/domain/identifiers.hpp"
#include "folio/domain/errors.hpp"

#include <utility>

namespace folio {
namespace domain {

void requireNonEmpty(const std::string& value, const char* kind) {
  if (value.empty()) {
    throw ContractViolation(std::string(kind) + " cannot be empty");
  }
}

// -----------------------------------------------------------------------------
// Symbol
// -----------------------------------------------------------------------------
Symbol::Symbol(std::string code, Venue venue)
    : code_(std::move(code)), venue_(std::move(venue)) {
  requireNonEmpty(code_, "Symbol code");
}

Symbol Symbol::fromString(std::string_view text) {
  auto dot = text.rfind('.');
  if (dot == std::string_view::npos || dot == 0 || dot + 1 == text.size()) {
    throw ContractViolation("malformed symbol '" + std::string(text) +
                            "', expected CODE.VENUE");
  }
  return Symbol(std::string(text.substr(0, dot)),
                Venue(std::string(text.substr(dot + 1))));
}

// -----------------------------------------------------------------------------
// AccountId
// -----------------------------------------------------------------------------
AccountId::AccountId(Venue issuer, std::string identifier,
                     std::string account_type)
    : issuer_(std::move(issuer)),
      identifier_(std::move(identifier)),
      account_type_(std::move(account_type)),
      value_(issuer_.value() + "-" + identifier_ + "-" + account_type_) {}

AccountId AccountId::fromString(std::string_view text) {
  auto first = text.find('-');
  auto last = text.rfind('-');
  if (first == std::string_view::npos || first == last || first == 0 ||
      last + 1 == text.size() || last == first + 1) {
    throw ContractViolation("malformed account id '" + std::string(text) +
                            "', expected ISSUER-IDENTIFIER-TYPE");
  }
  return AccountId(Venue(std::string(text.substr(0, first))),
                   std::string(text.substr(first + 1, last - first - 1)),
                   std::string(text.substr(last + 1)));
}

}  // namespace domain
}  // namespace folio
