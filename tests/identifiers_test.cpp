// =============================================================================
// identifiers_test.cpp
// =============================================================================
// Unit tests for the identifier value types, CurrencyPair inference and
// QuoteTick price selection.
// =============================================================================

#include "folio/domain/errors.hpp"
#include "folio/domain/identifiers.hpp"
#include "folio/domain/instrument.hpp"
#include "folio/domain/quote_tick.hpp"

#include "test_fixtures.hpp"

#include <gtest/gtest.h>

#include <unordered_set>

using namespace folio::domain;

TEST(IdentifierTest, EmptyValueThrows) {
  EXPECT_THROW(PositionId(""), ContractViolation);
  EXPECT_THROW(Venue(""), ContractViolation);
  EXPECT_NO_THROW(StrategyId("S-001"));
}

TEST(IdentifierTest, HashAndCompareByValue) {
  std::unordered_set<PositionId> ids{PositionId("P-1"), PositionId("P-2"),
                                     PositionId("P-1")};
  EXPECT_EQ(ids.size(), 2u);
  EXPECT_LT(PositionId("P-1"), PositionId("P-2"));
}

// -----------------------------------------------------------------------------
// Symbol: "CODE.VENUE", split at the last dot
// -----------------------------------------------------------------------------
TEST(SymbolTest, ParsesCodeAndVenue) {
  Symbol s = Symbol::fromString("AUDUSD.FXCM");
  EXPECT_EQ(s.code(), "AUDUSD");
  EXPECT_EQ(s.venue().value(), "FXCM");
  EXPECT_EQ(s.toString(), "AUDUSD.FXCM");
}

TEST(SymbolTest, SplitsAtLastDot) {
  Symbol s = Symbol::fromString("BRK.B.NYSE");
  EXPECT_EQ(s.code(), "BRK.B");
  EXPECT_EQ(s.venue().value(), "NYSE");
}

TEST(SymbolTest, RejectsMissingParts) {
  EXPECT_THROW(Symbol::fromString("AUDUSD"), ContractViolation);
  EXPECT_THROW(Symbol::fromString("AUDUSD."), ContractViolation);
  EXPECT_THROW(Symbol::fromString(".FXCM"), ContractViolation);
}

TEST(SymbolTest, SameCodeOnDifferentVenuesDiffers) {
  EXPECT_NE(Symbol::fromString("BTCUSD.BINANCE"),
            Symbol::fromString("BTCUSD.BITMEX"));
}

// -----------------------------------------------------------------------------
// AccountId: ISSUER-IDENTIFIER-TYPE
// -----------------------------------------------------------------------------
TEST(AccountIdTest, IssuerIsTheVenue) {
  AccountId id = AccountId::fromString("BINANCE-1513111-SIMULATED");
  EXPECT_EQ(id.venue().value(), "BINANCE");
  EXPECT_EQ(id.identifier(), "1513111");
  EXPECT_EQ(id.accountType(), "SIMULATED");
  EXPECT_EQ(id.value(), "BINANCE-1513111-SIMULATED");
}

TEST(AccountIdTest, RejectsMalformedIds) {
  EXPECT_THROW(AccountId::fromString("BINANCE"), ContractViolation);
  EXPECT_THROW(AccountId::fromString("BINANCE-1513111"), ContractViolation);
  EXPECT_THROW(AccountId::fromString("-1-SIMULATED"), ContractViolation);
}

// -----------------------------------------------------------------------------
// CurrencyPair inference
// -----------------------------------------------------------------------------
TEST(CurrencyPairTest, InfersSixLetterCodes) {
  auto pair = CurrencyPair::inferFromCode("GBPUSD");
  ASSERT_TRUE(pair.has_value());
  EXPECT_EQ(pair->base, "GBP");
  EXPECT_EQ(pair->quote, "USD");
}

TEST(CurrencyPairTest, OtherCodesNeedConfiguration) {
  EXPECT_FALSE(CurrencyPair::inferFromCode("XBTUSDT").has_value());
  EXPECT_FALSE(CurrencyPair::inferFromCode("ES").has_value());
  EXPECT_FALSE(CurrencyPair::inferFromCode("AUD/USD").has_value());
}

// -----------------------------------------------------------------------------
// QuoteTick::price
// -----------------------------------------------------------------------------
TEST(QuoteTickTest, SelectsSide) {
  QuoteTick tick = folio::test::makeTick("AUDUSD.FXCM", "0.80501", "0.80505");
  EXPECT_EQ(tick.price(PriceType::Bid).toString(), "0.80501");
  EXPECT_EQ(tick.price(PriceType::Ask).toString(), "0.80505");
}

TEST(QuoteTickTest, MidIsExact) {
  QuoteTick tick = folio::test::makeTick("AUDUSD.FXCM", "0.80501", "0.80505");
  EXPECT_EQ(tick.price(PriceType::Mid).toString(), "0.805030");

  QuoteTick odd = folio::test::makeTick("GBPUSD.FXCM", "1.30315", "1.30317");
  EXPECT_EQ(odd.price(PriceType::Mid), Price::fromString("1.30316"));
}
