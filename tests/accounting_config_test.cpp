// =============================================================================
// accounting_config_test.cpp
// =============================================================================
// Unit tests for the configuration layer: CurrencyTable, InstrumentTable,
// parseConfig() and loadConfig().
// =============================================================================

#include "folio/config/accounting_config.hpp"
#include "folio/domain/errors.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

using namespace folio;
using domain::ConfigError;

// -----------------------------------------------------------------------------
// Reference tables
// -----------------------------------------------------------------------------
TEST(CurrencyTableTest, BuiltInDefaults) {
  CurrencyTable table;
  EXPECT_EQ(table.at("USD").precision, 2);
  EXPECT_EQ(table.at("BTC").precision, 8);
  EXPECT_EQ(table.at("XBT").precision, 8);
  EXPECT_FALSE(table.find("ZZZ").has_value());
  EXPECT_THROW(table.at("ZZZ"), ConfigError);
}

TEST(CurrencyTableTest, SetOverridesAndValidates) {
  CurrencyTable table;
  table.set("JPY", 0);
  EXPECT_EQ(table.at("JPY").precision, 0);

  EXPECT_THROW(table.set("", 2), ConfigError);
  EXPECT_THROW(table.set("DOGE", 13), ConfigError);
}

TEST(InstrumentTableTest, FindBySymbol) {
  CurrencyTable currencies;
  InstrumentTable table;
  table.add(domain::Instrument{domain::Symbol::fromString("AUDUSD.FXCM"),
                               currencies.at("AUD"), currencies.at("USD"), 5,
                               0});

  EXPECT_EQ(table.size(), 1u);
  auto found = table.find(domain::Symbol::fromString("AUDUSD.FXCM"));
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->pair(), (domain::CurrencyPair{"AUD", "USD"}));
  EXPECT_FALSE(
      table.find(domain::Symbol::fromString("AUDUSD.IDEALPRO")).has_value());
}

// -----------------------------------------------------------------------------
// parseConfig
// -----------------------------------------------------------------------------
TEST(AccountingConfigTest, EmptyObjectGivesDefaults) {
  AccountingConfig config = parseConfig("{}");
  EXPECT_EQ(config.instruments.size(), 0u);
  EXPECT_EQ(config.portfolio.mark_price, MarkPriceConvention::SideDependent);
  EXPECT_EQ(config.network.feed_endpoint, "tcp://127.0.0.1:5555");
  EXPECT_EQ(config.network.ipc_cmd_endpoint, "tcp://127.0.0.1:5556");
  EXPECT_EQ(config.network.ipc_pub_endpoint, "tcp://127.0.0.1:5557");
}

TEST(AccountingConfigTest, ParsesAllSections) {
  AccountingConfig config = parseConfig(R"({
    "currencies": { "USDT": 6, "DOGE": 4 },
    "instruments": [
      { "symbol": "DOGEUSDT", "venue": "BINANCE", "base": "DOGE",
        "quote": "USDT", "price_precision": 6 }
    ],
    "valuation": { "mark_price": "mid" },
    "quote_cache": { "retention": "latest" },
    "network": { "feed_endpoint": "", "ipc_cmd_endpoint": "ipc:///tmp/cmd" }
  })");

  EXPECT_EQ(config.currencies.at("USDT").precision, 6);
  EXPECT_EQ(config.currencies.at("DOGE").precision, 4);
  EXPECT_EQ(config.currencies.at("USD").precision, 2);

  auto doge = config.instruments.find(
      domain::Symbol::fromString("DOGEUSDT.BINANCE"));
  ASSERT_TRUE(doge.has_value());
  EXPECT_EQ(doge->price_precision, 6);
  EXPECT_EQ(doge->size_precision, 0);
  EXPECT_EQ(doge->quote_currency.precision, 6);

  EXPECT_EQ(config.portfolio.mark_price, MarkPriceConvention::Mid);
  EXPECT_TRUE(config.network.feed_endpoint.empty());
  EXPECT_EQ(config.network.ipc_cmd_endpoint, "ipc:///tmp/cmd");
  EXPECT_EQ(config.network.ipc_pub_endpoint, "tcp://127.0.0.1:5557");
}

TEST(AccountingConfigTest, InvalidContentIsConfigError) {
  EXPECT_THROW(parseConfig("{"), ConfigError);
  EXPECT_THROW(parseConfig("[]"), ConfigError);
  EXPECT_THROW(parseConfig(R"({"currencies": {"USD": -1}})"), ConfigError);
  EXPECT_THROW(parseConfig(R"({"currencies": {"USD": 13}})"), ConfigError);
  EXPECT_THROW(parseConfig(R"({"valuation": {"mark_price": "last"}})"),
               ConfigError);
  EXPECT_THROW(parseConfig(R"({"quote_cache": {"retention": "all"}})"),
               ConfigError);
  // Unknown currency in an instrument.
  EXPECT_THROW(parseConfig(R"({"instruments": [{"symbol": "ESZ4",
      "venue": "CME", "base": "ES", "quote": "USD"}]})"),
               ConfigError);
  // Empty venue.
  EXPECT_THROW(parseConfig(R"({"instruments": [{"symbol": "AUDUSD",
      "venue": "", "base": "AUD", "quote": "USD"}]})"),
               ConfigError);
}

TEST(AccountingConfigTest, MarkPriceNames) {
  EXPECT_EQ(parseMarkPriceConvention("side"), MarkPriceConvention::SideDependent);
  EXPECT_EQ(parseMarkPriceConvention("bid"), MarkPriceConvention::Bid);
  EXPECT_EQ(parseMarkPriceConvention("ask"), MarkPriceConvention::Ask);
  EXPECT_THROW(parseMarkPriceConvention("BID"), ConfigError);
}

// -----------------------------------------------------------------------------
// loadConfig
// -----------------------------------------------------------------------------
TEST(AccountingConfigTest, LoadsFromFile) {
  const std::string path = ::testing::TempDir() + "folio_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"instruments": [{"symbol": "AUDUSD", "venue": "FXCM",
              "base": "AUD", "quote": "USD"}]})";
  }

  AccountingConfig config = loadConfig(path);
  EXPECT_EQ(config.instruments.size(), 1u);
  std::remove(path.c_str());
}

TEST(AccountingConfigTest, MissingFileIsConfigError) {
  EXPECT_THROW(loadConfig("/nonexistent/folio.json"), ConfigError);
}
