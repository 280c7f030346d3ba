#pragma once

#include "folio/config/reference_data.hpp"
#include "folio/portfolio/portfolio.hpp"

#include <string>

namespace folio {

// Endpoints for the ZeroMQ components. An empty endpoint disables the
// component, which is how tests run the engine without sockets.
struct NetworkConfig {
  std::string feed_endpoint{"tcp://127.0.0.1:5555"};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
};

// Only the latest quote per symbol is kept.
enum class QuoteRetention {
  Latest,
};

// -----------------------------------------------------------------------------
// AccountingConfig
// -----------------------------------------------------------------------------
//
// @brief  Everything the AccountingEngine needs that is not an event: the
//         currency precision table, instrument reference data, the mark price
//         convention and the network endpoints.
//
// @details
// JSON layout (every section optional):
//
//   {
//     "currencies":  { "USD": 2, "BTC": 8 },
//     "instruments": [ { "symbol": "AUDUSD", "venue": "FXCM",
//                        "base": "AUD", "quote": "USD",
//                        "price_precision": 5, "size_precision": 0 } ],
//     "valuation":   { "mark_price": "side" },        // side|bid|ask|mid
//     "quote_cache": { "retention": "latest" },
//     "network":     { "feed_endpoint": "tcp://127.0.0.1:5555",
//                      "ipc_cmd_endpoint": "tcp://127.0.0.1:5556",
//                      "ipc_pub_endpoint": "tcp://127.0.0.1:5557" }
//   }
//
// Currencies are merged over the built-in defaults. Instrument currencies
// must resolve in the merged table. Any malformed or inconsistent content
// throws ConfigError naming the offending key.
// -----------------------------------------------------------------------------
struct AccountingConfig {
  CurrencyTable currencies;
  InstrumentTable instruments;
  PortfolioConfig portfolio;
  QuoteRetention quote_retention{QuoteRetention::Latest};
  NetworkConfig network;
};

AccountingConfig parseConfig(const std::string& json_text);

// Reads and parses a file. Throws ConfigError if it cannot be opened.
AccountingConfig loadConfig(const std::string& path);

// "side", "bid", "ask" or "mid".
MarkPriceConvention parseMarkPriceConvention(const std::string& text);

}  // namespace folio
