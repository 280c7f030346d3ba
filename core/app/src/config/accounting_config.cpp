#include "folio/config/accounting_config.hpp"
#include "folio/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace folio {

namespace {

using nlohmann::json;

void parseCurrencies(const json& section, CurrencyTable& table) {
  if (!section.is_object()) {
    throw domain::ConfigError("'currencies' must be an object");
  }
  for (const auto& [code, digits] : section.items()) {
    if (!digits.is_number_unsigned()) {
      throw domain::ConfigError("currency " + code +
                                ": precision must be a non-negative integer");
    }
    auto value = digits.get<unsigned>();
    if (value > domain::Decimal::kMaxPrecision) {
      throw domain::ConfigError("currency " + code + ": precision " +
                                std::to_string(value) + " is too large");
    }
    table.set(code, static_cast<std::uint8_t>(value));
  }
}

std::uint8_t precisionField(const json& entry, const char* key,
                            std::uint8_t fallback) {
  if (!entry.contains(key)) {
    return fallback;
  }
  const json& value = entry.at(key);
  if (!value.is_number_unsigned() ||
      value.get<unsigned>() > domain::Decimal::kMaxPrecision) {
    throw domain::ConfigError(std::string("instrument ") + key +
                              " must be an integer between 0 and 12");
  }
  return static_cast<std::uint8_t>(value.get<unsigned>());
}

void parseInstruments(const json& section, const CurrencyTable& currencies,
                      InstrumentTable& table) {
  if (!section.is_array()) {
    throw domain::ConfigError("'instruments' must be an array");
  }
  for (const auto& entry : section) {
    domain::Symbol symbol(entry.at("symbol").get<std::string>(),
                          domain::Venue(entry.at("venue").get<std::string>()));
    domain::Instrument instrument{
        symbol,
        currencies.at(entry.at("base").get<std::string>()),
        currencies.at(entry.at("quote").get<std::string>()),
        precisionField(entry, "price_precision", 5),
        precisionField(entry, "size_precision", 0)};
    table.add(instrument);
  }
}

void parseNetwork(const json& section, NetworkConfig& network) {
  network.feed_endpoint =
      section.value("feed_endpoint", network.feed_endpoint);
  network.ipc_cmd_endpoint =
      section.value("ipc_cmd_endpoint", network.ipc_cmd_endpoint);
  network.ipc_pub_endpoint =
      section.value("ipc_pub_endpoint", network.ipc_pub_endpoint);
}

}  // namespace

MarkPriceConvention parseMarkPriceConvention(const std::string& text) {
  if (text == "side") return MarkPriceConvention::SideDependent;
  if (text == "bid") return MarkPriceConvention::Bid;
  if (text == "ask") return MarkPriceConvention::Ask;
  if (text == "mid") return MarkPriceConvention::Mid;
  throw domain::ConfigError("unknown mark_price convention: " + text);
}

// -----------------------------------------------------------------------------
// parseConfig
// -----------------------------------------------------------------------------
// nlohmann exceptions (syntax errors, missing keys, wrong types) and domain
// contract violations (empty venue, ...) are all reported as ConfigError.
// -----------------------------------------------------------------------------
AccountingConfig parseConfig(const std::string& json_text) {
  AccountingConfig config;

  try {
    json root = json::parse(json_text);
    if (!root.is_object()) {
      throw domain::ConfigError("configuration root must be an object");
    }

    if (root.contains("currencies")) {
      parseCurrencies(root.at("currencies"), config.currencies);
    }
    if (root.contains("instruments")) {
      parseInstruments(root.at("instruments"), config.currencies,
                       config.instruments);
    }
    if (root.contains("valuation")) {
      config.portfolio.mark_price = parseMarkPriceConvention(
          root.at("valuation").value("mark_price", std::string("side")));
    }
    if (root.contains("quote_cache")) {
      std::string retention =
          root.at("quote_cache").value("retention", std::string("latest"));
      if (retention != "latest") {
        throw domain::ConfigError("unsupported quote_cache retention: " +
                                  retention);
      }
    }
    if (root.contains("network")) {
      parseNetwork(root.at("network"), config.network);
    }
  } catch (const json::exception& e) {
    throw domain::ConfigError(std::string("invalid configuration: ") +
                              e.what());
  } catch (const domain::ContractViolation& e) {
    throw domain::ConfigError(std::string("invalid configuration: ") +
                              e.what());
  }

  return config;
}

AccountingConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw domain::ConfigError("cannot open configuration file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return parseConfig(buffer.str());
}

}  // namespace folio
