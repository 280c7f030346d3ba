#include "folio/codec/event_codec.hpp"
#include "folio/domain/errors.hpp"
#include "folio/time/time_utils.hpp"

#include <cstdint>
#include <type_traits>
#include <variant>

namespace folio {

namespace {

using nlohmann::json;

// -----------------------------------------------------------------------------
// Field helpers
// -----------------------------------------------------------------------------

// String: exact, precision as written. Number: rounded to `precision`, which
// must be known.
domain::Decimal decimalField(const json& msg, const char* key,
                             std::optional<std::uint8_t> precision) {
  const json& value = msg.at(key);
  if (value.is_string()) {
    return domain::Decimal::fromString(value.get<std::string>());
  }
  if (value.is_number()) {
    if (!precision) {
      throw domain::CodecError(std::string("numeric '") + key +
                               "' needs a configured precision; send it as a "
                               "string");
    }
    return domain::Decimal::fromDouble(value.get<double>(), *precision);
  }
  throw domain::CodecError(std::string("'") + key +
                           "' must be a decimal string or a number");
}

domain::Money moneyField(const json& msg, const char* key,
                         const domain::Currency& currency) {
  return domain::Money(decimalField(msg, key, currency.precision), currency);
}

domain::Money optionalMoneyField(const json& msg, const char* key,
                                 const domain::Currency& currency) {
  if (!msg.contains(key) || msg.at(key).is_null()) {
    return domain::Money::zero(currency);
  }
  return moneyField(msg, key, currency);
}

Timestamp timestampField(const json& msg) {
  return ms_to_timestamp(msg.value("timestamp_ms", std::int64_t{0}));
}

std::uint64_t sequenceField(const json& msg) {
  return msg.value("sequence_id", std::uint64_t{0});
}

domain::OrderSide sideField(const json& msg) {
  std::string side = msg.at("side").get<std::string>();
  if (side == "BUY") return domain::OrderSide::Buy;
  if (side == "SELL") return domain::OrderSide::Sell;
  throw domain::CodecError("unknown order side: " + side);
}

// -----------------------------------------------------------------------------
// Per-type decoders
// -----------------------------------------------------------------------------
domain::QuoteTick decodeQuoteTick(const json& msg,
                                  const InstrumentTable& instruments) {
  auto symbol = domain::Symbol::fromString(msg.at("symbol").get<std::string>());
  auto instrument = instruments.find(symbol);

  std::optional<std::uint8_t> price_precision;
  std::optional<std::uint8_t> size_precision;
  if (instrument) {
    price_precision = instrument->price_precision;
    size_precision = instrument->size_precision;
  }

  domain::Quantity bid_size;
  domain::Quantity ask_size;
  if (msg.contains("bid_size")) {
    bid_size = domain::Quantity(decimalField(msg, "bid_size", size_precision));
  }
  if (msg.contains("ask_size")) {
    ask_size = domain::Quantity(decimalField(msg, "ask_size", size_precision));
  }

  return domain::QuoteTick{
      symbol,
      domain::Price(decimalField(msg, "bid", price_precision)),
      domain::Price(decimalField(msg, "ask", price_precision)),
      bid_size,
      ask_size,
      timestampField(msg),
      sequenceField(msg)};
}

AccountStateEvent decodeAccountState(const json& msg,
                                     const CurrencyTable& currencies) {
  domain::Currency currency =
      currencies.at(msg.at("currency").get<std::string>());

  return AccountStateEvent{
      domain::AccountId::fromString(msg.at("account_id").get<std::string>()),
      currency,
      moneyField(msg, "balance", currency),
      moneyField(msg, "margin_used", currency),
      moneyField(msg, "margin_available", currency),
      optionalMoneyField(msg, "order_margin", currency),
      optionalMoneyField(msg, "position_margin", currency),
      msg.value("event_id", std::string()),
      timestampField(msg),
      sequenceField(msg)};
}

OrderFilledEvent decodeOrderFilled(const json& msg,
                                   const CurrencyTable& currencies,
                                   const InstrumentTable& instruments) {
  auto symbol = domain::Symbol::fromString(msg.at("symbol").get<std::string>());
  auto instrument = instruments.find(symbol);

  auto currencyOf = [&](const char* key, bool base) {
    if (msg.contains(key)) {
      return currencies.at(msg.at(key).get<std::string>());
    }
    if (!instrument) {
      throw domain::CodecError(std::string("fill for ") + symbol.toString() +
                               " has no '" + key +
                               "' and the instrument is not configured");
    }
    return base ? instrument->base_currency : instrument->quote_currency;
  };
  domain::Currency base = currencyOf("base_currency", true);
  domain::Currency quote = currencyOf("quote_currency", false);

  std::optional<std::uint8_t> price_precision;
  std::optional<std::uint8_t> size_precision;
  if (instrument) {
    price_precision = instrument->price_precision;
    size_precision = instrument->size_precision;
  }

  domain::Money commission = domain::Money::zero(quote);
  if (msg.contains("commission") && !msg.at("commission").is_null()) {
    const json& c = msg.at("commission");
    commission = moneyField(
        c, "amount", currencies.at(c.at("currency").get<std::string>()));
  }

  return OrderFilledEvent{
      domain::OrderId(msg.at("order_id").get<std::string>()),
      domain::PositionId(msg.at("position_id").get<std::string>()),
      domain::StrategyId(msg.at("strategy_id").get<std::string>()),
      symbol,
      sideField(msg),
      domain::Quantity(decimalField(msg, "quantity", size_precision)),
      domain::Price(decimalField(msg, "price", price_precision)),
      base,
      quote,
      commission,
      timestampField(msg),
      sequenceField(msg)};
}

// -----------------------------------------------------------------------------
// Telemetry helpers
// -----------------------------------------------------------------------------
json optionalTimestamp(const std::optional<Timestamp>& ts) {
  return ts ? json(timestamp_to_ms(*ts)) : json(nullptr);
}

template <typename PositionEventT>
std::string encodePositionEvent(const char* type, const PositionEventT& e) {
  json j;
  j["type"] = type;
  j["position"] = toJson(e.position);
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  j["sequence_id"] = e.sequence_id;
  return j.dump();
}

}  // namespace

// -----------------------------------------------------------------------------
// decodeEvent
// -----------------------------------------------------------------------------
Event decodeEvent(const std::string& payload, const CurrencyTable& currencies,
                  const InstrumentTable& instruments) {
  try {
    json msg = json::parse(payload);
    std::string type = msg.at("type").get<std::string>();

    if (type == "quote_tick") {
      return decodeQuoteTick(msg, instruments);
    }
    if (type == "account_state") {
      return decodeAccountState(msg, currencies);
    }
    if (type == "order_filled") {
      return decodeOrderFilled(msg, currencies, instruments);
    }
    throw domain::CodecError("unknown message type: " + type);
  } catch (const json::exception& e) {
    throw domain::CodecError(std::string("malformed message: ") + e.what());
  } catch (const domain::ConfigError& e) {
    throw domain::CodecError(e.what());
  } catch (const domain::ContractViolation& e) {
    throw domain::CodecError(std::string("rejected message: ") + e.what());
  }
}

// -----------------------------------------------------------------------------
// encodeTelemetry
// -----------------------------------------------------------------------------
std::optional<std::string> encodeTelemetry(const Event& event) {
  return std::visit(
      [](const auto& e) -> std::optional<std::string> {
        using T = std::decay_t<decltype(e)>;

        if constexpr (std::is_same_v<T, PositionOpenedEvent>) {
          return encodePositionEvent("position_opened", e);
        } else if constexpr (std::is_same_v<T, PositionModifiedEvent>) {
          return encodePositionEvent("position_modified", e);
        } else if constexpr (std::is_same_v<T, PositionClosedEvent>) {
          return encodePositionEvent("position_closed", e);
        } else if constexpr (std::is_same_v<T, AccountStateEvent>) {
          json j;
          j["type"] = "account_state";
          j["account_id"] = e.account_id.value();
          j["currency"] = e.currency.code;
          j["balance"] = toJson(e.balance);
          j["margin_used"] = toJson(e.margin_used);
          j["margin_available"] = toJson(e.margin_available);
          j["order_margin"] = toJson(e.order_margin);
          j["position_margin"] = toJson(e.position_margin);
          j["event_id"] = e.event_id;
          j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
          return j.dump();
        } else if constexpr (std::is_same_v<T, AccountingFaultEvent>) {
          json j;
          j["type"] = "accounting_fault";
          j["component"] = e.component;
          j["reason"] = e.reason;
          j["reference"] = e.reference;
          j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
          j["sequence_id"] = e.sequence_id;
          return j.dump();
        } else {
          return std::nullopt;
        }
      },
      event);
}

// -----------------------------------------------------------------------------
// JSON views of domain objects
// -----------------------------------------------------------------------------
json toJson(const domain::Money& money) {
  return json{{"amount", money.amount().toString()},
              {"currency", money.currency().code}};
}

json toJson(const std::optional<domain::Money>& money) {
  return money ? toJson(*money) : json(nullptr);
}

json toJson(const domain::Position& position) {
  json j;
  j["position_id"] = position.id().value();
  j["strategy_id"] = position.strategyId().value();
  j["symbol"] = position.symbol().toString();
  j["side"] = domain::toString(position.side());
  j["entry_side"] = domain::toString(position.entrySide());
  j["quantity"] = position.quantity().toString();
  j["peak_quantity"] = position.peakQuantity().toString();
  j["avg_entry_price"] = position.averageEntryPrice()
                             ? json(position.averageEntryPrice()->toString())
                             : json(nullptr);
  j["realized_pnl"] = toJson(position.realizedPnl());

  json commissions = json::array();
  for (const auto& c : position.commissions()) {
    commissions.push_back(toJson(c));
  }
  j["commissions"] = std::move(commissions);

  j["fill_count"] = position.fillCount();
  j["last_order_id"] = position.lastOrderId().value();
  j["opened_time_ms"] = timestamp_to_ms(position.openedTime());
  j["closed_time_ms"] = optionalTimestamp(position.closedTime());
  return j;
}

json toJson(const domain::Account& account) {
  json j;
  j["account_id"] = account.id().value();
  j["venue"] = account.venue().value();
  j["currency"] = account.currency().code;
  j["balance"] = toJson(account.balance());
  j["free"] = toJson(account.freeBalance());
  j["locked"] = toJson(account.lockedBalance());
  j["order_margin"] = toJson(account.orderMargin());
  j["position_margin"] = toJson(account.positionMargin());
  j["last_event_id"] = account.lastEventId();
  j["last_updated_ms"] = timestamp_to_ms(account.lastUpdated());
  return j;
}

}  // namespace folio
