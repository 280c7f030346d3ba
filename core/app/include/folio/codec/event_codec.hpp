#pragma once

#include "folio/config/reference_data.hpp"
#include "folio/domain/account.hpp"
#include "folio/domain/objects.hpp"
#include "folio/domain/position.hpp"
#include "folio/events/event.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace folio {

// -----------------------------------------------------------------------------
// Wire codec
// -----------------------------------------------------------------------------
//
// @brief  JSON <-> Event for the feed gateway (inbound) and the IPC telemetry
//         channel (outbound).
//
// @details
// Inbound messages carry a "type" discriminator:
//
//   quote_tick     symbol, bid, ask, [bid_size, ask_size], timestamp_ms
//   account_state  account_id, currency, balance, margin_used,
//                  margin_available, [order_margin, position_margin],
//                  event_id, timestamp_ms
//   order_filled   order_id, position_id, strategy_id, symbol, side,
//                  quantity, price, [base_currency, quote_currency],
//                  [commission {amount, currency}], timestamp_ms
//
// Decimal fields are exact when sent as strings ("1.00010"). Numbers are
// rounded to the configured precision of the instrument or currency, so a
// numeric price for an instrument that is not configured is rejected.
// Missing currencies on a fill are taken from the configured instrument.
//
// Every failure (bad JSON, missing key, unknown currency, a value the domain
// rejects) throws CodecError.
// -----------------------------------------------------------------------------
Event decodeEvent(const std::string& payload, const CurrencyTable& currencies,
                  const InstrumentTable& instruments);

// Telemetry line for position lifecycle, account state and fault events.
// Quotes and fills are not echoed: std::nullopt.
std::optional<std::string> encodeTelemetry(const Event& event);

// {"amount": "10816.00", "currency": "USD"}
nlohmann::json toJson(const domain::Money& money);

// The Money object, or null.
nlohmann::json toJson(const std::optional<domain::Money>& money);

nlohmann::json toJson(const domain::Position& position);
nlohmann::json toJson(const domain::Account& account);

}  // namespace folio
