#pragma once

namespace folio {
namespace domain {

// Side of an order or fill.
enum class OrderSide {
  Buy,
  Sell,
};

// -----------------------------------------------------------------------------
// PositionSide
// -----------------------------------------------------------------------------
// Flat is both the initial state of a position and its terminal state: once a
// position id has gone from Long/Short back to Flat it cannot be reopened.
// -----------------------------------------------------------------------------
enum class PositionSide {
  Flat,
  Long,
  Short,
};

// Which side of a two-sided quote to read.
enum class PriceType {
  Bid,
  Ask,
  Mid,
};

inline const char* toString(OrderSide side) {
  switch (side) {
    case OrderSide::Buy:  return "BUY";
    case OrderSide::Sell: return "SELL";
  }
  return "UNKNOWN";
}

inline const char* toString(PositionSide side) {
  switch (side) {
    case PositionSide::Flat:  return "FLAT";
    case PositionSide::Long:  return "LONG";
    case PositionSide::Short: return "SHORT";
  }
  return "UNKNOWN";
}

inline const char* toString(PriceType type) {
  switch (type) {
    case PriceType::Bid: return "BID";
    case PriceType::Ask: return "ASK";
    case PriceType::Mid: return "MID";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace folio
