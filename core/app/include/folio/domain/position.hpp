#pragma once

#include "folio/domain/enums.hpp"
#include "folio/domain/identifiers.hpp"
#include "folio/domain/objects.hpp"
#include "folio/events/event_types.hpp"
#include "folio/time/time_utils.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace folio {
namespace domain {

// -----------------------------------------------------------------------------
// Position: net exposure on one symbol under one position id
// -----------------------------------------------------------------------------
//
// @brief  State machine over {Flat, Long, Short} driven by OrderFilledEvents.
//
// @details
// Identity (fixed by the first fill): PositionId, StrategyId, Symbol, base
// and quote currency. Mutable state: side, quantity, average entry price,
// realized PnL, commissions, opened/closed timestamps.
//
// Invariants:
//   - quantity() is never negative; side() is Flat iff quantity() is zero.
//   - averageEntryPrice() is empty iff the position is Flat.
//   - Flat is terminal for a position id: apply() on a closed position
//     throws InvalidFill. Reopening needs a new id.
//
// Fill rules (apply):
//
//   Same direction (Buy on Long, Sell on Short):
//     avg = (qty * avg + fill_qty * fill_px) / (qty + fill_qty)
//     qty += fill_qty
//
//   Opposite direction, fill_qty < qty (reduce):
//     realized += (fill_px - avg) * fill_qty   for Long
//     realized += (avg - fill_px) * fill_qty   for Short
//     qty -= fill_qty, avg unchanged
//
//   Opposite direction, fill_qty == qty (close):
//     realize on the whole quantity, side = Flat, avg cleared, closed time set.
//
//   Opposite direction, fill_qty > qty (flip):
//     realize on the whole quantity, then the residual fill_qty - qty opens
//     the other side at fill_px.
//
// Realized PnL is in the quote currency. Commissions are accumulated per
// currency and are not deducted from realized PnL.
//
// The average entry price carries kAveragePriceExtraDigits more fractional
// digits than the instrument's prices so re-averaging stays exact for the
// common cases (1.00000 and 1.00010 average to 1.00005).
//
// Thread model:
//   Value type. The authoritative copy lives in PositionEngine on the
//   accounting loop; events and the Portfolio hold snapshots.
// -----------------------------------------------------------------------------
class Position {
 public:
  static constexpr std::uint8_t kAveragePriceExtraDigits = 4;

  // Opens the position from its first fill. Throws InvalidFill for a zero
  // quantity.
  explicit Position(const OrderFilledEvent& fill);

  // Applies a subsequent fill. Throws InvalidFill if the fill belongs to
  // another position id, symbol or currency pair, has zero quantity, or the
  // position is already closed.
  void apply(const OrderFilledEvent& fill);

  // Mark-to-market PnL of the open quantity at the supplied price, in the
  // quote currency. Zero when Flat.
  Money unrealizedPnl(const Price& mark) const;

  bool isOpen() const { return !quantity_.isZero(); }
  bool isClosed() const { return quantity_.isZero(); }

  const PositionId& id() const { return id_; }
  const StrategyId& strategyId() const { return strategy_id_; }
  const Symbol& symbol() const { return symbol_; }
  const Currency& baseCurrency() const { return base_currency_; }
  const Currency& quoteCurrency() const { return quote_currency_; }
  OrderSide entrySide() const { return entry_side_; }

  PositionSide side() const { return side_; }
  const Quantity& quantity() const { return quantity_; }
  const Quantity& peakQuantity() const { return peak_quantity_; }
  const std::optional<Price>& averageEntryPrice() const { return avg_price_; }
  const Money& realizedPnl() const { return realized_pnl_; }
  const std::vector<Money>& commissions() const { return commissions_; }

  // avg_entry * quantity in the quote currency; zero when Flat.
  Money entryNotional() const;

  Timestamp openedTime() const { return opened_time_; }
  const std::optional<Timestamp>& closedTime() const { return closed_time_; }
  std::size_t fillCount() const { return fill_count_; }
  const OrderId& lastOrderId() const { return last_order_id_; }

 private:
  void validate(const OrderFilledEvent& fill) const;
  void realize(const Price& fill_price, const Quantity& closed_quantity);
  void addCommission(const Money& commission);
  std::uint8_t averagePricePrecision() const;

  // Signed price move in the position's favour: mark - avg for Long,
  // avg - mark for Short.
  Decimal favourableMove(const Price& price) const;

  PositionId id_;
  StrategyId strategy_id_;
  Symbol symbol_;
  Currency base_currency_;
  Currency quote_currency_;
  OrderSide entry_side_;

  PositionSide side_{PositionSide::Flat};
  Quantity quantity_;
  Quantity peak_quantity_;
  std::optional<Price> avg_price_;
  std::uint8_t price_precision_{0};
  Money realized_pnl_;
  std::vector<Money> commissions_;

  Timestamp opened_time_{};
  std::optional<Timestamp> closed_time_;
  std::size_t fill_count_{0};
  OrderId last_order_id_;
};

}  // namespace domain
}  // namespace folio
