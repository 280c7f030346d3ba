#include "folio/domain/position.hpp"
#include "folio/domain/errors.hpp"

#include <algorithm>

namespace folio {
namespace domain {

// -----------------------------------------------------------------------------
// Constructor: open from the first fill
// -----------------------------------------------------------------------------
Position::Position(const OrderFilledEvent& fill)
    : id_(fill.position_id),
      strategy_id_(fill.strategy_id),
      symbol_(fill.symbol),
      base_currency_(fill.base_currency),
      quote_currency_(fill.quote_currency),
      entry_side_(fill.side),
      side_(fill.side == OrderSide::Buy ? PositionSide::Long
                                        : PositionSide::Short),
      quantity_(fill.quantity),
      peak_quantity_(fill.quantity),
      avg_price_(fill.price),
      price_precision_(fill.price.precision()),
      realized_pnl_(Money::zero(fill.quote_currency)),
      opened_time_(fill.timestamp),
      fill_count_(1),
      last_order_id_(fill.order_id) {
  if (fill.quantity.isZero()) {
    throw InvalidFill("fill for position " + id_.value() +
                      " has zero quantity");
  }
  addCommission(fill.commission);
}

// -----------------------------------------------------------------------------
// apply: the fill state machine
// -----------------------------------------------------------------------------
void Position::apply(const OrderFilledEvent& fill) {
  validate(fill);

  addCommission(fill.commission);
  ++fill_count_;
  last_order_id_ = fill.order_id;
  price_precision_ = std::max(price_precision_, fill.price.precision());

  bool same_direction =
      (side_ == PositionSide::Long && fill.side == OrderSide::Buy) ||
      (side_ == PositionSide::Short && fill.side == OrderSide::Sell);

  if (same_direction) {
    // ----- Increase: quantity-weighted re-average ---------------------------
    avg_price_ = Price(Decimal::weightedMean(
        avg_price_->value(), quantity_.value(), fill.price.value(),
        fill.quantity.value(), averagePricePrecision()));
    quantity_ += fill.quantity;
    peak_quantity_ = std::max(peak_quantity_, quantity_);
    return;
  }

  if (fill.quantity < quantity_) {
    // ----- Reduce: realize on the fill quantity, average unchanged ----------
    realize(fill.price, fill.quantity);
    quantity_ -= fill.quantity;
    return;
  }

  // ----- Close or flip: realize on everything currently open ----------------
  realize(fill.price, quantity_);

  if (fill.quantity == quantity_) {
    quantity_ = Quantity(Decimal::fromInteger(0, quantity_.precision()));
    side_ = PositionSide::Flat;
    avg_price_.reset();
    closed_time_ = fill.timestamp;
    return;
  }

  quantity_ = fill.quantity - quantity_;
  side_ = (fill.side == OrderSide::Buy) ? PositionSide::Long
                                        : PositionSide::Short;
  avg_price_ = fill.price;
  peak_quantity_ = std::max(peak_quantity_, quantity_);
}

// -----------------------------------------------------------------------------
// unrealizedPnl: mark-to-market on the open quantity
// -----------------------------------------------------------------------------
Money Position::unrealizedPnl(const Price& mark) const {
  if (side_ == PositionSide::Flat) {
    return Money::zero(quote_currency_);
  }
  return Money(favourableMove(mark).multiply(quantity_.value(),
                                             quote_currency_.precision),
               quote_currency_);
}

Money Position::entryNotional() const {
  if (!avg_price_) {
    return Money::zero(quote_currency_);
  }
  return Money(avg_price_->value().multiply(quantity_.value(),
                                            quote_currency_.precision),
               quote_currency_);
}

// -----------------------------------------------------------------------------
// validate: identity checks for subsequent fills
// -----------------------------------------------------------------------------
void Position::validate(const OrderFilledEvent& fill) const {
  if (fill.position_id != id_) {
    throw InvalidFill("fill for position " + fill.position_id.value() +
                      " applied to position " + id_.value());
  }
  if (fill.symbol != symbol_) {
    throw InvalidFill("fill symbol " + fill.symbol.toString() +
                      " does not match position " + id_.value() + " symbol " +
                      symbol_.toString());
  }
  if (fill.base_currency != base_currency_ ||
      fill.quote_currency != quote_currency_) {
    throw InvalidFill("fill currencies " + fill.base_currency.code + "/" +
                      fill.quote_currency.code + " do not match position " +
                      id_.value() + " currencies " + base_currency_.code +
                      "/" + quote_currency_.code);
  }
  if (fill.quantity.isZero()) {
    throw InvalidFill("fill for position " + id_.value() +
                      " has zero quantity");
  }
  if (isClosed()) {
    throw InvalidFill("position " + id_.value() +
                      " is closed; a new position id is required to reopen");
  }
}

void Position::realize(const Price& fill_price,
                       const Quantity& closed_quantity) {
  realized_pnl_ += Money(favourableMove(fill_price).multiply(
                             closed_quantity.value(),
                             quote_currency_.precision),
                         quote_currency_);
}

void Position::addCommission(const Money& commission) {
  if (commission.isZero()) {
    return;
  }
  auto it = std::find_if(commissions_.begin(), commissions_.end(),
                         [&commission](const Money& m) {
                           return m.currency() == commission.currency();
                         });
  if (it == commissions_.end()) {
    commissions_.push_back(commission);
  } else {
    *it += commission;
  }
}

std::uint8_t Position::averagePricePrecision() const {
  unsigned p = price_precision_ + kAveragePriceExtraDigits;
  return static_cast<std::uint8_t>(
      std::min<unsigned>(p, Decimal::kMaxPrecision));
}

Decimal Position::favourableMove(const Price& price) const {
  Decimal move = price.value() - avg_price_->value();
  return side_ == PositionSide::Short ? -move : move;
}

}  // namespace domain
}  // namespace folio
