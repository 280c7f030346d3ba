#include "folio/portfolio/position_engine.hpp"
#include "folio/domain/errors.hpp"

#include <iostream>
#include <mutex>

namespace folio {

PositionEngine::PositionEngine(EventBus& bus) : bus_(bus) {
  fill_sub_id_ = bus_.subscribe<OrderFilledEvent>(
      [this](const OrderFilledEvent& e) { onFill(e); });
}

PositionEngine::~PositionEngine() { bus_.unsubscribe(fill_sub_id_); }

// -----------------------------------------------------------------------------
// applyFill: open, modify or close, then publish outside the lock
// -----------------------------------------------------------------------------
void PositionEngine::applyFill(const OrderFilledEvent& fill) {
  std::optional<Event> lifecycle;

  {
    std::unique_lock lock(positions_mutex_);

    if (closed_.count(fill.position_id) != 0) {
      throw domain::InvalidFill("position " + fill.position_id.value() +
                                " is closed; a new position id is required"
                                " to reopen");
    }

    auto it = open_.find(fill.position_id);
    if (it == open_.end()) {
      domain::Position opened(fill);
      lifecycle = PositionOpenedEvent{opened, fill.timestamp, fill.sequence_id};
      open_.emplace(fill.position_id, std::move(opened));
    } else {
      // Apply to a copy so a rejected fill leaves the stored position as it
      // was.
      domain::Position updated = it->second;
      updated.apply(fill);

      if (updated.isClosed()) {
        lifecycle =
            PositionClosedEvent{updated, fill.timestamp, fill.sequence_id};
        open_.erase(it);
        closed_.insert_or_assign(fill.position_id, std::move(updated));
      } else {
        lifecycle =
            PositionModifiedEvent{updated, fill.timestamp, fill.sequence_id};
        it->second = std::move(updated);
      }
    }
  }

  bus_.publish(*lifecycle);
}

void PositionEngine::hydratePosition(const domain::Position& position) {
  std::unique_lock lock(positions_mutex_);
  if (position.isOpen()) {
    open_.insert_or_assign(position.id(), position);
  } else {
    closed_.insert_or_assign(position.id(), position);
  }
}

std::optional<domain::Position> PositionEngine::position(
    const domain::PositionId& id) const {
  std::shared_lock lock(positions_mutex_);
  auto it = open_.find(id);
  if (it != open_.end()) {
    return it->second;
  }
  auto closed = closed_.find(id);
  if (closed != closed_.end()) {
    return closed->second;
  }
  return std::nullopt;
}

std::vector<domain::Position> PositionEngine::openPositions() const {
  std::shared_lock lock(positions_mutex_);
  std::vector<domain::Position> result;
  result.reserve(open_.size());
  for (const auto& [id, pos] : open_) {
    result.push_back(pos);
  }
  return result;
}

std::vector<domain::Position> PositionEngine::closedPositions() const {
  std::shared_lock lock(positions_mutex_);
  std::vector<domain::Position> result;
  result.reserve(closed_.size());
  for (const auto& [id, pos] : closed_) {
    result.push_back(pos);
  }
  return result;
}

std::size_t PositionEngine::faultCount() const {
  std::shared_lock lock(positions_mutex_);
  return fault_count_;
}

// -----------------------------------------------------------------------------
// onFill: event-loop boundary
// -----------------------------------------------------------------------------
void PositionEngine::onFill(const OrderFilledEvent& fill) {
  try {
    applyFill(fill);
  } catch (const domain::ContractViolation& e) {
    std::cerr << "[PositionEngine] CONTRACT VIOLATION: " << e.what()
              << " (position_id=" << fill.position_id.value()
              << ", order_id=" << fill.order_id.value() << ")\n";
    {
      std::unique_lock lock(positions_mutex_);
      ++fault_count_;
    }
    bus_.publish(AccountingFaultEvent{"PositionEngine", e.what(),
                                      fill.position_id.value(), fill.timestamp,
                                      fill.sequence_id});
  }
}

}  // namespace folio
