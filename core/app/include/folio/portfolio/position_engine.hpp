#pragma once

#include "folio/domain/identifiers.hpp"
#include "folio/domain/position.hpp"
#include "folio/eventbus/event_bus.hpp"
#include "folio/events/event.hpp"

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace folio {

// -----------------------------------------------------------------------------
// PositionEngine: turns fills into position lifecycle events
// -----------------------------------------------------------------------------
//
// @brief  Subscribes to OrderFilledEvent, owns the authoritative Position per
//         PositionId, and publishes PositionOpened / Modified / Closed
//         snapshots after every fill.
//
// @details
// The first fill for a position id creates the Position; later fills are
// applied to it. A position that goes Flat moves from the open map to the
// closed map and stays there so its realized PnL remains queryable. A fill
// for a closed id is an InvalidFill: ids are never reused.
//
// Error boundary:
//   applyFill() lets ContractViolation propagate to the caller. The bus
//   handler (onFill) is the event-loop boundary: it logs the violation to
//   std::cerr and publishes an AccountingFaultEvent instead, so one bad fill
//   cannot take down the accounting loop.
//
// Thread model:
//   onFill() runs on the accounting loop thread. Readers (position(),
//   openPositions(), closedPositions()) may run on any thread; the maps are
//   guarded by a shared_mutex and readers get copies. Events are published
//   after the lock is released.
//
// Ownership:
//   Owned by AccountingEngine. Holds a reference to the loop's EventBus and
//   must be destroyed before it.
// -----------------------------------------------------------------------------
class PositionEngine {
 public:
  explicit PositionEngine(EventBus& bus);
  ~PositionEngine();

  PositionEngine(const PositionEngine&) = delete;
  PositionEngine& operator=(const PositionEngine&) = delete;
  PositionEngine(PositionEngine&&) = delete;
  PositionEngine& operator=(PositionEngine&&) = delete;

  // Applies one fill and publishes the resulting lifecycle event. Throws
  // InvalidFill (or another ContractViolation) and leaves state untouched
  // when the fill is rejected.
  void applyFill(const OrderFilledEvent& fill);

  // -------------------------------------------------------------------------
  // hydratePosition(position)
  // -------------------------------------------------------------------------
  // Warm-up only: seeds a position recovered by an IReconciler before the
  // loop starts. No event is published. An existing entry for the same id is
  // overwritten.
  // -------------------------------------------------------------------------
  void hydratePosition(const domain::Position& position);

  std::optional<domain::Position> position(const domain::PositionId& id) const;
  std::vector<domain::Position> openPositions() const;
  std::vector<domain::Position> closedPositions() const;

  // Fills rejected by onFill since construction.
  std::size_t faultCount() const;

 private:
  void onFill(const OrderFilledEvent& fill);

  EventBus& bus_;
  EventBus::SubscriptionId fill_sub_id_{0};

  mutable std::shared_mutex positions_mutex_;
  std::unordered_map<domain::PositionId, domain::Position> open_;
  std::unordered_map<domain::PositionId, domain::Position> closed_;
  std::size_t fault_count_{0};
};

}  // namespace folio
