#pragma once

#include "folio/domain/position.hpp"
#include "folio/time/time_utils.hpp"

#include <cstdint>

namespace folio {

// -----------------------------------------------------------------------------
// Position lifecycle events
// -----------------------------------------------------------------------------
// Responsibility: Carry a snapshot of a Position after the fill that changed
// it. PositionEngine publishes them; the Portfolio consumes them.
//
//   PositionOpenedEvent    first fill for a position id
//   PositionModifiedEvent  a later fill that left the position open
//   PositionClosedEvent    the fill that took the position to Flat
//
// The snapshot is a copy: the engine keeps mutating its own Position and the
// receiver never observes that.
// -----------------------------------------------------------------------------
struct PositionOpenedEvent {
  domain::Position position;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

struct PositionModifiedEvent {
  domain::Position position;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

struct PositionClosedEvent {
  domain::Position position;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace folio
