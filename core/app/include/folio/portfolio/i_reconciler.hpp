#pragma once

#include "folio/domain/position.hpp"
#include "folio/events/event_types.hpp"

#include <vector>

namespace folio {

// -----------------------------------------------------------------------------
// IReconciler: venue state recovery at startup
// -----------------------------------------------------------------------------
//
// @brief  Supplies the account states and open positions that exist at the
//         venues before the engine has seen a single event.
//
// @details
// AccountingEngine::start() calls both methods once, on the calling thread,
// before the accounting loop is started. Account states are registered in the
// Portfolio; positions are hydrated into the PositionEngine and registered in
// the Portfolio as open positions. Implementations may block on I/O but must
// return.
//
// Ownership:
//   Not owned by the engine. The pointer passed to start() is only used
//   during start().
// -----------------------------------------------------------------------------
class IReconciler {
 public:
  virtual ~IReconciler() = default;

  virtual std::vector<AccountStateEvent> reconcileAccounts() = 0;
  virtual std::vector<domain::Position> reconcilePositions() = 0;
};

}  // namespace folio
