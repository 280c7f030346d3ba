// =============================================================================
// position_engine_test.cpp
// =============================================================================
// Unit tests for folio::PositionEngine.
//
// Validates:
//   - First fill publishes PositionOpenedEvent, later fills Modified/Closed
//   - Closed positions stay queryable and their ids cannot be reused
//   - applyFill() throws; the bus handler turns the same violation into an
//     AccountingFaultEvent and counts it
//   - hydratePosition() seeds state without publishing
//   - The engine unsubscribes from the bus on destruction
// =============================================================================

#include "folio/domain/errors.hpp"
#include "folio/eventbus/event_bus.hpp"
#include "folio/portfolio/position_engine.hpp"

#include "test_fixtures.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace folio;
using domain::OrderSide;

class PositionEngineTest : public ::testing::Test {
 protected:
  EventBus bus;
  PositionEngine engine{bus};

  std::vector<std::string> lifecycle;
  std::vector<AccountingFaultEvent> faults;

  void SetUp() override {
    bus.subscribe<PositionOpenedEvent>(
        [this](const PositionOpenedEvent&) { lifecycle.push_back("opened"); });
    bus.subscribe<PositionModifiedEvent>([this](const PositionModifiedEvent&) {
      lifecycle.push_back("modified");
    });
    bus.subscribe<PositionClosedEvent>(
        [this](const PositionClosedEvent&) { lifecycle.push_back("closed"); });
    bus.subscribe<AccountingFaultEvent>(
        [this](const AccountingFaultEvent& e) { faults.push_back(e); });
  }

  static OrderFilledEvent fill(OrderSide side, const std::string& qty,
                               const std::string& price,
                               const std::string& order_id,
                               const std::string& position_id = "P-1") {
    return test::makeFill(position_id, "AUDUSD.FXCM", side, qty, price, "AUD",
                          "USD", order_id);
  }
};

// -----------------------------------------------------------------------------
// 1. Open, modify, close in sequence.
// -----------------------------------------------------------------------------
TEST_F(PositionEngineTest, LifecycleEventsInOrder) {
  engine.applyFill(fill(OrderSide::Buy, "100000", "1.00000", "O-1"));
  engine.applyFill(fill(OrderSide::Buy, "50000", "1.00000", "O-2"));
  engine.applyFill(fill(OrderSide::Sell, "150000", "1.00010", "O-3"));

  ASSERT_EQ(lifecycle.size(), 3u);
  EXPECT_EQ(lifecycle[0], "opened");
  EXPECT_EQ(lifecycle[1], "modified");
  EXPECT_EQ(lifecycle[2], "closed");

  EXPECT_TRUE(engine.openPositions().empty());
  ASSERT_EQ(engine.closedPositions().size(), 1u);
  EXPECT_EQ(engine.closedPositions()[0].realizedPnl(),
            test::money("15.00", "USD"));
}

// -----------------------------------------------------------------------------
// 2. The published snapshot is the state after the fill.
// -----------------------------------------------------------------------------
TEST_F(PositionEngineTest, SnapshotReflectsFill) {
  std::string quantity;
  bus.subscribe<PositionModifiedEvent>([&quantity](const PositionModifiedEvent& e) {
    quantity = e.position.quantity().toString();
  });

  engine.applyFill(fill(OrderSide::Buy, "100000", "1.00000", "O-1"));
  engine.applyFill(fill(OrderSide::Sell, "40000", "1.00000", "O-2"));

  EXPECT_EQ(quantity, "60000");
}

TEST_F(PositionEngineTest, FlipStaysOpenAndPublishesModified) {
  engine.applyFill(fill(OrderSide::Buy, "100000", "1.00000", "O-1"));
  engine.applyFill(fill(OrderSide::Sell, "130000", "1.00000", "O-2"));

  ASSERT_EQ(lifecycle.size(), 2u);
  EXPECT_EQ(lifecycle[1], "modified");
  auto pos = engine.position(domain::PositionId("P-1"));
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->side(), domain::PositionSide::Short);
  EXPECT_EQ(pos->quantity().toString(), "30000");
}

// -----------------------------------------------------------------------------
// 3. A fill for a closed id throws from applyFill() ...
// -----------------------------------------------------------------------------
TEST_F(PositionEngineTest, ApplyFillOnClosedIdThrows) {
  engine.applyFill(fill(OrderSide::Buy, "1000", "1.00000", "O-1"));
  engine.applyFill(fill(OrderSide::Sell, "1000", "1.00000", "O-2"));

  EXPECT_THROW(engine.applyFill(fill(OrderSide::Buy, "1000", "1.00000", "O-3")),
               domain::InvalidFill);
  EXPECT_EQ(lifecycle.size(), 2u);
}

// -----------------------------------------------------------------------------
// 4. ... and becomes a fault event when it arrives through the bus.
// Why: The loop thread must survive bad input.
// -----------------------------------------------------------------------------
TEST_F(PositionEngineTest, BusFillOnClosedIdPublishesFault) {
  bus.publish(fill(OrderSide::Buy, "1000", "1.00000", "O-1"));
  bus.publish(fill(OrderSide::Sell, "1000", "1.00000", "O-2"));
  bus.publish(fill(OrderSide::Buy, "1000", "1.00000", "O-3"));

  ASSERT_EQ(faults.size(), 1u);
  EXPECT_EQ(faults[0].component, "PositionEngine");
  EXPECT_EQ(faults[0].reference, "P-1");
  EXPECT_NE(faults[0].reason.find("closed"), std::string::npos);
  EXPECT_EQ(engine.faultCount(), 1u);
}

TEST_F(PositionEngineTest, MismatchedFillLeavesStoredPositionUntouched) {
  engine.applyFill(fill(OrderSide::Buy, "1000", "1.00000", "O-1"));

  OrderFilledEvent wrong = test::makeFill("P-1", "GBPUSD.FXCM", OrderSide::Buy,
                                          "1000", "1.00000", "GBP", "USD",
                                          "O-2");
  EXPECT_THROW(engine.applyFill(wrong), domain::InvalidFill);

  auto pos = engine.position(domain::PositionId("P-1"));
  ASSERT_TRUE(pos.has_value());
  EXPECT_EQ(pos->fillCount(), 1u);
  EXPECT_EQ(pos->symbol().toString(), "AUDUSD.FXCM");
}

// -----------------------------------------------------------------------------
// 5. Hydration seeds state silently; closed snapshots go to the closed map.
// -----------------------------------------------------------------------------
TEST_F(PositionEngineTest, HydratePositionDoesNotPublish) {
  domain::Position open(fill(OrderSide::Buy, "1000", "1.00000", "O-1", "P-A"));
  domain::Position closed(fill(OrderSide::Buy, "1000", "1.00000", "O-1", "P-B"));
  closed.apply(fill(OrderSide::Sell, "1000", "1.00000", "O-2", "P-B"));

  engine.hydratePosition(open);
  engine.hydratePosition(closed);

  EXPECT_TRUE(lifecycle.empty());
  EXPECT_EQ(engine.openPositions().size(), 1u);
  EXPECT_EQ(engine.closedPositions().size(), 1u);

  engine.applyFill(fill(OrderSide::Buy, "1000", "1.00000", "O-3", "P-A"));
  ASSERT_EQ(lifecycle.size(), 1u);
  EXPECT_EQ(lifecycle[0], "modified");

  EXPECT_THROW(
      engine.applyFill(fill(OrderSide::Buy, "1", "1.00000", "O-4", "P-B")),
      domain::InvalidFill);
}

TEST_F(PositionEngineTest, UnknownIdIsNone) {
  EXPECT_FALSE(engine.position(domain::PositionId("P-404")).has_value());
}

TEST(PositionEngineLifetimeTest, UnsubscribesOnDestruction) {
  EventBus bus;
  {
    PositionEngine engine(bus);
    EXPECT_EQ(bus.subscriberCount(), 1u);
  }
  EXPECT_EQ(bus.subscriberCount(), 0u);
  EXPECT_NO_THROW(bus.publish(test::makeFill(
      "P-1", "AUDUSD.FXCM", OrderSide::Buy, "1", "1.00000", "AUD", "USD")));
}
