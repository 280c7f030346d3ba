// =============================================================================
// feed_gateway_test.cpp
// =============================================================================
// Unit tests for folio::FeedGateway message handling.
//
// The gateway connects a SUB socket to an endpoint nobody binds; ZeroMQ
// connects lazily, so construction succeeds and handleMessage() can be
// driven directly without a publisher.
// =============================================================================

#include "folio/gateway/feed_gateway.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <utility>
#include <variant>
#include <vector>

using namespace folio;

class FeedGatewayTest : public ::testing::Test {
 protected:
  CurrencyTable currencies;
  InstrumentTable instruments;
  std::vector<Event> received;
};

TEST_F(FeedGatewayTest, ValidMessageReachesSink) {
  FeedGateway gateway(currencies, instruments,
                      [this](Event e) { received.push_back(std::move(e)); },
                      "tcp://127.0.0.1:59555");

  EXPECT_TRUE(gateway.handleMessage(
      R"({"type":"quote_tick","symbol":"AUDUSD.FXCM","bid":"0.80501","ask":"0.80505"})"));

  ASSERT_EQ(received.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<domain::QuoteTick>(received[0]));
  EXPECT_EQ(gateway.acceptedCount(), 1u);
  EXPECT_EQ(gateway.rejectedCount(), 0u);
}

// -----------------------------------------------------------------------------
// A bad message is counted and dropped; the next one still goes through.
// -----------------------------------------------------------------------------
TEST_F(FeedGatewayTest, MalformedMessageIsDroppedNotThrown) {
  FeedGateway gateway(currencies, instruments,
                      [this](Event e) { received.push_back(std::move(e)); },
                      "tcp://127.0.0.1:59555");

  EXPECT_FALSE(gateway.handleMessage("{not json"));
  EXPECT_FALSE(gateway.handleMessage(R"({"type":"quote_tick"})"));
  EXPECT_TRUE(gateway.handleMessage(
      R"({"type":"account_state","account_id":"FXCM-001-SIMULATED",
          "currency":"USD","balance":"1000000","margin_used":"0",
          "margin_available":"1000000"})"));

  EXPECT_EQ(gateway.rejectedCount(), 2u);
  EXPECT_EQ(gateway.acceptedCount(), 1u);
  ASSERT_EQ(received.size(), 1u);
  EXPECT_TRUE(std::holds_alternative<AccountStateEvent>(received[0]));
}

// -----------------------------------------------------------------------------
// stop() before run() must not be lost: run() returns straight away.
// -----------------------------------------------------------------------------
TEST_F(FeedGatewayTest, StopBeforeRunReturns) {
  FeedGateway gateway(currencies, instruments, [](Event) {},
                      "tcp://127.0.0.1:59555");
  gateway.stop();

  std::thread runner([&gateway] { gateway.run(); });
  runner.join();
  SUCCEED();
}
