// =============================================================================
// ipc_server_test.cpp
// =============================================================================
// Unit tests for folio::IpcServer.
//
// Validates:
//   - answer() passes the handler's reply through unchanged
//   - A handler that throws still produces a JSON error reply, counted as a
//     failed command
//   - A REQ client gets one reply per request over loopback TCP, including
//     after a failed command
//   - Telemetry pushed before stop() is published, and stop() is idempotent
//
// Design:
//   The socket tests bind on fixed loopback ports in the 5962x range and use
//   a 2s receive timeout on the client so a broken server fails instead of
//   hanging.
// =============================================================================

#include "folio/network/ipc_server.hpp"

#include "test_fixtures.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <stdexcept>
#include <string>

using namespace folio;
using nlohmann::json;

namespace {

constexpr const char* kCmdEndpoint = "tcp://127.0.0.1:59621";
constexpr const char* kPubEndpoint = "tcp://127.0.0.1:59622";

std::string echoOrThrow(const std::string& cmd) {
  if (cmd == "EXPLODE") {
    throw std::runtime_error("handler blew up");
  }
  json j;
  j["status"] = "ok";
  j["echo"] = cmd;
  return j.dump();
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. The handler's reply is returned as is.
// -----------------------------------------------------------------------------
TEST(IpcServerTest, AnswerPassesReplyThrough) {
  IpcServer server(echoOrThrow, kCmdEndpoint, kPubEndpoint);

  json reply = json::parse(server.answer("PING"));
  EXPECT_EQ(reply["status"], "ok");
  EXPECT_EQ(reply["echo"], "PING");
  EXPECT_EQ(server.commandCount(), 1u);
  EXPECT_EQ(server.failedCommandCount(), 0u);
}

// -----------------------------------------------------------------------------
// 2. A throwing handler becomes an error document.
// Why: The REP socket is stuck until it replies; an exception escaping the
//      server thread would also terminate the process.
// -----------------------------------------------------------------------------
TEST(IpcServerTest, ThrowingHandlerBecomesErrorReply) {
  IpcServer server(echoOrThrow, kCmdEndpoint, kPubEndpoint);

  std::string raw;
  ASSERT_NO_THROW(raw = server.answer("EXPLODE"));
  json reply = json::parse(raw);
  EXPECT_EQ(reply["status"], "error");
  EXPECT_EQ(reply["response"], "handler blew up");
  EXPECT_EQ(server.failedCommandCount(), 1u);
}

TEST(IpcServerTest, ErrorReplyToleratesNonUtf8Reason) {
  IpcServer server(
      [](const std::string& cmd) -> std::string {
        throw std::runtime_error("bad command: " + cmd);
      },
      kCmdEndpoint, kPubEndpoint);

  std::string raw;
  ASSERT_NO_THROW(raw = server.answer(std::string("\xff", 1)));
  EXPECT_EQ(json::parse(raw)["status"], "error");
}

// -----------------------------------------------------------------------------
// 3. Round trips over loopback: the server keeps answering after a failure.
// -----------------------------------------------------------------------------
TEST(IpcServerTest, RequestReplyOverLoopback) {
  IpcServer server(echoOrThrow, kCmdEndpoint, kPubEndpoint);
  server.start();

  zmq::context_t context(1);
  zmq::socket_t client(context, zmq::socket_type::req);
  client.set(zmq::sockopt::rcvtimeo, 2000);
  client.set(zmq::sockopt::linger, 0);
  client.connect(kCmdEndpoint);

  auto roundTrip = [&client](const std::string& cmd) -> json {
    EXPECT_TRUE(
        client.send(zmq::buffer(cmd), zmq::send_flags::none).has_value());
    zmq::message_t reply;
    auto received = client.recv(reply, zmq::recv_flags::none);
    if (!received) {
      ADD_FAILURE() << "no reply to " << cmd << " within 2s";
      return json();
    }
    return json::parse(reply.to_string());
  };

  EXPECT_EQ(roundTrip("PING")["echo"], "PING");
  EXPECT_EQ(roundTrip("EXPLODE")["status"], "error");
  EXPECT_EQ(roundTrip("STATUS")["echo"], "STATUS");

  server.stop();
  EXPECT_EQ(server.commandCount(), 3u);
  EXPECT_EQ(server.failedCommandCount(), 1u);
}

// -----------------------------------------------------------------------------
// 4. Telemetry queued before stop() is flushed; kinds without a telemetry
//    form are dropped.
// -----------------------------------------------------------------------------
TEST(IpcServerTest, StopFlushesQueuedTelemetry) {
  IpcServer server(echoOrThrow, kCmdEndpoint, kPubEndpoint);
  server.start();

  server.pushTelemetry(AccountingFaultEvent{"PositionEngine", "rejected", "P-1"});
  server.pushTelemetry(test::makeTick("AUDUSD.FXCM", "0.80501", "0.80505"));

  server.stop();
  server.stop();
  EXPECT_EQ(server.publishedCount(), 1u);
}
