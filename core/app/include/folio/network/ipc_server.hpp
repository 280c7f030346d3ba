#pragma once

#include "folio/concurrent/thread_safe_queue.hpp"
#include "folio/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace folio {

// -----------------------------------------------------------------------------
// IpcServer: command and telemetry endpoints
// -----------------------------------------------------------------------------
//
// @brief  A ZeroMQ REP socket answering text commands and a PUB socket
//         streaming telemetry, served from one background thread.
//
// @details
// Commands ("PING", "OPEN_VALUE FXCM", ...) are passed verbatim to the
// CommandHandler, which is AccountingEngine::executeCommand. The reply is
// whatever the handler returns (a JSON document). A REP socket must answer
// every request before it can receive the next one, so when the handler
// throws the server still replies, with
//   {"status":"error","response":"<what()>"}
// and counts the failure. Non-UTF-8 bytes in that text are replaced.
//
// Telemetry events are queued by pushTelemetry() from the accounting loop and
// encoded with encodeTelemetry() on the server thread; event kinds without a
// telemetry form are dropped. Telemetry still queued at stop() is flushed
// before the PUB socket closes.
//
// Thread model:
//   start() and stop() from the owning thread. pushTelemetry() from any
//   thread. The handler runs on the server thread, so it may only use
//   thread-safe queries (the Portfolio's shared-lock readers).
//
// Ownership:
//   Sockets and context are created in start() and destroyed in stop(). A
//   start() whose bind fails releases them again and rethrows zmq::error_t,
//   leaving the server stopped.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  void start();
  void stop();

  void pushTelemetry(Event event);

  // Runs the handler and shields the REP round trip from its exceptions.
  // Public so the reply contract can be exercised without sockets.
  std::string answer(const std::string& command);

  std::size_t publishedCount() const { return published_.load(); }
  std::size_t commandCount() const { return commands_.load(); }
  std::size_t failedCommandCount() const { return failed_commands_.load(); }

 private:
  static constexpr auto kPollTimeout = std::chrono::milliseconds(50);

  void run();
  void flushTelemetry();
  void serveCommand();
  void releaseSockets();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> published_{0};
  std::atomic<std::size_t> commands_{0};
  std::atomic<std::size_t> failed_commands_{0};
};

}  // namespace folio
