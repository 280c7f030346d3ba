#include "folio/network/ipc_server.hpp"
#include "folio/codec/event_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <iostream>
#include <utility>

namespace folio {

namespace {

std::string errorReply(const std::string& reason) {
  nlohmann::json j;
  j["status"] = "error";
  j["response"] = reason;
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind both endpoints, then spawn the server thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  try {
    context_ = std::make_unique<zmq::context_t>(1);
    cmd_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
    pub_socket_ =
        std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

    cmd_socket_->set(zmq::sockopt::linger, 0);
    pub_socket_->set(zmq::sockopt::linger, 0);
    cmd_socket_->bind(cmd_endpoint_);
    pub_socket_->bind(pub_endpoint_);
  } catch (const zmq::error_t& e) {
    std::cerr << "[IpcServer] ERROR: cannot bind CMD=" << cmd_endpoint_
              << " PUB=" << pub_endpoint_ << ": " << e.what() << "\n";
    releaseSockets();
    throw;
  }

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  if (!thread_.joinable()) {
    return;
  }

  running_.store(false);
  thread_.join();
  releaseSockets();

  std::cout << "[IpcServer] stopped. commands=" << commands_.load()
            << " (failed " << failed_commands_.load()
            << "), telemetry published=" << published_.load() << "\n";
}

void IpcServer::releaseSockets() {
  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): telemetry between command polls, final flush on the way out
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    flushTelemetry();
    serveCommand();
  }
  flushTelemetry();
}

void IpcServer::flushTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    auto line = encodeTelemetry(*event);
    if (!line) {
      continue;
    }
    zmq::message_t msg(line->data(), line->size());
    if (pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      ++published_;
    }
  }
}

// -----------------------------------------------------------------------------
// serveCommand(): wait up to kPollTimeout for one request and answer it
// -----------------------------------------------------------------------------
void IpcServer::serveCommand() {
  zmq::pollitem_t items[] = {{cmd_socket_->handle(), 0, ZMQ_POLLIN, 0}};

  try {
    zmq::poll(items, 1, kPollTimeout);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }
  if ((items[0].revents & ZMQ_POLLIN) == 0) {
    return;
  }

  zmq::message_t request;
  if (!cmd_socket_->recv(request, zmq::recv_flags::dontwait)) {
    return;
  }

  std::string command = request.to_string();
  std::string response = answer(command);

  zmq::message_t reply(response.data(), response.size());
  if (!cmd_socket_->send(reply, zmq::send_flags::none)) {
    std::cerr << "[IpcServer] WARNING: reply to '" << command
              << "' was not sent.\n";
  }
}

std::string IpcServer::answer(const std::string& command) {
  ++commands_;
  try {
    return command_handler_(command);
  } catch (const nlohmann::json::exception& e) {
    ++failed_commands_;
    std::cerr << "[IpcServer] ERROR: reply encoding failed: " << e.what()
              << "\n";
    return errorReply(std::string("reply encoding failed: ") + e.what());
  } catch (const std::exception& e) {
    ++failed_commands_;
    std::cerr << "[IpcServer] ERROR: command failed: " << e.what() << "\n";
    return errorReply(e.what());
  }
}

}  // namespace folio
