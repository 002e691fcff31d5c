#include "warden/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <iostream>
#include <utility>

namespace warden {

namespace {

std::string formatOrderUpdate(const OrderUpdateEvent& e) {
  nlohmann::json j;
  j["type"] = "order_update";
  j["order_id"] = e.order.order_id;
  j["client_order_id"] = e.order.spec.client_order_id;
  j["symbol"] = e.order.spec.symbol;
  j["side"] = domain::toString(e.order.spec.side);
  j["kind"] = domain::toString(e.order.spec.kind);
  j["order_type"] = domain::toString(e.order.spec.type);
  j["status"] = domain::toString(e.order.status);
  j["previous_status"] = domain::toString(e.previous_status);
  j["quantity"] = e.order.spec.quantity;
  j["price"] = e.order.spec.price;
  j["trigger_price"] = e.order.spec.trigger_price;
  j["filled_quantity"] = e.order.filled_quantity;
  j["timestamp_ms"] = e.timestamp_ms;
  return j.dump();
}

std::string formatPositionUpdate(const PositionUpdateEvent& e) {
  const auto& p = e.position;
  nlohmann::json j;
  j["type"] = "position_update";
  j["symbol"] = p.symbol;
  j["side"] = domain::toString(p.side);
  j["state"] = domain::toString(p.state);
  j["size"] = p.size;
  j["intended_size"] = p.intended_size;
  j["average_entry"] = p.average_entry;
  j["stop_mode"] = domain::toString(p.stop_mode);
  j["stop_price"] = p.stop_price;
  j["protected"] = domain::hasProtection(p);
  j["break_even_done"] = p.break_even_done;
  j["timestamp_ms"] = e.timestamp_ms;
  return j.dump();
}

std::string formatSafetyTransition(const SafetyTransitionEvent& e) {
  const auto& t = e.transition;
  nlohmann::json j;
  j["type"] = "safety_transition";
  j["from"] = domain::toString(t.from);
  j["to"] = domain::toString(t.to);
  j["reason"] = t.reason;
  j["source"] = t.source;
  j["version"] = t.version;
  j["timestamp_ms"] = t.timestamp_ms;
  return j.dump();
}

std::string formatNotification(const NotificationEvent& e) {
  nlohmann::json j;
  j["type"] = "notification";
  j["kind"] = toString(e.kind);
  j["symbol"] = e.symbol;
  j["code"] = e.code;
  j["message"] = e.message;
  j["timestamp_ms"] = e.timestamp_ms;
  return j.dump();
}

// A REP socket must answer every request before it can receive the next,
// so a handler failure is still turned into a reply.
std::string errorReply(const std::string& message) {
  nlohmann::json j;
  j["status"] = "error";
  j["error"] = message;
  return j.dump();
}

std::string trimCommand(std::string cmd) {
  while (!cmd.empty() && (cmd.back() == '\n' || cmd.back() == '\r' ||
                          cmd.back() == ' ' || cmd.back() == '\0')) {
    cmd.pop_back();
  }
  return cmd;
}

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  // linger 0: close() drops unsent telemetry instead of waiting for peers.
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);

  try {
    cmd_socket_->bind(cmd_endpoint_);
    pub_socket_->bind(pub_endpoint_);
  } catch (const zmq::error_t& e) {
    std::cerr << "[IpcServer] bind failed (CMD=" << cmd_endpoint_
              << " PUB=" << pub_endpoint_ << "): " << e.what() << "\n";
    cmd_socket_.reset();
    pub_socket_.reset();
    context_.reset();
    throw;
  }

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] listening. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  const bool was_running = running_.exchange(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped. published=" << published_ << "\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    publishPending();
    try {
      serveOneCommand();
    } catch (const zmq::error_t& e) {
      std::cerr << "[IpcServer] command socket error: " << e.what() << "\n";
      break;
    }
  }

  // Publish whatever is still queued before the sockets close.
  publishPending();
}

void IpcServer::publishPending() {
  for (const auto& event : telemetry_queue_.drain()) {
    auto text = formatTelemetry(event);
    if (!text) {
      continue;
    }
    zmq::message_t msg(text->data(), text->size());
    // dontwait: a PUB socket drops rather than blocks on slow subscribers.
    if (pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      ++published_;
    }
  }
}

void IpcServer::serveOneCommand() {
  zmq::message_t request;
  zmq::recv_result_t received;
  try {
    received = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }
  if (!received) {
    return;  // rcvtimeo elapsed with no client
  }

  const std::string cmd = trimCommand(
      std::string(static_cast<const char*>(request.data()), request.size()));
  std::string response;
  if (cmd.empty()) {
    response = errorReply("empty command");
  } else {
    try {
      response = command_handler_(cmd);
    } catch (const std::exception& e) {
      std::cerr << "[IpcServer] command '" << cmd << "' failed: " << e.what()
                << "\n";
      response = errorReply(e.what());
    }
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (auto* e = std::get_if<OrderUpdateEvent>(&event)) {
    return formatOrderUpdate(*e);
  }
  if (auto* e = std::get_if<PositionUpdateEvent>(&event)) {
    return formatPositionUpdate(*e);
  }
  if (auto* e = std::get_if<SafetyTransitionEvent>(&event)) {
    return formatSafetyTransition(*e);
  }
  if (auto* e = std::get_if<NotificationEvent>(&event)) {
    return formatNotification(*e);
  }
  return std::nullopt;
}

}  // namespace warden
