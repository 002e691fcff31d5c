#include "warden/gateway/signal_gateway.hpp"
#include "warden/gateway/signal_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace warden {

SignalGateway::SignalGateway(const ITimeProvider& clock, EventSink event_sink,
                             std::string endpoint)
    : clock_(clock),
      event_sink_(std::move(event_sink)),
      endpoint_(std::move(endpoint)) {}

SignalGateway::~SignalGateway() { stop(); }

void SignalGateway::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::sub);
  socket_->set(zmq::sockopt::subscribe, "");
  socket_->set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_->connect(endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[SignalGateway] listening on " << endpoint_ << "\n";
}

void SignalGateway::stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
    std::cout << "[SignalGateway] stopped. received=" << received_.load()
              << " dropped=" << dropped_.load() << "\n";
  }
  socket_.reset();
  context_.reset();
}

void SignalGateway::run() {
  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_->recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      std::cerr << "[SignalGateway] recv error: " << e.what() << "\n";
      break;
    }
    if (!result.has_value()) {
      continue;  // Timeout; re-check running_
    }
    handlePayload(msg.to_string());
  }
}

bool SignalGateway::handlePayload(const std::string& payload) {
  ++received_;
  try {
    auto envelope = parseSignal(payload, clock_.now_ms());
    event_sink_(SignalEvent{std::move(envelope)});
    return true;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[SignalGateway] JSON error: " << e.what()
              << " - payload: " << payload << "\n";
  } catch (const SignalFormatError& e) {
    std::cerr << "[SignalGateway] invalid signal: " << e.what()
              << " - payload: " << payload << "\n";
  }
  ++dropped_;
  return false;
}

}  // namespace warden
