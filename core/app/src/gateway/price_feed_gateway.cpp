#include "warden/gateway/price_feed_gateway.hpp"
#include "warden/gateway/signal_codec.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace warden {

PriceFeedGateway::PriceFeedGateway(PriceBook& book, const ITimeProvider& clock,
                                   std::string endpoint)
    : book_(book), clock_(clock), endpoint_(std::move(endpoint)) {}

PriceFeedGateway::~PriceFeedGateway() { stop(); }

void PriceFeedGateway::start() {
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

  std::cout << "[PriceFeedGateway] listening on " << endpoint_ << "\n";
}

void PriceFeedGateway::stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
    std::cout << "[PriceFeedGateway] stopped after " << ticks_.load()
              << " ticks\n";
  }
  socket_.reset();
  context_.reset();
}

void PriceFeedGateway::run() {
  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_->recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      std::cerr << "[PriceFeedGateway] recv error: " << e.what() << "\n";
      break;
    }
    if (!result.has_value()) {
      continue;
    }
    handleTick(msg.to_string());
  }
}

bool PriceFeedGateway::handleTick(const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);
    const std::string symbol =
        normalizeSymbol(json.at("symbol").get<std::string>());
    const double price = json.at("price").get<double>();
    const std::int64_t ts = json.value("timestamp_ms", clock_.now_ms());
    if (symbol.empty() || price <= 0.0) {
      std::cerr << "[PriceFeedGateway] dropped tick: " << payload << "\n";
      return false;
    }
    book_.update(symbol, price, ts, PriceSource::Streaming);
    ++ticks_;
    return true;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[PriceFeedGateway] JSON error: " << e.what()
              << " - payload: " << payload << "\n";
  }
  return false;
}

}  // namespace warden
