#pragma once

#include "warden/market/price_book.hpp"
#include "warden/time/i_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace warden {

// -----------------------------------------------------------------------------
// PriceFeedGateway: streaming price ticks into the PriceBook
// -----------------------------------------------------------------------------
//
// @brief  SUB socket receiving {"symbol", "price", "timestamp_ms"} ticks and
//         writing them to the PriceBook as PriceSource::Streaming.
//
// @details
// The stream is the preferred source for local-guard stops. Staleness is
// not judged here: the price worker asks PriceBook::streamHealthy() and
// falls back to polling getPrice() when the stream has gone quiet, and the
// book records the switch to PriceSource::Polling.
//
// timestamp_ms is optional; ticks without it are stamped with the local
// clock. Malformed ticks are logged and dropped.
//
// Thread model: same start()/stop() discipline as SignalGateway.
// -----------------------------------------------------------------------------
class PriceFeedGateway {
 public:
  PriceFeedGateway(PriceBook& book, const ITimeProvider& clock,
                   std::string endpoint = "tcp://127.0.0.1:5561");
  ~PriceFeedGateway();

  PriceFeedGateway(const PriceFeedGateway&) = delete;
  PriceFeedGateway& operator=(const PriceFeedGateway&) = delete;
  PriceFeedGateway(PriceFeedGateway&&) = delete;
  PriceFeedGateway& operator=(PriceFeedGateway&&) = delete;

  void start();
  void stop();

  // Decodes and applies one tick. Returns false when dropped.
  bool handleTick(const std::string& payload);

  std::uint64_t ticks() const { return ticks_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  void run();

  PriceBook& book_;
  const ITimeProvider& clock_;
  std::string endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> ticks_{0};
};

}  // namespace warden
