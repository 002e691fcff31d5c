#pragma once

#include "warden/events/event.hpp"
#include "warden/time/i_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace warden {

// -----------------------------------------------------------------------------
// SignalGateway: ZeroMQ ingestion boundary for trade signals
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON signals on a SUB socket, validates them with the
//         SignalCodec and pushes a SignalEvent into the signal loop.
//
// @details
// The upstream parser (chat listener, LLM extractor, operator tool)
// publishes one JSON object per message; see signal_codec.hpp for the
// format. Messages that fail to parse or validate are logged to stderr and
// dropped here; nothing malformed reaches the engine.
//
// received_at_ms defaults to the gateway clock at receipt when the
// publisher does not stamp it, so the signal-age check still has a
// reference.
//
// Thread model:
//   start() opens the socket and spawns the recv thread; stop() sets the
//   flag, and the loop notices within kRecvTimeoutMs. The sink is called on
//   the recv thread and is expected to only enqueue.
//
// Ownership:
//   Owned by WardenEngine via std::unique_ptr. Owns the ZMQ context,
//   socket and thread.
// -----------------------------------------------------------------------------
class SignalGateway {
 public:
  using EventSink = std::function<void(Event)>;

  SignalGateway(const ITimeProvider& clock, EventSink event_sink,
                std::string endpoint = "tcp://127.0.0.1:5560");
  ~SignalGateway();

  SignalGateway(const SignalGateway&) = delete;
  SignalGateway& operator=(const SignalGateway&) = delete;
  SignalGateway(SignalGateway&&) = delete;
  SignalGateway& operator=(SignalGateway&&) = delete;

  void start();
  void stop();

  std::uint64_t received() const { return received_.load(); }
  std::uint64_t dropped() const { return dropped_.load(); }

  // Decodes one payload and forwards it. Returns false when dropped.
  bool handlePayload(const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  void run();

  const ITimeProvider& clock_;
  EventSink event_sink_;
  std::string endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;
  std::thread thread_;
  std::atomic<bool> running_{false};

  std::atomic<std::uint64_t> received_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

}  // namespace warden
