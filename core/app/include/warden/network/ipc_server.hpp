#pragma once

#include "warden/concurrent/thread_safe_queue.hpp"
#include "warden/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace warden {

// -----------------------------------------------------------------------------
// IpcServer: operator control (REP) and telemetry broadcast (PUB)
// -----------------------------------------------------------------------------
//
// @brief  Runs one thread that answers operator commands on a REP socket
//         and publishes outbound events as JSON on a PUB socket.
//
// @details
// REP socket (default port 5556):
//   Each request is a plain command line ("STATUS", "SAFE", "PANIC",
//   "KILL_SWITCH safe", ...). It is handed to command_handler_, bound to
//   WardenEngine::executeCommand(), and the returned JSON is sent back.
//   ZMQ_RCVTIMEO keeps the loop from blocking on an idle client. Empty
//   requests and handler exceptions are answered with
//   {"status":"error","error":...} so the REP state machine never stalls.
//
// PUB socket (default port 5557):
//   OrderUpdateEvent, PositionUpdateEvent, SafetyTransitionEvent and
//   NotificationEvent are formatted as one JSON object each, tagged with
//   "type". SignalEvent is inbound only and is never published.
//
// Thread model:
//   pushTelemetry() may be called from any thread; it only enqueues.
//   command_handler_ runs on the IPC thread, so it must only touch
//   thread-safe engine accessors.
//
// Ownership:
//   Owned by WardenEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
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

  // Binds both sockets and spawns the worker. No-op when already running.
  void start();

  // Joins the worker after a final telemetry drain. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  //
  // @return JSON text for outbound event types, std::nullopt for SignalEvent.
  //
  // Pure function; public so the wire format can be tested without sockets.
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void publishPending();
  // Answers at most one request; returns after kPollTimeoutMs when idle.
  void serveOneCommand();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::size_t published_{0};  // IPC thread only
};

}  // namespace warden
