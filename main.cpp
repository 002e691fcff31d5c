// -----------------------------------------------------------------------------
// warden: single executable entry point.
//
//   1) Load the JSON config given on the command line (defaults otherwise)
//      and apply environment overrides.
//   2) Build the WardenEngine on a PaperExchangeGateway. A live venue adapter
//      implements IExchangeGateway and replaces it here; nothing else
//      changes.
//   3) start(): startup reconciliation, loops, workers, IPC, gateways.
//   4) Park the main thread until SIGINT/SIGTERM, then stop() cleanly.
//
// Thread layout:
//   main thread      → waits on g_shutdown
//   notify / signal  → EventLoopThreads owned by the engine
//   workers          → account, order_sync, prices, reconcile, safety,
//                      capability
//   ipc / gateways   → ZeroMQ REP+PUB, signal SUB, price SUB
// -----------------------------------------------------------------------------

#include "warden/config/app_config.hpp"
#include "warden/engine/warden_engine.hpp"
#include "warden/exchange/paper_exchange_gateway.hpp"
#include "warden/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

// The only global: set from the signal handler, polled by main().
static std::atomic<bool> g_shutdown{false};

static void shutdown_handler(int /*signum*/) { g_shutdown.store(true); }

int main(int argc, char** argv) {
  warden::AppConfig config;
  try {
    if (argc > 1) {
      config = warden::loadConfig(argv[1]);
    } else {
      warden::applyEnvOverrides(config);
      std::cout << "[main] no config file given, using defaults\n";
    }
  } catch (const warden::ConfigError& e) {
    std::cerr << "[main] config error: " << e.what() << "\n";
    return 2;
  }

  warden::LiveTimeProvider clock;
  warden::PaperExchangeGateway exchange(clock);
  warden::WardenEngine engine(config, exchange, clock);

  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  engine.start();
  std::cout << "[main] running. Ctrl-C to stop.\n";

  while (!g_shutdown.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  std::cout << "\n[main] shutdown requested.\n";
  engine.stop();
  std::cout << "[main] clean shutdown complete.\n";
  return 0;
}
