#pragma once

#include "warden/exchange/backoff_policy.hpp"
#include "warden/exchange/exchange_error.hpp"
#include "warden/exchange/i_exchange_gateway.hpp"
#include "warden/exchange/token_bucket.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

namespace warden {

// -----------------------------------------------------------------------------
// ExecutorConfig
// -----------------------------------------------------------------------------
// Defaults: 10 req/s sustained, bursts of 20, one call plus two retries,
// backoff 250 ms doubling up to 8 s with ±10 % jitter, 10 s per call.
// -----------------------------------------------------------------------------
struct ExecutorConfig {
  double rate_per_second{10.0};
  double burst{20.0};
  int max_attempts{3};
  std::chrono::milliseconds backoff_base{250};
  std::chrono::milliseconds backoff_cap{8000};
  double jitter_ratio{0.1};
  std::chrono::milliseconds call_timeout{10000};
};

// Reads are safe to repeat and to discard when late. Writes (cancel,
// leverage) are idempotent on the venue and may be repeated. A placement
// is neither: only a rate limit proves it was not applied.
enum class CallKind {
  Read,
  Write,
  Placement,
};

// -----------------------------------------------------------------------------
// RateLimitedExecutor: the single gate in front of IExchangeGateway
// -----------------------------------------------------------------------------
//
// @brief  Wraps every exchange call with a token-bucket rate limit, bounded
//         retries with exponential backoff and jitter, and a per-call
//         timeout check; surfaces exhausted retries as RetriesExhaustedError.
//
// @details
// Per attempt:
//   1. Take a token (may sleep; only the calling worker waits).
//   2. Invoke the gateway and measure elapsed time.
//   3. Read call slower than call_timeout → treated as ExchangeTimeoutError
//      and retried; the late result is discarded. A late write is kept (the
//      order exists either way) and logged.
//   4. TransientExchangeError (incl. rate limit, timeout) → sleep
//      backoff.delayFor(attempt) and retry while attempts remain.
//      Placements retry only RateLimitError; any other transient failure
//      throws UnconfirmedOrderError at once.
//   5. PermanentExchangeError → rethrown immediately, never retried.
//
// placeOrder() resolves an unconfirmed placement with a findOrder() lookup
// by client_order_id and re-sends only when the venue has no such order,
// so a timeout after the order landed never produces a second order.
//
// Every failed attempt is reported to the error listener; SafetySupervisor
// uses that feed for its API-error burst breaker.
//
// Thread model:
//   Shared by every worker. The bucket and backoff RNG are internally
//   synchronized; sleeps happen on the calling thread only, so a throttled
//   worker never blocks another worker's in-flight call.
//
// Ownership:
//   Holds a reference to the gateway; both are owned by WardenEngine (or
//   the test fixture) and the gateway must outlive the executor.
// -----------------------------------------------------------------------------
class RateLimitedExecutor {
 public:
  using ErrorListener = std::function<void(const std::string& operation,
                                           const std::string& what)>;

  RateLimitedExecutor(IExchangeGateway& gateway, const ExecutorConfig& config);

  RateLimitedExecutor(const RateLimitedExecutor&) = delete;
  RateLimitedExecutor& operator=(const RateLimitedExecutor&) = delete;
  RateLimitedExecutor(RateLimitedExecutor&&) = delete;
  RateLimitedExecutor& operator=(RateLimitedExecutor&&) = delete;

  // -------------------------------------------------------------------------
  // run(operation, kind, fn, max_attempts)
  // -------------------------------------------------------------------------
  //
  // @brief  Executes fn() under the rate limit / retry discipline.
  //
  // @param  operation     Name used in logs and error messages.
  // @param  kind          Read or Write; governs late-result handling.
  // @param  fn            Callable performing exactly one gateway call.
  // @param  max_attempts  Overrides config.max_attempts when > 0.
  //
  // @return Whatever fn() returns.
  //
  // @throws PermanentExchangeError  immediately, from fn().
  // @throws UnconfirmedOrderError   Placement only, on a non-rate-limit
  //                                 transient failure.
  // @throws RetriesExhaustedError   after the last transient failure.
  // -------------------------------------------------------------------------
  template <typename Fn>
  auto run(const std::string& operation, CallKind kind, Fn&& fn,
           int max_attempts = 0) -> decltype(fn());

  // --- Gateway operations through the gate ----------------------------------
  domain::AccountSnapshot getBalance();
  std::vector<domain::ExchangePosition> getPositions();
  std::vector<domain::Order> getOpenOrders();
  domain::Order placeOrder(const domain::OrderSpec& spec);
  std::optional<domain::Order> findOrder(const std::string& symbol,
                                         const std::string& client_order_id);
  void cancelOrder(const std::string& symbol, const std::string& order_id);
  void setLeverage(const std::string& symbol, int leverage,
                   std::optional<domain::PositionSide> hold_side);
  domain::SymbolRules getSymbolRules(const std::string& symbol);
  double getPrice(const std::string& symbol);

  // Single attempt: a probe that times out is an answer (Unknown), not
  // something to hammer the venue about.
  domain::ProbeResult probeCapability(const std::string& kind);

  void setErrorListener(ErrorListener listener);

  std::uint64_t callCount() const { return calls_.load(); }
  std::uint64_t errorCount() const { return errors_.load(); }
  std::uint64_t retryCount() const { return retries_.load(); }

  const ExecutorConfig& config() const { return config_; }

 private:
  void reportError(const std::string& operation, const std::string& what);

  IExchangeGateway& gateway_;
  const ExecutorConfig config_;
  TokenBucket bucket_;
  BackoffPolicy backoff_;

  std::mutex listener_mutex_;
  ErrorListener error_listener_;

  std::atomic<std::uint64_t> calls_{0};
  std::atomic<std::uint64_t> errors_{0};
  std::atomic<std::uint64_t> retries_{0};
};

// -----------------------------------------------------------------------------
// Template implementation: run()
// -----------------------------------------------------------------------------
template <typename Fn>
auto RateLimitedExecutor::run(const std::string& operation, CallKind kind,
                              Fn&& fn, int max_attempts) -> decltype(fn()) {
  using Result = decltype(fn());
  using Clock = std::chrono::steady_clock;

  const int attempts = max_attempts > 0 ? max_attempts : config_.max_attempts;
  std::string last_error = "no attempt made";
  bool last_timed_out = false;

  for (int attempt = 0; attempt < attempts; ++attempt) {
    bucket_.acquire();
    calls_.fetch_add(1);
    const auto started = Clock::now();

    try {
      if constexpr (std::is_void_v<Result>) {
        fn();
        const auto elapsed = Clock::now() - started;
        if (elapsed > config_.call_timeout) {
          std::cerr << "[RateLimitedExecutor] " << operation
                    << " completed after timeout; result kept\n";
        }
        return;
      } else {
        Result result = fn();
        const auto elapsed = Clock::now() - started;
        if (elapsed > config_.call_timeout) {
          if (kind == CallKind::Read) {
            throw ExchangeTimeoutError(operation,
                                       "call exceeded configured timeout");
          }
          std::cerr << "[RateLimitedExecutor] " << operation
                    << " completed after timeout; result kept\n";
        }
        return result;
      }
    } catch (const PermanentExchangeError& e) {
      reportError(operation, e.what());
      throw;
    } catch (const TransientExchangeError& e) {
      reportError(operation, e.what());
      last_error = e.what();
      last_timed_out =
          dynamic_cast<const ExchangeTimeoutError*>(&e) != nullptr;
      if (kind == CallKind::Placement &&
          dynamic_cast<const RateLimitError*>(&e) == nullptr) {
        throw UnconfirmedOrderError(operation, attempt + 1, last_error,
                                    last_timed_out);
      }
    }

    if (attempt + 1 < attempts) {
      retries_.fetch_add(1);
      const auto delay = backoff_.delayFor(attempt);
      std::cerr << "[RateLimitedExecutor] " << operation << " attempt "
                << (attempt + 1) << "/" << attempts << " failed ("
                << last_error << "); retrying in " << delay.count()
                << " ms\n";
      std::this_thread::sleep_for(delay);
    }
  }

  throw RetriesExhaustedError(operation, attempts, last_error,
                              last_timed_out);
}

}  // namespace warden
