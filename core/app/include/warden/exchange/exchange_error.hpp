#pragma once

#include <stdexcept>
#include <string>

namespace warden {

// -----------------------------------------------------------------------------
// Exchange error taxonomy
// -----------------------------------------------------------------------------
//
//   ExchangeError                      (std::runtime_error)
//    ├── TransientExchangeError        retried with backoff
//    │    ├── RateLimitError           venue throttled us (HTTP 429 & co.)
//    │    └── ExchangeTimeoutError     call or probe exceeded its timeout
//    ├── PermanentExchangeError        not retried (bad params, 4xx, 404)
//    └── RetriesExhaustedError         transient failures used up the budget
//         └── UnconfirmedOrderError    placement failed ambiguously; the
//                                      order may exist on the venue
//
// Gateways throw the first four. RateLimitedExecutor is the only place that
// throws RetriesExhaustedError, so callers can tell "the venue said no" from
// "we gave up asking".
// -----------------------------------------------------------------------------
class ExchangeError : public std::runtime_error {
 public:
  ExchangeError(std::string operation, const std::string& message)
      : std::runtime_error(operation + ": " + message),
        operation_(std::move(operation)) {}

  const std::string& operation() const { return operation_; }

 private:
  std::string operation_;
};

class TransientExchangeError : public ExchangeError {
 public:
  using ExchangeError::ExchangeError;
};

class RateLimitError : public TransientExchangeError {
 public:
  using TransientExchangeError::TransientExchangeError;
};

class ExchangeTimeoutError : public TransientExchangeError {
 public:
  using TransientExchangeError::TransientExchangeError;
};

class PermanentExchangeError : public ExchangeError {
 public:
  PermanentExchangeError(std::string operation, const std::string& message,
                         int code = 0)
      : ExchangeError(std::move(operation), message), code_(code) {}

  // Venue or HTTP status code; 404 means the endpoint does not exist.
  int code() const { return code_; }

 private:
  int code_;
};

class RetriesExhaustedError : public ExchangeError {
 public:
  RetriesExhaustedError(std::string operation, int attempts,
                        const std::string& last_error, bool timed_out)
      : ExchangeError(std::move(operation),
                      "gave up after " + std::to_string(attempts) +
                          " attempt(s): " + last_error),
        attempts_(attempts),
        timed_out_(timed_out) {}

  int attempts() const { return attempts_; }

  // True when the last failure was a timeout.
  bool timedOut() const { return timed_out_; }

 private:
  int attempts_;
  bool timed_out_;
};

// A placement that failed with anything other than a rate limit. The
// request may have reached the matching engine, so it is never re-sent
// blindly: RateLimitedExecutor::placeOrder() first looks the order up by
// client_order_id.
class UnconfirmedOrderError : public RetriesExhaustedError {
 public:
  using RetriesExhaustedError::RetriesExhaustedError;
};

}  // namespace warden
