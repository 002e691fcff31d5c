#pragma once

#include "warden/domain/account.hpp"
#include "warden/domain/capability.hpp"
#include "warden/domain/order.hpp"
#include "warden/domain/position.hpp"
#include "warden/domain/symbol_rules.hpp"

#include <optional>
#include <string>
#include <vector>

namespace warden {

// -----------------------------------------------------------------------------
// IExchangeGateway: venue boundary
// -----------------------------------------------------------------------------
//
// @brief  Authenticated calls the engine needs from an exchange. Signing,
//         transport and venue payload formats live behind this interface.
//
// @details
// Error contract (see exchange_error.hpp):
//   - network failures, 5xx         → TransientExchangeError
//   - throttling                    → RateLimitError
//   - transport timeout             → ExchangeTimeoutError
//   - rejected params, 4xx          → PermanentExchangeError
//
// Implementations apply their transport timeout to every call. The engine
// never calls a gateway directly: every call goes through
// RateLimitedExecutor, which adds rate limiting, retries and an elapsed-time
// check on top.
//
// probeCapability() distinguishes "the venue said no" (Unsupported, e.g.
// endpoint returned 404) from "we could not find out" (Unknown). A timeout
// may be reported either as an Unknown result or by throwing
// ExchangeTimeoutError; CapabilityCache maps both to Unknown.
//
// Thread model: implementations must be callable from several workers at
// once.
// -----------------------------------------------------------------------------
class IExchangeGateway {
 public:
  virtual ~IExchangeGateway() = default;

  virtual domain::AccountSnapshot getBalance() = 0;

  virtual std::vector<domain::ExchangePosition> getPositions() = 0;

  virtual std::vector<domain::Order> getOpenOrders() = 0;

  // Returns the exchange view of the new order (order_id assigned, status
  // Accepted, or Filled for an immediately filled market order).
  virtual domain::Order placeOrder(const domain::OrderSpec& spec) = 0;

  virtual void cancelOrder(const std::string& symbol,
                           const std::string& order_id) = 0;

  // Looks an order up by the client id it was placed with, open or not.
  // nullopt when the venue never accepted such an order.
  virtual std::optional<domain::Order> findOrder(
      const std::string& symbol, const std::string& client_order_id) = 0;

  virtual void setLeverage(const std::string& symbol, int leverage,
                           std::optional<domain::PositionSide> hold_side) = 0;

  virtual domain::SymbolRules getSymbolRules(const std::string& symbol) = 0;

  virtual domain::ProbeResult probeCapability(const std::string& kind) = 0;

  // Polling path of the price feed: last traded / mark price.
  virtual double getPrice(const std::string& symbol) = 0;
};

}  // namespace warden
