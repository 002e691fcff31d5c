#pragma once

#include "warden/domain/order_status.hpp"
#include "warden/domain/trade_side.hpp"

#include <optional>
#include <string>

namespace warden {
namespace domain {

// -----------------------------------------------------------------------------
// OrderKind
// -----------------------------------------------------------------------------
// Purpose of an order within a position's life. The reconciler relies on
// this to tell a protective stop apart from a take-profit when both are
// reduce-only orders on the same symbol.
// -----------------------------------------------------------------------------
enum class OrderKind {
  Entry,
  StopLoss,
  TakeProfit,
  Close,
};

enum class OrderType {
  Market,
  Limit,
  Trigger,  // Exchange-side conditional (plan) order
};

// -----------------------------------------------------------------------------
// OrderSpec
// -----------------------------------------------------------------------------
//
// @brief  Everything the gateway needs to place one order.
//
// @details
// Close semantics depend on the account mode and are never guessed by the
// gateway: one-way accounts set reduce_only, hedge accounts set close_side
// together with hold_side. StopLossManager and OrderLifecycleManager build
// both variants through makeCloseInstruction().
//
// client_order_id is generated locally and is the key the engine uses to
// match exchange orders back to its own records.
// -----------------------------------------------------------------------------
struct OrderSpec {
  std::string client_order_id;
  std::string symbol;
  OrderSide side{OrderSide::Buy};
  OrderKind kind{OrderKind::Entry};
  OrderType type{OrderType::Market};
  double quantity{0.0};
  double price{0.0};          // Limit price; 0 for market
  double trigger_price{0.0};  // Trigger orders only
  bool reduce_only{false};    // One-way close instruction
  bool close_side{false};     // Hedge close instruction (trade_side=close)
  std::optional<PositionSide> hold_side;
  int leverage{0};            // Informational; leverage is set separately
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
// Exchange view of an order: the spec it was placed with plus the live
// status and cumulative fill. Returned by getOpenOrders() and placeOrder().
// Plain value type; snapshots travel freely between threads.
// -----------------------------------------------------------------------------
struct Order {
  std::string order_id;
  OrderSpec spec;
  OrderStatus status{OrderStatus::New};
  double filled_quantity{0.0};
  double average_price{0.0};
};

const char* toString(OrderKind kind);
const char* toString(OrderType type);

}  // namespace domain
}  // namespace warden
