#pragma once

#include "warden/exchange/i_exchange_gateway.hpp"
#include "warden/time/i_time_provider.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace warden {

// -----------------------------------------------------------------------------
// PaperExchangeGateway: in-memory venue
// -----------------------------------------------------------------------------
//
// @brief  IExchangeGateway that keeps orders, positions and balance in
//         memory. Backs dry-run sessions and the whole test suite.
//
// @details
// Matching model (deliberately simple):
//   - MARKET entry/close orders fill in full at the current price when
//     auto_fill_market is on (default), otherwise they rest until fillOrder().
//   - LIMIT orders rest until fillOrder() or until setPrice() crosses them.
//   - TRIGGER (stop) orders rest until setPrice() crosses trigger_price,
//     then fill as market orders.
//   - Fills of non-reducing orders grow the symbol's position; reduce_only /
//     close_side orders shrink it (never past flat).
// One net position per symbol; the hold side is recorded but hedge legs
// are not modelled separately.
//
// Scripting hooks let tests inject faults (failNext), capability answers,
// orphan positions and partial fills, and inspect every call made.
//
// Thread model: every method takes the internal mutex; safe from any
// worker. now_ms() is read from the injected clock.
// -----------------------------------------------------------------------------
class PaperExchangeGateway final : public IExchangeGateway {
 public:
  enum class FailureKind {
    Transient,
    RateLimit,
    Timeout,
    Permanent,
  };

  explicit PaperExchangeGateway(const ITimeProvider& clock);

  PaperExchangeGateway(const PaperExchangeGateway&) = delete;
  PaperExchangeGateway& operator=(const PaperExchangeGateway&) = delete;

  // --- IExchangeGateway ----------------------------------------------------
  domain::AccountSnapshot getBalance() override;
  std::vector<domain::ExchangePosition> getPositions() override;
  std::vector<domain::Order> getOpenOrders() override;
  domain::Order placeOrder(const domain::OrderSpec& spec) override;
  void cancelOrder(const std::string& symbol,
                   const std::string& order_id) override;
  std::optional<domain::Order> findOrder(
      const std::string& symbol, const std::string& client_order_id) override;
  void setLeverage(const std::string& symbol, int leverage,
                   std::optional<domain::PositionSide> hold_side) override;
  domain::SymbolRules getSymbolRules(const std::string& symbol) override;
  domain::ProbeResult probeCapability(const std::string& kind) override;
  double getPrice(const std::string& symbol) override;

  // --- Scripting ------------------------------------------------------------
  void setBalance(const domain::AccountSnapshot& snapshot);
  void setSymbolRules(const domain::SymbolRules& rules);

  // Updates the price and matches resting limit and trigger orders.
  void setPrice(const std::string& symbol, double price);

  void setCapability(const std::string& kind, domain::ProbeResult result);

  // Makes probeCapability(kind) throw ExchangeTimeoutError.
  void setCapabilityTimeout(const std::string& kind, bool timeout);

  // The next `count` calls of `operation` (e.g. "place_order") fail.
  void failNext(const std::string& operation, int count, FailureKind kind);

  void setAutoFillMarket(bool enabled);

  // Fills `quantity` more of a resting order at `price` (partial fills).
  void fillOrder(const std::string& order_id, double quantity, double price);

  // Injects exchange truth that the engine did not create (orphans, drift).
  void setPosition(const domain::ExchangePosition& position);
  void removePosition(const std::string& symbol);

  // --- Inspection -----------------------------------------------------------
  std::vector<domain::Order> placedOrders() const;
  std::size_t placeCount() const;
  std::size_t placeCount(domain::OrderKind kind) const;
  std::size_t cancelCount() const;
  std::size_t callCount(const std::string& operation) const;
  std::size_t writeCallCount() const;
  std::optional<domain::Order> order(const std::string& order_id) const;
  std::optional<domain::ExchangePosition> position(
      const std::string& symbol) const;
  int leverageFor(const std::string& symbol) const;

 private:
  void countAndMaybeFail(const std::string& operation);
  void applyFill(domain::Order& order, double quantity, double price);
  void matchRestingOrders(const std::string& symbol, double price);
  static bool isReducing(const domain::OrderSpec& spec);
  static bool isTerminal(domain::OrderStatus status);

  const ITimeProvider& clock_;

  mutable std::mutex mutex_;
  domain::AccountSnapshot balance_;
  std::unordered_map<std::string, domain::SymbolRules> rules_;
  std::unordered_map<std::string, double> prices_;
  std::unordered_map<std::string, domain::ProbeResult> capabilities_;
  std::unordered_map<std::string, bool> capability_timeouts_;
  std::unordered_map<std::string, std::deque<FailureKind>> failures_;
  std::map<std::string, domain::ExchangePosition> positions_;
  std::map<std::string, domain::Order> orders_;
  std::vector<std::string> placement_log_;
  std::unordered_map<std::string, std::size_t> call_counts_;
  std::unordered_map<std::string, int> leverage_;
  std::size_t cancel_count_{0};
  std::uint64_t next_order_id_{1};
  bool auto_fill_market_{true};
};

}  // namespace warden
