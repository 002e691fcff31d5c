#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace warden {

// -----------------------------------------------------------------------------
// SymbolLockTable: one mutex per symbol
// -----------------------------------------------------------------------------
//
// @brief  Provides the per-position exclusivity discipline: every in-memory
//         transition of a symbol's Position, and every exchange write made
//         on its behalf, runs while holding that symbol's lock.
//
// @details
// The OrderLifecycleManager (signal path, manage actions, local guards) and
// the ReconciliationEngine (periodic repair) take the same lock, so they
// can never place two protective orders, or a repair and a user-initiated
// close, for the same position concurrently.
//
// Locks for different symbols are independent: a slow placement on BTCUSDT
// does not block reconciliation of ETHUSDT.
//
// Mutexes are heap-allocated and never erased, so a reference obtained from
// the table stays valid for the table's lifetime even while other symbols
// are inserted.
//
// Thread model: lock() is safe from any thread. The table's own mutex is
// held only for the map lookup, never while the symbol lock is held.
// -----------------------------------------------------------------------------
class SymbolLockTable {
 public:
  SymbolLockTable() = default;

  SymbolLockTable(const SymbolLockTable&) = delete;
  SymbolLockTable& operator=(const SymbolLockTable&) = delete;
  SymbolLockTable(SymbolLockTable&&) = delete;
  SymbolLockTable& operator=(SymbolLockTable&&) = delete;

  // Blocks until the symbol's mutex is held. Release by destroying the
  // returned lock.
  std::unique_lock<std::mutex> lock(const std::string& symbol);

 private:
  std::mutex& mutexFor(const std::string& symbol);

  std::mutex table_mutex_;
  std::unordered_map<std::string, std::unique_ptr<std::mutex>> mutexes_;
};

}  // namespace warden
