#include "warden/concurrent/symbol_lock_table.hpp"

namespace warden {

std::unique_lock<std::mutex> SymbolLockTable::lock(const std::string& symbol) {
  return std::unique_lock<std::mutex>(mutexFor(symbol));
}

std::mutex& SymbolLockTable::mutexFor(const std::string& symbol) {
  std::lock_guard lock(table_mutex_);
  auto& slot = mutexes_[symbol];
  if (!slot) {
    slot = std::make_unique<std::mutex>();
  }
  return *slot;
}

}  // namespace warden
