#pragma once

#include "warden/domain/position.hpp"
#include "warden/notify/i_notification_sink.hpp"
#include "warden/time/i_time_provider.hpp"

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace warden {

// -----------------------------------------------------------------------------
// PositionBook: local records of every position the engine manages
// -----------------------------------------------------------------------------
//
// @brief  Stores Position records keyed by plan id and publishes a
//         PositionUpdateEvent whenever one is written.
//
// @details
// Records are keyed by plan id rather than symbol so that two live records
// for one symbol (a contradiction the reconciler must flag) can exist and
// be seen instead of silently overwriting each other.
//
// Writers always hold the symbol's SymbolLockTable lock and follow a
// copy-modify-upsert pattern: read a snapshot with openFor(), change it,
// write it back with upsert(). The book never hands out references into
// its map.
//
// Terminal records (Closed, Rejected) are kept for the session so STATUS
// can show recent history; they never count as exposure.
//
// Thread model:
//   shared_mutex: readers (health snapshots, risk context, reconciler diff)
//   share the lock; upsert() takes it exclusively. Events are published
//   after the lock is released.
// -----------------------------------------------------------------------------
class PositionBook {
 public:
  PositionBook(INotificationSink& sink, const ITimeProvider& clock);

  PositionBook(const PositionBook&) = delete;
  PositionBook& operator=(const PositionBook&) = delete;
  PositionBook(PositionBook&&) = delete;
  PositionBook& operator=(PositionBook&&) = delete;

  // Inserts or replaces the record with position.plan_id; stamps
  // updated_at_ms and publishes a PositionUpdateEvent.
  void upsert(domain::Position position);

  std::optional<domain::Position> get(const std::string& plan_id) const;

  // Oldest record for the symbol that counts as exposure.
  std::optional<domain::Position> openFor(const std::string& symbol) const;

  // All exposure records for the symbol (more than one is a conflict).
  std::vector<domain::Position> recordsFor(const std::string& symbol) const;

  std::vector<domain::Position> snapshots() const;

  // Non-terminal records, including waiting states.
  std::vector<domain::Position> live() const;

  // Records that count as exposure: pending entries and open size.
  std::vector<domain::Position> exposure() const;
  int exposureCount() const;

  // Symbols with more than one exposure record.
  std::vector<std::string> conflictingSymbols() const;

  static bool countsAsExposure(const domain::Position& position);

 private:
  INotificationSink& sink_;
  const ITimeProvider& clock_;

  mutable std::shared_mutex mutex_;
  std::map<std::string, domain::Position> positions_;
};

}  // namespace warden
