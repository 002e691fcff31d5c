#include "warden/lifecycle/position_book.hpp"

#include "warden/events/position_update_event.hpp"

#include <mutex>

namespace warden {

PositionBook::PositionBook(INotificationSink& sink, const ITimeProvider& clock)
    : sink_(sink), clock_(clock) {}

bool PositionBook::countsAsExposure(const domain::Position& position) {
  using S = domain::PositionState;
  switch (position.state) {
    case S::PendingEntry:
    case S::PartiallyFilled:
    case S::FilledProtected:
    case S::Managing:
    case S::Closing:
      return true;
    case S::Closed:
    case S::Rejected:
    case S::PendingManual:
    case S::PendingConfirmation:
      return false;
  }
  return false;
}

void PositionBook::upsert(domain::Position position) {
  const auto now = clock_.now_ms();
  position.updated_at_ms = now;
  {
    std::unique_lock lock(mutex_);
    positions_[position.plan_id] = position;
  }

  PositionUpdateEvent update;
  update.position = std::move(position);
  update.timestamp_ms = now;
  sink_.publish(Event{std::move(update)});
}

std::optional<domain::Position> PositionBook::get(
    const std::string& plan_id) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(plan_id);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::Position> PositionBook::openFor(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  const domain::Position* oldest = nullptr;
  for (const auto& [id, pos] : positions_) {
    if (pos.symbol != symbol || !countsAsExposure(pos)) {
      continue;
    }
    if (oldest == nullptr || pos.opened_at_ms < oldest->opened_at_ms) {
      oldest = &pos;
    }
  }
  if (oldest == nullptr) {
    return std::nullopt;
  }
  return *oldest;
}

std::vector<domain::Position> PositionBook::recordsFor(
    const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Position> result;
  for (const auto& [id, pos] : positions_) {
    if (pos.symbol == symbol && countsAsExposure(pos)) {
      result.push_back(pos);
    }
  }
  return result;
}

std::vector<domain::Position> PositionBook::snapshots() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Position> result;
  result.reserve(positions_.size());
  for (const auto& [id, pos] : positions_) {
    result.push_back(pos);
  }
  return result;
}

std::vector<domain::Position> PositionBook::live() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Position> result;
  for (const auto& [id, pos] : positions_) {
    if (!domain::isTerminal(pos.state)) {
      result.push_back(pos);
    }
  }
  return result;
}

std::vector<domain::Position> PositionBook::exposure() const {
  std::shared_lock lock(mutex_);
  std::vector<domain::Position> result;
  for (const auto& [id, pos] : positions_) {
    if (countsAsExposure(pos)) {
      result.push_back(pos);
    }
  }
  return result;
}

int PositionBook::exposureCount() const {
  std::shared_lock lock(mutex_);
  int count = 0;
  for (const auto& [id, pos] : positions_) {
    if (countsAsExposure(pos)) {
      ++count;
    }
  }
  return count;
}

std::vector<std::string> PositionBook::conflictingSymbols() const {
  std::shared_lock lock(mutex_);
  std::map<std::string, int> counts;
  for (const auto& [id, pos] : positions_) {
    if (countsAsExposure(pos)) {
      ++counts[pos.symbol];
    }
  }
  std::vector<std::string> result;
  for (const auto& [symbol, count] : counts) {
    if (count > 1) {
      result.push_back(symbol);
    }
  }
  return result;
}

}  // namespace warden
