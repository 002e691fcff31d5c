#include "warden/market/price_book.hpp"

#include <iostream>

namespace warden {

const char* toString(PriceSource source) {
  switch (source) {
    case PriceSource::None:      return "none";
    case PriceSource::Streaming: return "streaming";
    case PriceSource::Polling:   return "polling";
  }
  return "unknown";
}

PriceBook::PriceBook(std::int64_t stream_stale_ms)
    : stream_stale_ms_(stream_stale_ms) {}

void PriceBook::update(const std::string& symbol, double price,
                       std::int64_t timestamp_ms, PriceSource source) {
  if (price <= 0.0) {
    return;
  }
  std::lock_guard lock(mutex_);
  ticks_[symbol] = PriceTick{symbol, price, timestamp_ms, source};

  if (source == PriceSource::Streaming) {
    last_stream_ms_ = timestamp_ms;
  }
  if (source != source_) {
    if (source_ != PriceSource::None) {
      std::cerr << "[PriceBook] price source " << toString(source_) << " -> "
                << toString(source) << "\n";
    }
    source_ = source;
  }
}

std::optional<PriceTick> PriceBook::latest(const std::string& symbol) const {
  std::lock_guard lock(mutex_);
  auto it = ticks_.find(symbol);
  if (it == ticks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<double> PriceBook::fresh(const std::string& symbol,
                                       std::int64_t now_ms,
                                       std::int64_t max_age_ms) const {
  std::lock_guard lock(mutex_);
  auto it = ticks_.find(symbol);
  if (it == ticks_.end() || now_ms - it->second.timestamp_ms > max_age_ms) {
    return std::nullopt;
  }
  return it->second.price;
}

std::map<std::string, double> PriceBook::prices() const {
  std::lock_guard lock(mutex_);
  std::map<std::string, double> result;
  for (const auto& [symbol, tick] : ticks_) {
    result[symbol] = tick.price;
  }
  return result;
}

bool PriceBook::streamHealthy(std::int64_t now_ms) const {
  std::lock_guard lock(mutex_);
  return last_stream_ms_ && now_ms - *last_stream_ms_ <= stream_stale_ms_;
}

PriceSource PriceBook::source() const {
  std::lock_guard lock(mutex_);
  return source_;
}

std::optional<std::int64_t> PriceBook::lastStreamTickMs() const {
  std::lock_guard lock(mutex_);
  return last_stream_ms_;
}

}  // namespace warden
