#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace warden {

// Where the most recent price for a symbol came from. Polling is reported
// explicitly because local-guard stops are only as good as the feed.
enum class PriceSource {
  None,
  Streaming,
  Polling,
};

const char* toString(PriceSource source);

struct PriceTick {
  std::string symbol;
  double price{0.0};
  std::int64_t timestamp_ms{0};
  PriceSource source{PriceSource::None};
};

// -----------------------------------------------------------------------------
// PriceBook: latest price per symbol plus feed health
// -----------------------------------------------------------------------------
//
// @brief  Shared last-price table written by the streaming gateway and by
//         the polling worker, read by risk evaluation, break-even checks
//         and the local-guard processor.
//
// @details
// The stream is considered healthy while its last tick is younger than
// stream_stale_ms. Once it goes quiet the price worker polls getPrice()
// and records those ticks as Polling; source() then reports Polling until
// a streaming tick arrives again. Every switch is logged once.
//
// fresh() returns a price only if it is younger than max_age_ms, so a
// decision is never made on a price from a dead feed.
//
// Thread model: internally locked; safe from any thread.
// -----------------------------------------------------------------------------
class PriceBook {
 public:
  explicit PriceBook(std::int64_t stream_stale_ms = 5000);

  PriceBook(const PriceBook&) = delete;
  PriceBook& operator=(const PriceBook&) = delete;

  void update(const std::string& symbol, double price,
              std::int64_t timestamp_ms, PriceSource source);

  std::optional<PriceTick> latest(const std::string& symbol) const;

  std::optional<double> fresh(const std::string& symbol, std::int64_t now_ms,
                              std::int64_t max_age_ms) const;

  // Latest price for every symbol, regardless of age.
  std::map<std::string, double> prices() const;

  bool streamHealthy(std::int64_t now_ms) const;
  PriceSource source() const;
  std::optional<std::int64_t> lastStreamTickMs() const;
  std::int64_t streamStaleMs() const { return stream_stale_ms_; }

 private:
  const std::int64_t stream_stale_ms_;

  mutable std::mutex mutex_;
  std::map<std::string, PriceTick> ticks_;
  PriceSource source_{PriceSource::None};
  std::optional<std::int64_t> last_stream_ms_;
};

}  // namespace warden
