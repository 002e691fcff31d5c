#pragma once

#include "warden/domain/capability.hpp"
#include "warden/exchange/rate_limited_executor.hpp"
#include "warden/time/i_time_provider.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden {

struct CapabilityConfig {
  bool probing_enabled{true};
  std::chrono::seconds long_ttl{300};
  std::chrono::seconds unknown_ttl{30};
  bool probe_on_startup{true};           // Probe plan orders before inflow
  bool safe_mode_on_unsupported{false};  // SAFE_MODE if that probe says no
};

// -----------------------------------------------------------------------------
// CapabilityCache: keyed, TTL-bounded tri-state capability records
// -----------------------------------------------------------------------------
//
// @brief  Answers "does the venue support X right now?" without guessing.
//
// @details
// Each kind maps to one CapabilityRecord. resolve() returns the cached
// record while it is fresh and re-probes through the executor once it has
// expired, so an expired answer is never handed out.
//
// Probe outcome mapping:
//   gateway answer                       → stored as-is, long TTL
//                                          (Unknown answers get short TTL)
//   timeout / retries exhausted          → Unknown, short TTL
//   PermanentExchangeError code 404      → Unsupported "endpoint_not_found"
//   other PermanentExchangeError         → Unsupported "probe_rejected"
//
// With probing disabled every kind resolves to Supported with reason
// "probing_disabled": the configured mode is trusted as-is.
//
// Thread model: all methods are safe from any worker. The probe itself
// runs outside the record mutex; two workers racing on the same expired
// kind may both probe, and the later answer wins.
// -----------------------------------------------------------------------------
class CapabilityCache {
 public:
  CapabilityCache(RateLimitedExecutor& executor, const ITimeProvider& clock,
                  const CapabilityConfig& config);

  CapabilityCache(const CapabilityCache&) = delete;
  CapabilityCache& operator=(const CapabilityCache&) = delete;
  CapabilityCache(CapabilityCache&&) = delete;
  CapabilityCache& operator=(CapabilityCache&&) = delete;

  // Fresh cached record, or a new probe when missing or expired.
  domain::CapabilityRecord resolve(const std::string& kind);

  // Unconditional probe; replaces the cached record.
  domain::CapabilityRecord probe(const std::string& kind);

  // Cached record without probing, fresh or not.
  std::optional<domain::CapabilityRecord> cached(const std::string& kind) const;

  // Re-probes every known kind whose record has expired. Returns how many
  // were probed. Driven by the capability refresh worker.
  std::size_t refreshExpired();

  std::vector<domain::CapabilityRecord> snapshot() const;

  const CapabilityConfig& config() const { return config_; }

 private:
  domain::ProbeResult runProbe(const std::string& kind);
  domain::CapabilityRecord store(const std::string& kind,
                                 const domain::ProbeResult& result);

  RateLimitedExecutor& executor_;
  const ITimeProvider& clock_;
  const CapabilityConfig config_;

  mutable std::mutex mutex_;
  std::map<std::string, domain::CapabilityRecord> records_;
};

}  // namespace warden
