#include "warden/capability/capability_cache.hpp"

#include "warden/exchange/exchange_error.hpp"

#include <iostream>

namespace warden {

CapabilityCache::CapabilityCache(RateLimitedExecutor& executor,
                                 const ITimeProvider& clock,
                                 const CapabilityConfig& config)
    : executor_(executor), clock_(clock), config_(config) {}

domain::CapabilityRecord CapabilityCache::resolve(const std::string& kind) {
  {
    std::lock_guard lock(mutex_);
    auto it = records_.find(kind);
    if (it != records_.end() && it->second.isFresh(clock_.now_ms())) {
      return it->second;
    }
  }
  return probe(kind);
}

domain::CapabilityRecord CapabilityCache::probe(const std::string& kind) {
  return store(kind, runProbe(kind));
}

std::optional<domain::CapabilityRecord> CapabilityCache::cached(
    const std::string& kind) const {
  std::lock_guard lock(mutex_);
  auto it = records_.find(kind);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t CapabilityCache::refreshExpired() {
  std::vector<std::string> expired;
  {
    std::lock_guard lock(mutex_);
    const auto now = clock_.now_ms();
    for (const auto& [kind, record] : records_) {
      if (!record.isFresh(now)) {
        expired.push_back(kind);
      }
    }
  }
  for (const auto& kind : expired) {
    probe(kind);
  }
  return expired.size();
}

std::vector<domain::CapabilityRecord> CapabilityCache::snapshot() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::CapabilityRecord> result;
  result.reserve(records_.size());
  for (const auto& [kind, record] : records_) {
    result.push_back(record);
  }
  return result;
}

domain::ProbeResult CapabilityCache::runProbe(const std::string& kind) {
  using domain::CapabilityValue;

  if (!config_.probing_enabled) {
    return {CapabilityValue::Supported, "probing_disabled"};
  }

  try {
    return executor_.probeCapability(kind);
  } catch (const RetriesExhaustedError& e) {
    std::cerr << "[CapabilityCache] probe " << kind << " inconclusive: "
              << e.what() << "\n";
    return {CapabilityValue::Unknown,
            e.timedOut() ? "timeout" : "probe_failed"};
  } catch (const ExchangeTimeoutError& e) {
    std::cerr << "[CapabilityCache] probe " << kind << " timed out: "
              << e.what() << "\n";
    return {CapabilityValue::Unknown, "timeout"};
  } catch (const PermanentExchangeError& e) {
    std::cerr << "[CapabilityCache] probe " << kind << " rejected: "
              << e.what() << "\n";
    if (e.code() == 404) {
      return {CapabilityValue::Unsupported, "endpoint_not_found"};
    }
    return {CapabilityValue::Unsupported, "probe_rejected"};
  }
}

domain::CapabilityRecord CapabilityCache::store(
    const std::string& kind, const domain::ProbeResult& result) {
  const auto now = clock_.now_ms();
  const auto ttl = result.value == domain::CapabilityValue::Unknown
                       ? config_.unknown_ttl
                       : config_.long_ttl;

  domain::CapabilityRecord record;
  record.kind = kind;
  record.value = result.value;
  record.reason = result.reason;
  record.probed_at_ms = now;
  record.expires_at_ms =
      now + std::chrono::duration_cast<std::chrono::milliseconds>(ttl).count();

  std::cout << "[CapabilityCache] " << kind << " = "
            << domain::toString(record.value) << " (" << record.reason
            << ")\n";

  std::lock_guard lock(mutex_);
  records_[kind] = record;
  return record;
}

}  // namespace warden
