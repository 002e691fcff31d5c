#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace warden {

// -----------------------------------------------------------------------------
// IdGenerator
// -----------------------------------------------------------------------------
//
// @brief  Thread-safe source of unique, prefixed identifiers for client
//         order ids and plan ids.
//
// @details
// Ids look like "<session>-<prefix>-<n>". The session tag keeps ids from two
// runs of the process from colliding in the ledger or on the exchange,
// which matters because client_order_id is the key the reconciler uses to
// match exchange orders back to local records.
//
// Thread-safety: next() is a single relaxed fetch_add; safe from any
// number of workers.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  explicit IdGenerator(std::string session_tag = "w")
      : session_tag_(std::move(session_tag)) {}

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::string next(const std::string& prefix) {
    std::uint64_t n = counter_.fetch_add(1, std::memory_order_relaxed);
    return session_tag_ + "-" + prefix + "-" + std::to_string(n);
  }

 private:
  const std::string session_tag_;
  std::atomic<std::uint64_t> counter_{1};
};

}  // namespace warden
