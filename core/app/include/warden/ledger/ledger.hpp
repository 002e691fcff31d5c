#pragma once

#include "warden/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace warden {

enum class LedgerKind {
  MessageReceived,
  ParseResult,
  RiskDecision,
  OrderAttempt,
  OrderResult,
  Fill,
  Protection,
  Reconciliation,
  SafetyTransition,
  Fallback,
  KillSwitchFlag,
};

const char* toString(LedgerKind kind);
std::optional<LedgerKind> parseLedgerKind(const std::string& text);

// -----------------------------------------------------------------------------
// LedgerEntry: one immutable JSON line
// -----------------------------------------------------------------------------
// key is the lookup handle for the kind: signal_id for message and decision
// records, symbol for protection and fill records, order id for attempts.
// -----------------------------------------------------------------------------
struct LedgerEntry {
  std::uint64_t seq{0};
  std::int64_t ts_ms{0};
  LedgerKind kind{LedgerKind::MessageReceived};
  std::string key;
  nlohmann::json payload;
};

nlohmann::json toJson(const LedgerEntry& entry);
LedgerEntry ledgerEntryFromJson(const nlohmann::json& j);

// -----------------------------------------------------------------------------
// Ledger: append-only durable record of everything the engine decided
// -----------------------------------------------------------------------------
//
// @brief  Writes every signal, decision, order event, protection change and
//         safety transition as one JSON line, and answers the point lookups
//         the core needs for idempotency and repair.
//
// @details
// Storage: a JSON-lines file opened in append mode. Each append is flushed
// before returning, so a crash loses at most the line being written. Entries
// are not kept in memory: entries(), entriesOfKind() and entriesForKey()
// read the file back. An empty path (tests, dry runs without a file), or a
// file that cannot be opened, keeps only the most recent memory_history
// entries for those reads.
//
// On construction an existing file is replayed to rebuild the sequence
// counter and the lookup indexes; unparseable lines are skipped with a
// warning.
//
// Lookups are served from in-memory indexes maintained on append and never
// touch the file:
//   hasExecutionDecision(signal_id)   RISK_DECISION keyed by the signal.
//   hasMessage(message_id, version)   MESSAGE_RECEIVED with that pair.
//   messageExecuted(message_id)       a decision flagged "executed".
//   protectionFor(symbol)             last PROTECTION record, if active.
//   storedKillSwitch()                last KILL_SWITCH_FLAG value.
//
// Entries are never mutated. A protection that goes away is recorded as a
// new PROTECTION line with "active": false.
//
// Thread model: every method takes the ledger mutex; appends from all
// workers are serialized and sequence numbers are gap-free.
// -----------------------------------------------------------------------------
class Ledger {
 public:
  static constexpr std::size_t kDefaultMemoryHistory = 10'000;

  Ledger(std::string path, const ITimeProvider& clock,
         std::size_t memory_history = kDefaultMemoryHistory);

  Ledger(const Ledger&) = delete;
  Ledger& operator=(const Ledger&) = delete;
  Ledger(Ledger&&) = delete;
  Ledger& operator=(Ledger&&) = delete;

  LedgerEntry append(LedgerKind kind, const std::string& key,
                     nlohmann::json payload);

  bool hasExecutionDecision(const std::string& signal_id) const;
  bool hasMessage(const std::string& message_id, int version) const;
  bool messageExecuted(const std::string& message_id) const;

  // Payload of the last PROTECTION record for the symbol when it is active.
  std::optional<nlohmann::json> protectionFor(const std::string& symbol) const;

  std::optional<std::string> storedKillSwitch() const;
  void setStoredKillSwitch(const std::string& value);

  // History reads, oldest first. Served from the file when persistent.
  std::vector<LedgerEntry> entries() const;
  std::vector<LedgerEntry> entriesOfKind(LedgerKind kind) const;
  std::vector<LedgerEntry> entriesForKey(const std::string& key) const;

  std::uint64_t lastSequence() const;
  // Entries written over the ledger's lifetime, replayed ones included.
  std::size_t size() const;
  // Entries held in memory for history reads; zero when persistent.
  std::size_t retained() const;
  const std::string& path() const { return path_; }
  bool persistent() const { return file_.is_open(); }

 private:
  using Match = std::function<bool(const LedgerEntry&)>;

  void load();
  void index(const LedgerEntry& entry);
  std::vector<LedgerEntry> select(const Match& match) const;

  // Streams the file, handing every parseable entry to visit. Returns the
  // number of entries visited. When replaying, a missing file is an empty
  // ledger and skipped lines are reported; otherwise a missing file throws
  // std::runtime_error.
  std::size_t readFile(const std::function<void(LedgerEntry)>& visit,
                       bool replaying) const;

  const std::string path_;
  const ITimeProvider& clock_;
  const std::size_t memory_history_;

  mutable std::mutex mutex_;
  std::ofstream file_;
  std::uint64_t sequence_{0};
  std::size_t count_{0};
  std::deque<LedgerEntry> recent_;  // Only when not persistent

  std::set<std::string> decided_signals_;
  std::set<std::pair<std::string, int>> messages_;
  std::set<std::string> executed_messages_;
  std::map<std::string, nlohmann::json> protection_;
  std::optional<std::string> kill_switch_flag_;
};

}  // namespace warden
