#include "warden/ledger/ledger.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace warden {

namespace {

struct KindName {
  LedgerKind kind;
  const char* name;
};

constexpr KindName kKindNames[] = {
    {LedgerKind::MessageReceived, "MESSAGE_RECEIVED"},
    {LedgerKind::ParseResult, "PARSE_RESULT"},
    {LedgerKind::RiskDecision, "RISK_DECISION"},
    {LedgerKind::OrderAttempt, "ORDER_ATTEMPT"},
    {LedgerKind::OrderResult, "ORDER_RESULT"},
    {LedgerKind::Fill, "FILL"},
    {LedgerKind::Protection, "PROTECTION"},
    {LedgerKind::Reconciliation, "RECONCILIATION"},
    {LedgerKind::SafetyTransition, "SAFETY_TRANSITION"},
    {LedgerKind::Fallback, "FALLBACK"},
    {LedgerKind::KillSwitchFlag, "KILL_SWITCH_FLAG"},
};

const char* kKillSwitchKey = "kill_switch";

}  // namespace

const char* toString(LedgerKind kind) {
  for (const auto& entry : kKindNames) {
    if (entry.kind == kind) {
      return entry.name;
    }
  }
  return "UNKNOWN";
}

std::optional<LedgerKind> parseLedgerKind(const std::string& text) {
  for (const auto& entry : kKindNames) {
    if (text == entry.name) {
      return entry.kind;
    }
  }
  return std::nullopt;
}

nlohmann::json toJson(const LedgerEntry& entry) {
  return nlohmann::json{{"seq", entry.seq},
                        {"ts_ms", entry.ts_ms},
                        {"kind", toString(entry.kind)},
                        {"key", entry.key},
                        {"payload", entry.payload}};
}

LedgerEntry ledgerEntryFromJson(const nlohmann::json& j) {
  LedgerEntry entry;
  entry.seq = j.at("seq").get<std::uint64_t>();
  entry.ts_ms = j.at("ts_ms").get<std::int64_t>();
  auto kind = parseLedgerKind(j.at("kind").get<std::string>());
  if (!kind) {
    throw std::invalid_argument("unknown ledger kind " +
                                j.at("kind").get<std::string>());
  }
  entry.kind = *kind;
  entry.key = j.at("key").get<std::string>();
  entry.payload = j.value("payload", nlohmann::json::object());
  return entry;
}

Ledger::Ledger(std::string path, const ITimeProvider& clock,
               std::size_t memory_history)
    : path_(std::move(path)), clock_(clock), memory_history_(memory_history) {
  if (path_.empty()) {
    return;
  }
  load();
  file_.open(path_, std::ios::app);
  if (!file_.is_open()) {
    std::cerr << "[Ledger] WARNING: cannot open " << path_
              << " for append; keeping the last " << memory_history_
              << " entries in memory only\n";
  }
}

LedgerEntry Ledger::append(LedgerKind kind, const std::string& key,
                           nlohmann::json payload) {
  std::lock_guard lock(mutex_);

  LedgerEntry entry;
  entry.seq = ++sequence_;
  entry.ts_ms = clock_.now_ms();
  entry.kind = kind;
  entry.key = key;
  entry.payload = std::move(payload);

  if (file_.is_open()) {
    file_ << toJson(entry).dump() << "\n";
    file_.flush();
    if (!file_) {
      std::cerr << "[Ledger] ERROR: write failed for seq=" << entry.seq
                << "\n";
    }
  }

  index(entry);
  ++count_;
  if (!file_.is_open() && memory_history_ > 0) {
    recent_.push_back(entry);
    while (recent_.size() > memory_history_) {
      recent_.pop_front();
    }
  }
  return entry;
}

bool Ledger::hasExecutionDecision(const std::string& signal_id) const {
  std::lock_guard lock(mutex_);
  return decided_signals_.count(signal_id) > 0;
}

bool Ledger::hasMessage(const std::string& message_id, int version) const {
  std::lock_guard lock(mutex_);
  return messages_.count({message_id, version}) > 0;
}

bool Ledger::messageExecuted(const std::string& message_id) const {
  std::lock_guard lock(mutex_);
  return executed_messages_.count(message_id) > 0;
}

std::optional<nlohmann::json> Ledger::protectionFor(
    const std::string& symbol) const {
  std::lock_guard lock(mutex_);
  auto it = protection_.find(symbol);
  if (it == protection_.end() || !it->second.value("active", false)) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> Ledger::storedKillSwitch() const {
  std::lock_guard lock(mutex_);
  return kill_switch_flag_;
}

void Ledger::setStoredKillSwitch(const std::string& value) {
  append(LedgerKind::KillSwitchFlag, kKillSwitchKey, {{"value", value}});
}

std::vector<LedgerEntry> Ledger::entries() const {
  return select([](const LedgerEntry&) { return true; });
}

std::vector<LedgerEntry> Ledger::entriesOfKind(LedgerKind kind) const {
  return select([kind](const LedgerEntry& entry) { return entry.kind == kind; });
}

std::vector<LedgerEntry> Ledger::entriesForKey(const std::string& key) const {
  return select([&key](const LedgerEntry& entry) { return entry.key == key; });
}

std::vector<LedgerEntry> Ledger::select(const Match& match) const {
  std::lock_guard lock(mutex_);
  std::vector<LedgerEntry> result;
  if (!file_.is_open()) {
    for (const auto& entry : recent_) {
      if (match(entry)) {
        result.push_back(entry);
      }
    }
    return result;
  }
  readFile(
      [&](LedgerEntry entry) {
        if (match(entry)) {
          result.push_back(std::move(entry));
        }
      },
      /*replaying=*/false);
  return result;
}

std::uint64_t Ledger::lastSequence() const {
  std::lock_guard lock(mutex_);
  return sequence_;
}

std::size_t Ledger::size() const {
  std::lock_guard lock(mutex_);
  return count_;
}

std::size_t Ledger::retained() const {
  std::lock_guard lock(mutex_);
  return recent_.size();
}

std::size_t Ledger::readFile(const std::function<void(LedgerEntry)>& visit,
                             bool replaying) const {
  std::ifstream in(path_);
  if (!in.is_open()) {
    if (replaying) {
      return 0;
    }
    throw std::runtime_error("ledger file " + path_ + " is not readable");
  }

  std::string line;
  std::size_t line_no = 0;
  std::size_t visited = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    try {
      visit(ledgerEntryFromJson(nlohmann::json::parse(line)));
      ++visited;
    } catch (const nlohmann::json::exception& e) {
      if (replaying) {
        std::cerr << "[Ledger] WARNING: skipping line " << line_no << ": "
                  << e.what() << "\n";
      }
    } catch (const std::invalid_argument& e) {
      if (replaying) {
        std::cerr << "[Ledger] WARNING: skipping line " << line_no << ": "
                  << e.what() << "\n";
      }
    }
  }
  return visited;
}

void Ledger::load() {
  count_ = readFile(
      [this](LedgerEntry entry) {
        sequence_ = std::max(sequence_, entry.seq);
        index(entry);
      },
      /*replaying=*/true);
  if (count_ > 0) {
    std::cout << "[Ledger] Replayed " << count_ << " entries from " << path_
              << "\n";
  }
}

void Ledger::index(const LedgerEntry& entry) {
  switch (entry.kind) {
    case LedgerKind::MessageReceived:
      if (entry.payload.contains("message_id")) {
        messages_.emplace(entry.payload.value("message_id", ""),
                          entry.payload.value("version", 1));
      }
      break;
    case LedgerKind::RiskDecision:
      decided_signals_.insert(entry.key);
      if (entry.payload.value("executed", false) &&
          entry.payload.contains("message_id")) {
        executed_messages_.insert(entry.payload.value("message_id", ""));
      }
      break;
    case LedgerKind::Protection:
      protection_[entry.key] = entry.payload;
      break;
    case LedgerKind::KillSwitchFlag:
      kill_switch_flag_ = entry.payload.value("value", "");
      break;
    default:
      break;
  }
}

}  // namespace warden
