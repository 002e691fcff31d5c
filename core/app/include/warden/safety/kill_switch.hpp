#pragma once

#include "warden/ledger/ledger.hpp"

#include <string>

namespace warden {

enum class KillSwitchLevel {
  None,
  Safe,
  Panic,
};

const char* toString(KillSwitchLevel level);

struct KillSwitchReading {
  KillSwitchLevel level{KillSwitchLevel::None};
  std::string source;  // "file", "env", "stored" or empty
  std::string raw;
};

// -----------------------------------------------------------------------------
// KillSwitch: operator override read from outside the process
// -----------------------------------------------------------------------------
//
// @brief  Resolves the external kill switch from three sources, first
//         non-None wins: file, environment variable, stored ledger flag.
//
// @details
// File: present means engaged. Content "panic", "panic_close" or "2" asks
// for PANIC_CLOSE; anything else (including an empty file) is SAFE_MODE.
// Env and stored flag: "1", "true", "safe", "safe_mode" → SAFE_MODE;
// "panic", "panic_close", "2" → PANIC_CLOSE; anything else is ignored.
// Matching is case-insensitive and ignores surrounding whitespace.
//
// Stateless apart from the ledger reference; read() touches the
// filesystem and the environment on every call.
// -----------------------------------------------------------------------------
class KillSwitch {
 public:
  KillSwitch(std::string file_path, std::string env_var, const Ledger& ledger);

  KillSwitchReading read() const;

  static KillSwitchLevel parseFileContent(const std::string& content);
  static KillSwitchLevel parseFlag(const std::string& value);

  const std::string& filePath() const { return file_path_; }
  const std::string& envVar() const { return env_var_; }

 private:
  const std::string file_path_;
  const std::string env_var_;
  const Ledger& ledger_;
};

}  // namespace warden
