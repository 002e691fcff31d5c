#include "warden/safety/kill_switch.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace warden {

namespace {

std::string normalize(const std::string& text) {
  auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) {
               return std::isspace(c);
             }).base();
  std::string out = begin < end ? std::string(begin, end) : std::string();
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return out;
}

bool isPanicWord(const std::string& value) {
  return value == "panic" || value == "panic_close" || value == "2";
}

}  // namespace

const char* toString(KillSwitchLevel level) {
  switch (level) {
    case KillSwitchLevel::None:  return "NONE";
    case KillSwitchLevel::Safe:  return "SAFE_MODE";
    case KillSwitchLevel::Panic: return "PANIC_CLOSE";
  }
  return "UNKNOWN";
}

KillSwitch::KillSwitch(std::string file_path, std::string env_var,
                       const Ledger& ledger)
    : file_path_(std::move(file_path)),
      env_var_(std::move(env_var)),
      ledger_(ledger) {}

KillSwitchLevel KillSwitch::parseFileContent(const std::string& content) {
  return isPanicWord(normalize(content)) ? KillSwitchLevel::Panic
                                         : KillSwitchLevel::Safe;
}

KillSwitchLevel KillSwitch::parseFlag(const std::string& value) {
  const std::string v = normalize(value);
  if (v == "1" || v == "true" || v == "safe" || v == "safe_mode") {
    return KillSwitchLevel::Safe;
  }
  if (isPanicWord(v)) {
    return KillSwitchLevel::Panic;
  }
  return KillSwitchLevel::None;
}

KillSwitchReading KillSwitch::read() const {
  if (!file_path_.empty()) {
    std::ifstream in(file_path_);
    if (in.is_open()) {
      std::stringstream buffer;
      buffer << in.rdbuf();
      return {parseFileContent(buffer.str()), "file", buffer.str()};
    }
  }

  if (!env_var_.empty()) {
    if (const char* value = std::getenv(env_var_.c_str())) {
      const KillSwitchLevel level = parseFlag(value);
      if (level != KillSwitchLevel::None) {
        return {level, "env", value};
      }
    }
  }

  if (auto stored = ledger_.storedKillSwitch()) {
    const KillSwitchLevel level = parseFlag(*stored);
    if (level != KillSwitchLevel::None) {
      return {level, "stored", *stored};
    }
  }
  return {};
}

}  // namespace warden
