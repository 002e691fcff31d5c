#include "warden/config/app_config.hpp"

#include "warden/risk/sizing.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <vector>

namespace warden {

namespace {

using nlohmann::json;

std::string lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

// Older config files spell a few keys differently.
const char* keyOrAlias(const json& s, const char* key, const char* alias) {
  return s.contains(key) ? key : alias;
}

const json& section(const json& root, const char* name) {
  static const json kEmpty = json::object();
  if (!root.contains(name)) {
    return kEmpty;
  }
  const json& s = root.at(name);
  if (!s.is_object()) {
    throw ConfigError(std::string("section '") + name + "' is not an object");
  }
  return s;
}

// Copies s[key] into out when present. Wrong types become ConfigError.
template <typename T>
bool read(const json& s, const char* key, T& out) {
  if (!s.contains(key) || s.at(key).is_null()) {
    return false;
  }
  try {
    out = s.at(key).get<T>();
  } catch (const json::exception& e) {
    throw ConfigError(std::string("key '") + key + "': " + e.what());
  }
  return true;
}

void readMillis(const json& s, const char* key,
                std::chrono::milliseconds& out) {
  std::int64_t ms = 0;
  if (read(s, key, ms)) {
    if (ms <= 0) {
      throw ConfigError(std::string("key '") + key + "' must be positive");
    }
    out = std::chrono::milliseconds(ms);
  }
}

void readSeconds(const json& s, const char* key, std::chrono::seconds& out) {
  std::int64_t secs = 0;
  if (read(s, key, secs)) {
    out = std::chrono::seconds(secs);
  }
}

double ratioAbove1(double value) { return value > 1.0 ? value / 100.0 : value; }

void readRatio(const json& s, const char* key, double& out) {
  double value = 0.0;
  if (read(s, key, value)) {
    out = ratioAbove1(value);
  }
}

void readPercentOrRatio(const json& s, const char* key, double& out) {
  double value = 0.0;
  if (read(s, key, value)) {
    out = sizing::ratioFromPercentOrRatio(value);
  }
}

std::set<std::string> readSymbols(const json& s, const char* key) {
  std::vector<std::string> raw;
  read(s, key, raw);
  std::set<std::string> out;
  for (auto& sym : raw) {
    std::transform(sym.begin(), sym.end(), sym.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    out.insert(sym);
  }
  return out;
}

domain::StopLossMode parseStopLossMode(const std::string& text) {
  const std::string v = lower(text);
  if (v == "trigger") return domain::StopLossMode::Trigger;
  if (v == "local_guard") return domain::StopLossMode::LocalGuard;
  throw ConfigError("stop_loss_mode must be trigger or local_guard, got " +
                    text);
}

void loadPolicy(const json& root, domain::PolicyConfig& p) {
  const json& risk = section(root, "risk");
  readPercentOrRatio(risk, "account_risk_per_trade", p.account_risk_per_trade);
  read(risk, "max_notional_per_trade", p.max_notional_per_trade);

  std::string source;
  if (read(risk, "entry_price_source", source)) {
    const std::string v = lower(source);
    if (v == "mid") p.entry_price_source = domain::EntryPriceSource::Mid;
    else if (v == "low") p.entry_price_source = domain::EntryPriceSource::Low;
    else if (v == "high") p.entry_price_source = domain::EntryPriceSource::High;
    else throw ConfigError("entry_price_source must be MID, LOW or HIGH");
  }

  read(risk, "hard_stop_loss_required", p.hard_stop_loss_required);
  if (risk.contains("default_stop_loss_pct")) {
    if (risk.at("default_stop_loss_pct").is_null()) {
      p.default_stop_loss_pct.reset();
    } else {
      double pct = 0.0;
      readPercentOrRatio(risk, "default_stop_loss_pct", pct);
      p.default_stop_loss_pct = pct;
    }
  }

  read(risk, "max_leverage", p.max_leverage);
  read(risk, "default_leverage", p.default_leverage);
  std::string leverage_policy;
  if (read(risk, "leverage_policy", leverage_policy)) {
    const std::string v = lower(leverage_policy);
    if (v == "cap" || v == "clamp") p.leverage_policy = domain::LeveragePolicy::Cap;
    else if (v == "reject") p.leverage_policy = domain::LeveragePolicy::Reject;
    else throw ConfigError("leverage_policy must be CAP or REJECT");
  }

  read(risk, "min_signal_quality", p.min_signal_quality);
  read(risk, "confidence_threshold", p.confidence_threshold);
  read(risk, "require_confirmation_below_threshold",
       p.require_confirmation_below_threshold);
  readPercentOrRatio(risk,
                     keyOrAlias(risk, "max_entry_slippage_pct",
                                "entry_slippage_pct"),
                     p.max_entry_slippage_pct);
  read(risk, "max_open_positions", p.max_open_positions);
  read(risk, "cooldown_seconds", p.cooldown_seconds);
  read(risk, "stoploss_streak_limit", p.stoploss_streak_limit);
  read(risk, "stoploss_cooldown_seconds", p.stoploss_cooldown_seconds);

  const json& filters = section(root, "filters");
  std::string policy;
  if (read(filters, "symbol_policy", policy)) {
    const std::string v = lower(policy);
    if (v == "allowlist") p.symbol_policy = domain::SymbolPolicy::Allowlist;
    else if (v == "allow_all") p.symbol_policy = domain::SymbolPolicy::AllowAll;
    else throw ConfigError("symbol_policy must be ALLOWLIST or ALLOW_ALL");
  }
  const char* allowlist_key =
      keyOrAlias(filters, "symbol_allowlist", "symbol_whitelist");
  if (filters.contains(allowlist_key)) {
    p.symbol_allowlist = readSymbols(filters, allowlist_key);
  }
  if (filters.contains("symbol_blacklist")) {
    p.symbol_blacklist = readSymbols(filters, "symbol_blacklist");
  }
  read(filters, "require_exchange_symbol", p.require_exchange_symbol);
  double volume = 0.0;
  if (read(filters,
           keyOrAlias(filters, "min_24h_volume", "min_usdt_volume_24h"),
           volume)) {
    p.min_24h_volume = volume;
  }
  read(filters, "max_signal_age_seconds", p.max_signal_age_seconds);

  std::vector<std::string> sides;
  if (read(filters, keyOrAlias(filters, "allowed_sides", "allow_sides"),
           sides)) {
    p.allowed_sides.clear();
    for (const auto& s : sides) {
      auto side = domain::parsePositionSide(s);
      if (!side) {
        throw ConfigError("allowed_sides entry '" + s + "' is not a side");
      }
      p.allowed_sides.insert(*side);
    }
  }
}

void loadExecution(const json& root, AppConfig& c) {
  read(root, "dry_run", c.execution.dry_run);

  const json& s = section(root, "execution");
  std::string mode;
  if (read(s, "account_mode", mode)) {
    const std::string v = lower(mode);
    if (v == "one_way" || v == "one_way_mode") c.execution.account_mode = domain::AccountMode::OneWay;
    else if (v == "hedge" || v == "hedge_mode") c.execution.account_mode = domain::AccountMode::Hedge;
    else throw ConfigError("account_mode must be one_way or hedge");
  }
  std::string sl_mode;
  if (read(s, "stop_loss_mode", sl_mode)) {
    c.execution.stop_loss_mode = parseStopLossMode(sl_mode);
  }
  c.policy.stop_loss_mode = c.execution.stop_loss_mode;

  read(s, "dry_run", c.execution.dry_run);
  readRatio(s, "break_even_trigger_pct", c.execution.break_even_trigger_pct);
  readRatio(s, "break_even_buffer_pct", c.execution.break_even_buffer_pct);
  read(s, "max_protection_retries", c.execution.max_protection_retries);
  read(s, "place_take_profits", c.execution.place_take_profits);
  read(s, "stop_price_tolerance", c.execution.stop_price_tolerance);
  readRatio(s, "orphan_stop_loss_pct", c.execution.orphan_stop_loss_pct);
  c.reconciliation.orphan_stop_loss_pct = c.execution.orphan_stop_loss_pct;
}

void loadSafety(const json& root, SafetyConfig& c) {
  const json& s = section(root, "safety");
  readRatio(s, "max_account_drawdown_pct", c.max_account_drawdown_pct);
  readRatio(s, "max_margin_ratio", c.max_margin_ratio);
  readRatio(s, "min_liquidation_distance_pct", c.min_liquidation_distance_pct);
  read(s, "max_time_without_sl_seconds", c.max_time_without_sl_seconds);
  read(s, "emergency_close_if_sl_missing", c.emergency_close_if_sl_missing);
  read(s, "api_error_burst", c.api_error_burst);
  read(s, "api_error_window_seconds", c.api_error_window_seconds);
  read(s, "max_protection_failures", c.max_protection_failures);
  read(s, "kill_switch_file", c.kill_switch_file);
  read(s, "kill_switch_env", c.kill_switch_env);
}

void validate(const AppConfig& c) {
  const auto& p = c.policy;
  if (p.account_risk_per_trade <= 0.0 || p.account_risk_per_trade >= 1.0) {
    throw ConfigError("account_risk_per_trade must be in (0, 1)");
  }
  if (p.max_leverage < 1 || p.default_leverage < 1) {
    throw ConfigError("leverage limits must be >= 1");
  }
  if (p.max_notional_per_trade <= 0.0) {
    throw ConfigError("max_notional_per_trade must be positive");
  }
  if (p.max_open_positions < 1) {
    throw ConfigError("max_open_positions must be >= 1");
  }
  if (c.executor.rate_per_second <= 0.0 || c.executor.burst < 1.0 ||
      c.executor.max_attempts < 1) {
    throw ConfigError("executor rate, burst and max_attempts must be positive");
  }
  if (c.execution.max_protection_retries < 1) {
    throw ConfigError("max_protection_retries must be >= 1");
  }
}

bool parseBool(const std::string& name, const std::string& raw) {
  const std::string v = lower(raw);
  if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
  if (v == "0" || v == "false" || v == "no" || v == "off") return false;
  throw ConfigError(name + " must be a boolean, got '" + raw + "'");
}

}  // namespace

AppConfig configFromJson(const json& j) {
  if (!j.is_object()) {
    throw ConfigError("config root is not a JSON object");
  }

  AppConfig c;
  loadPolicy(j, c.policy);
  loadExecution(j, c);
  loadSafety(j, c.safety);

  const json& cap = section(j, "capability");
  read(cap, "probing_enabled", c.capability.probing_enabled);
  readSeconds(cap, "ttl_seconds", c.capability.long_ttl);
  readSeconds(cap, "unknown_ttl_seconds", c.capability.unknown_ttl);
  read(cap, "probe_on_startup", c.capability.probe_on_startup);
  read(cap, "safe_mode_on_unsupported", c.capability.safe_mode_on_unsupported);

  const json& ex = section(j, "executor");
  read(ex, "rate_per_second", c.executor.rate_per_second);
  read(ex, "burst", c.executor.burst);
  read(ex, "max_attempts", c.executor.max_attempts);
  readMillis(ex, "backoff_base_ms", c.executor.backoff_base);
  readMillis(ex, "backoff_cap_ms", c.executor.backoff_cap);
  read(ex, "jitter_ratio", c.executor.jitter_ratio);
  readMillis(ex, "call_timeout_ms", c.executor.call_timeout);

  const json& rec = section(j, "reconciliation");
  read(rec, "adopt_orphans", c.reconciliation.adopt_orphans);

  const json& market = section(j, "market");
  read(market, "stream_stale_ms", c.market.stream_stale_ms);
  read(market, "max_price_age_ms", c.market.max_price_age_ms);
  read(market, "symbol_rules_ttl_ms", c.market.symbol_rules_ttl_ms);
  read(market, "require_streaming_for_local_guard",
       c.market.require_streaming_for_local_guard);

  const json& w = section(j, "workers");
  readMillis(w, "account_poll_ms", c.workers.account_poll);
  readMillis(w, "order_sync_ms", c.workers.order_sync);
  readMillis(w, "price_refresh_ms", c.workers.price_refresh);
  readMillis(w, "reconcile_ms", c.workers.reconcile);
  readMillis(w, "safety_ms", c.workers.safety);
  readMillis(w, "capability_refresh_ms", c.workers.capability_refresh);

  const json& net = section(j, "network");
  read(net, "signal_gateway", c.network.signal_gateway);
  read(net, "price_feed", c.network.price_feed);
  read(net, "ipc", c.network.ipc);
  read(net, "signal_endpoint", c.network.signal_endpoint);
  read(net, "price_endpoint", c.network.price_endpoint);
  read(net, "cmd_endpoint", c.network.cmd_endpoint);
  read(net, "pub_endpoint", c.network.pub_endpoint);

  const json& ledger = section(j, "ledger");
  read(ledger, "path", c.ledger_path);

  validate(c);
  return c;
}

AppConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigError("cannot open config file " + path);
  }

  json j;
  try {
    j = json::parse(in);
  } catch (const json::parse_error& e) {
    throw ConfigError("config " + path + ": " + e.what());
  }

  AppConfig config = configFromJson(j);
  applyEnvOverrides(config);
  std::cout << "[AppConfig] loaded " << path
            << (config.execution.dry_run ? " (dry run)" : "") << "\n";
  return config;
}

void applyEnvOverrides(AppConfig& config) {
  if (const char* v = std::getenv("WARDEN_DRY_RUN")) {
    config.execution.dry_run = parseBool("WARDEN_DRY_RUN", v);
  }
  if (const char* v = std::getenv("WARDEN_LEDGER_PATH")) {
    config.ledger_path = v;
  }
  if (const char* v = std::getenv("WARDEN_KILL_SWITCH_FILE")) {
    config.safety.kill_switch_file = v;
  }
}

}  // namespace warden
