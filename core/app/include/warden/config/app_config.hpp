#pragma once

#include "warden/capability/capability_cache.hpp"
#include "warden/domain/policy_config.hpp"
#include "warden/exchange/rate_limited_executor.hpp"
#include "warden/lifecycle/execution_config.hpp"
#include "warden/reconcile/reconciliation_engine.hpp"
#include "warden/safety/safety_supervisor.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace warden {

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Intervals of the periodic workers.
struct WorkerConfig {
  std::chrono::milliseconds account_poll{5000};
  std::chrono::milliseconds order_sync{3000};
  std::chrono::milliseconds price_refresh{1000};
  std::chrono::milliseconds reconcile{10000};
  std::chrono::milliseconds safety{2000};
  std::chrono::milliseconds capability_refresh{10000};
};

struct NetworkConfig {
  bool signal_gateway{true};
  bool price_feed{true};
  bool ipc{true};
  std::string signal_endpoint{"tcp://127.0.0.1:5560"};
  std::string price_endpoint{"tcp://127.0.0.1:5561"};
  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};
};

struct MarketConfig {
  std::int64_t stream_stale_ms{5000};
  std::int64_t max_price_age_ms{15000};
  std::int64_t symbol_rules_ttl_ms{3'600'000};
  bool require_streaming_for_local_guard{false};
};

// -----------------------------------------------------------------------------
// AppConfig: everything WardenEngine needs, loaded from one JSON file
// -----------------------------------------------------------------------------
//
// @brief  Aggregate of every component's configuration.
//
// @details
// Sections: "risk" and "filters" (PolicyConfig), "execution", "safety",
// "capability", "executor", "reconciliation", "market", "workers",
// "network", "ledger". Missing sections and keys keep the defaults below;
// a present key with the wrong type is a ConfigError.
//
// Percent or ratio: account_risk_per_trade, max_entry_slippage_pct and
// default_stop_loss_pct accept either notation (0.5 and 0.005 both mean
// half a percent, see sizing::ratioFromPercentOrRatio). Other *_pct keys are
// ratios unless written above 1, which is read as percent.
//
// Environment overrides, applied after the file:
//   WARDEN_DRY_RUN           1/true/yes or 0/false/no
//   WARDEN_LEDGER_PATH       ledger file path ("" keeps it in memory)
//   WARDEN_KILL_SWITCH_FILE  kill switch file path
// TRADER_KILL_SWITCH is not read here; KillSwitch reads it live.
// -----------------------------------------------------------------------------
struct AppConfig {
  domain::PolicyConfig policy;
  ExecutionConfig execution;
  SafetyConfig safety;
  CapabilityConfig capability;
  ExecutorConfig executor;
  ReconciliationConfig reconciliation;
  MarketConfig market;
  WorkerConfig workers;
  NetworkConfig network;
  std::string ledger_path{"warden_ledger.jsonl"};
};

AppConfig loadConfig(const std::string& path);
AppConfig configFromJson(const nlohmann::json& j);
void applyEnvOverrides(AppConfig& config);

}  // namespace warden
