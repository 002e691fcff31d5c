#include "warden/engine/warden_engine.hpp"

#include "warden/exchange/exchange_error.hpp"
#include "warden/gateway/signal_codec.hpp"

#include <algorithm>
#include <chrono>
#include <cctype>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace warden {

namespace {

constexpr const char* kOperatorReason = "OPERATOR";

std::string symbolOf(const domain::SignalIntent& intent) {
  if (const auto* entry = std::get_if<domain::EntrySignal>(&intent)) {
    return entry->symbol;
  }
  if (const auto* manage = std::get_if<domain::ManageAction>(&intent)) {
    return manage->symbol;
  }
  return "";
}

nlohmann::json toJson(const ReconciliationReport& report) {
  nlohmann::json findings = nlohmann::json::array();
  for (const auto& f : report.findings) {
    findings.push_back({{"kind", toString(f.kind)},
                        {"symbol", f.symbol},
                        {"detail", f.detail},
                        {"repaired", f.repaired}});
  }
  return {{"symbols_checked", report.symbols_checked},
          {"repairs", report.repairs},
          {"aborted", report.aborted},
          {"clean", report.clean()},
          {"findings", std::move(findings)}};
}

nlohmann::json errorResponse(const std::string& message) {
  return {{"status", "error"}, {"response", message}};
}

}  // namespace

// -----------------------------------------------------------------------------
// toJson(HealthSnapshot)
// -----------------------------------------------------------------------------
nlohmann::json toJson(const HealthSnapshot& health) {
  nlohmann::json j;
  j["ready"] = health.ready;
  j["safety"] = {{"mode", domain::toString(health.safety.mode)},
                 {"reasons", health.safety.reasons},
                 {"version", health.safety.version},
                 {"entered_at_ms", health.safety.entered_at_ms}};
  j["price_source"] = toString(health.price_source);
  j["stop_loss_fallback"] = health.stop_loss_fallback;

  nlohmann::json positions = nlohmann::json::array();
  for (const auto& p : health.positions) {
    positions.push_back({{"symbol", p.symbol},
                         {"side", domain::toString(p.side)},
                         {"state", domain::toString(p.state)},
                         {"size", p.size},
                         {"average_entry", p.average_entry},
                         {"stop_mode", domain::toString(p.stop_mode)},
                         {"stop_price", p.stop_price},
                         {"protected", domain::hasProtection(p)}});
  }
  j["positions"] = std::move(positions);

  nlohmann::json capabilities = nlohmann::json::array();
  for (const auto& c : health.capabilities) {
    capabilities.push_back({{"kind", c.kind},
                            {"value", domain::toString(c.value)},
                            {"reason", c.reason},
                            {"probed_at_ms", c.probed_at_ms},
                            {"expires_at_ms", c.expires_at_ms}});
  }
  j["capabilities"] = std::move(capabilities);

  nlohmann::json checks = nlohmann::json::array();
  for (const auto& c : health.checks) {
    checks.push_back({{"name", c.name}, {"ok", c.ok}, {"detail", c.detail}});
  }
  j["checks"] = std::move(checks);

  const auto& m = health.metrics;
  nlohmann::json metrics;
  metrics["equity"] = m.equity ? nlohmann::json(*m.equity) : nlohmann::json();
  metrics["peak_equity"] =
      m.peak_equity ? nlohmann::json(*m.peak_equity) : nlohmann::json();
  metrics["open_positions"] = m.open_positions;
  metrics["missing_stop_loss"] = m.missing_stop_loss;
  metrics["api_errors_in_window"] = m.api_errors_in_window;
  metrics["exchange_calls"] = m.exchange_calls;
  metrics["exchange_errors"] = m.exchange_errors;
  metrics["signals_received"] = m.signals_received;
  metrics["reconcile_passes"] = m.reconcile_passes;
  j["metrics"] = std::move(metrics);
  return j;
}

// -----------------------------------------------------------------------------
// Constructor: build components in dependency order and wire safety
// -----------------------------------------------------------------------------
WardenEngine::WardenEngine(AppConfig config, IExchangeGateway& gateway,
                           const ITimeProvider& clock)
    : config_(std::move(config)), gateway_(gateway), clock_(clock) {
  const auto& policy = config_.policy;

  sink_ = std::make_unique<QueueNotificationSink>(notify_loop_);
  ledger_ = std::make_unique<Ledger>(config_.ledger_path, clock_);
  executor_ = std::make_unique<RateLimitedExecutor>(gateway_, config_.executor);
  capabilities_ = std::make_unique<CapabilityCache>(*executor_, clock_,
                                                    config_.capability);
  symbols_ = std::make_unique<SymbolRegistry>(
      *executor_, clock_, config_.market.symbol_rules_ttl_ms);
  prices_ = std::make_unique<PriceBook>(config_.market.stream_stale_ms);
  cooldowns_ = std::make_unique<CooldownTracker>(
      static_cast<std::int64_t>(policy.cooldown_seconds * 1000.0),
      policy.stoploss_streak_limit,
      static_cast<std::int64_t>(policy.stoploss_cooldown_seconds * 1000.0));
  risk_ = std::make_unique<RiskEngine>(policy, *cooldowns_, ids_, clock_);
  tracker_ = std::make_unique<OrderTracker>(*sink_, clock_);
  book_ = std::make_unique<PositionBook>(*sink_, clock_);
  stops_ = std::make_unique<StopLossManager>(*executor_, *capabilities_,
                                             *tracker_, *ledger_, *sink_, ids_,
                                             clock_, config_.execution);
  lifecycle_ = std::make_unique<OrderLifecycleManager>(
      *executor_, *book_, *tracker_, *stops_, locks_, *symbols_, *prices_,
      *cooldowns_, *ledger_, *sink_, clock_, config_.execution);
  kill_switch_ = std::make_unique<KillSwitch>(config_.safety.kill_switch_file,
                                              config_.safety.kill_switch_env,
                                              *ledger_);
  supervisor_ = std::make_unique<SafetySupervisor>(
      config_.safety, *kill_switch_, *ledger_, *sink_, clock_);
  reconciler_ = std::make_unique<ReconciliationEngine>(
      *executor_, *book_, *lifecycle_, *stops_, locks_, *ledger_, *sink_,
      clock_, config_.reconciliation, supervisor_->panicFlag());

  // --- Safety wiring --------------------------------------------------------
  executor_->setErrorListener(
      [this](const std::string& operation, const std::string& what) {
        supervisor_->recordApiError(operation, what);
      });
  lifecycle_->setEscalationHandler([this](const std::string& code,
                                          const std::string& symbol,
                                          const std::string& detail) {
    supervisor_->reportEscalation(code, symbol, detail);
  });
  supervisor_->setPanicSweep([this] {
    const PanicCloseReport report = lifecycle_->panicCloseAll();
    return PanicSweepResult{report.attempted, report.unresolved};
  });
  supervisor_->setProtectiveClose(
      [this](const std::string& symbol, const std::string& reason) {
        auto result = lifecycle_->closePosition(symbol, reason);
        if (!result.ok) {
          std::cerr << "[WardenEngine] protective close " << symbol << " ("
                    << reason << ") failed: " << result.code << "\n";
        }
      });

  std::cout << "[WardenEngine] constructed. ledger="
            << (ledger_->persistent() ? ledger_->path() : "<memory>")
            << " entries=" << ledger_->size()
            << " safety=" << domain::toString(supervisor_->snapshot().mode)
            << (config_.execution.dry_run ? " DRY_RUN" : "") << "\n";
}

WardenEngine::~WardenEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void WardenEngine::start() {
  if (running_.load()) {
    return;
  }

  // ---  1) Notify loop first: everything below may emit notices -----------
  notify_loop_.start();
  notify_subscriptions_.push_back(
      notify_loop_.eventBus().subscribe<NotificationEvent>(
          [](const NotificationEvent& e) {
            auto& out = e.kind == NotificationKind::Escalation ||
                                e.kind == NotificationKind::ProtectiveClose
                            ? std::cerr
                            : std::cout;
            out << "[Notify] " << toString(e.kind) << " "
                << (e.symbol.empty() ? "-" : e.symbol) << " " << e.code
                << ": " << e.message << "\n";
          }));

  // ---  2) Kill switch, account and startup reconciliation -----------------
  supervisor_->applyKillSwitch();
  if (config_.capability.probe_on_startup) {
    runStartupProbe();
  }
  try {
    runAccountPoll();
  } catch (const std::exception& e) {
    std::cerr << "[WardenEngine] startup account poll failed: " << e.what()
              << "\n";
  }
  try {
    auto report = runReconcile();
    std::cout << "[WardenEngine] startup reconciliation: "
              << report.symbols_checked << " symbol(s), "
              << report.findings.size() << " finding(s)\n";
  } catch (const std::exception& e) {
    std::cerr << "[WardenEngine] startup reconciliation failed: " << e.what()
              << "\n";
  }

  // ---  3) Signal loop ----------------------------------------------------
  signal_loop_.start();
  signal_subscriptions_.push_back(signal_loop_.eventBus().subscribe<SignalEvent>(
      [this](const SignalEvent& e) {
        try {
          submitSignal(e.envelope);
        } catch (const std::exception& ex) {
          std::cerr << "[WardenEngine] signal " << e.envelope.signal_id
                    << " failed: " << ex.what() << "\n";
        }
      }));

  // ---  4) IpcServer and workers --------------------------------------------
  if (config_.network.ipc) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.network.cmd_endpoint, config_.network.pub_endpoint);
    ipc_server_->start();
    notify_subscriptions_.push_back(notify_loop_.eventBus().subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); }));
  }
  startWorkers();

  // ---  5) Inflow LAST -------------------------------------------------------
  if (config_.network.price_feed) {
    price_feed_ = std::make_unique<PriceFeedGateway>(
        *prices_, clock_, config_.network.price_endpoint);
    price_feed_->start();
  }
  if (config_.network.signal_gateway) {
    signal_gateway_ = std::make_unique<SignalGateway>(
        clock_, [this](Event event) { signal_loop_.push(std::move(event)); },
        config_.network.signal_endpoint);
    signal_gateway_->start();
  }

  running_.store(true);
  std::cout << "[WardenEngine] started. workers=" << workers_.size()
            << (ipc_server_ ? " ipc" : "") << (price_feed_ ? " price_feed" : "")
            << (signal_gateway_ ? " signal_gateway" : "") << "\n";
}

void WardenEngine::startWorkers() {
  const auto& w = config_.workers;
  auto add = [this](const std::string& name, std::chrono::milliseconds interval,
                    PeriodicWorker::Task task) {
    // Exchange failures reach the supervisor through the executor's error
    // listener; anything else thrown by a task is counted here.
    auto guarded = [this, name, task = std::move(task)] {
      try {
        task();
      } catch (const ExchangeError&) {
        throw;
      } catch (const std::exception& e) {
        supervisor_->recordApiError("worker:" + name, e.what());
        throw;
      }
    };
    workers_.push_back(std::make_unique<PeriodicWorker>(
        name, interval, std::move(guarded),
        [this, name](const std::string& what) { onWorkerError(name, what); }));
  };

  add("account", w.account_poll, [this] { runAccountPoll(); });
  add("order_sync", w.order_sync, [this] { runOrderSync(); });
  add("prices", w.price_refresh, [this] { runPriceRefresh(); });
  add("reconcile", w.reconcile, [this] { runReconcile(); });
  add("safety", w.safety, [this] { runSafetyCheck(); });
  add("capability", w.capability_refresh, [this] { runCapabilityRefresh(); });

  for (auto& worker : workers_) {
    worker->start();
  }
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void WardenEngine::stop() {
  if (!running_.load()) {
    return;
  }

  // ---  1) Stop inflow FIRST -----------------------------------------------
  signal_gateway_.reset();
  price_feed_.reset();

  // ---  2) Workers (each joins its thread) ---------------------------------
  workers_.clear();

  // ---  3) Loops: the signal loop drains, then the notify loop publishes
  //         what is left before IPC goes away -------------------------------
  signal_loop_.stop();
  for (auto id : signal_subscriptions_) {
    signal_loop_.eventBus().unsubscribe(id);
  }
  signal_subscriptions_.clear();

  notify_loop_.stop();
  for (auto id : notify_subscriptions_) {
    notify_loop_.eventBus().unsubscribe(id);
  }
  notify_subscriptions_.clear();

  ipc_server_.reset();

  running_.store(false);
  std::cout << "[WardenEngine] stopped. All threads joined.\n";
}

void WardenEngine::pushSignal(domain::SignalEnvelope envelope) {
  signal_loop_.push(SignalEvent{std::move(envelope)});
}

EventBus& WardenEngine::notificationBus() { return notify_loop_.eventBus(); }

// -----------------------------------------------------------------------------
// submitSignal(): idempotency, audit, then dispatch on the intent
// -----------------------------------------------------------------------------
SignalOutcome WardenEngine::submitSignal(
    const domain::SignalEnvelope& envelope) {
  std::lock_guard lock(signal_mutex_);
  ++signals_received_;

  if (ledger_->hasExecutionDecision(envelope.signal_id)) {
    std::cout << "[WardenEngine] duplicate signal " << envelope.signal_id
              << " ignored\n";
    return {"DUPLICATE", "DUPLICATE_SIGNAL", envelope.signal_id};
  }
  if (ledger_->hasMessage(envelope.message_id, envelope.version)) {
    std::cout << "[WardenEngine] message " << envelope.message_id << " v"
              << envelope.version << " already recorded\n";
    return {"DUPLICATE", "DUPLICATE_MESSAGE", envelope.message_id};
  }

  const std::string symbol = symbolOf(envelope.intent);
  const char* intent = domain::intentKindName(envelope.intent);

  ledger_->append(LedgerKind::MessageReceived, envelope.message_id,
                  {{"message_id", envelope.message_id},
                   {"version", envelope.version},
                   {"signal_id", envelope.signal_id},
                   {"received_at_ms", envelope.received_at_ms}});
  ledger_->append(LedgerKind::ParseResult, envelope.signal_id,
                  {{"message_id", envelope.message_id},
                   {"intent", intent},
                   {"signal", encodeSignal(envelope)}});

  if (envelope.version > 1) {
    recordDecision(envelope, symbol, "IGNORED_EDIT", "IGNORED_EDIT", false);
    sink_->notify({NotificationKind::NotifyOnly, symbol, "IGNORED_EDIT",
                   "edited message " + envelope.message_id + " (version " +
                       std::to_string(envelope.version) +
                       ") recorded and skipped for execution",
                   clock_.now_ms()});
    return {"IGNORED_EDIT", "IGNORED_EDIT", envelope.message_id};
  }

  if (const auto* non = std::get_if<domain::NonSignal>(&envelope.intent)) {
    recordDecision(envelope, symbol, "NON_SIGNAL", "NON_SIGNAL", false,
                   {{"reason", non->reason}});
    return {"NON_SIGNAL", "NON_SIGNAL", non->reason};
  }
  if (const auto* manage = std::get_if<domain::ManageAction>(&envelope.intent)) {
    return handleManage(envelope, *manage);
  }
  return handleEntry(envelope, std::get<domain::EntrySignal>(envelope.intent));
}

SignalOutcome WardenEngine::handleEntry(const domain::SignalEnvelope& envelope,
                                        const domain::EntrySignal& signal) {
  MarketContext market;
  market.current_price = currentPrice(signal.symbol);
  market.rules = symbols_->rules(signal.symbol);
  market.open_positions = book_->exposureCount();

  // No snapshot yet (cold start, failed startup poll): ask once. Sizing
  // rejects with ACCOUNT_UNAVAILABLE if that fails too.
  auto account = lastAccount();
  if (!account) {
    try {
      runAccountPoll();
    } catch (const ExchangeError& e) {
      std::cerr << "[WardenEngine] account unavailable for "
                << envelope.signal_id << ": " << e.what() << "\n";
    }
    account = lastAccount();
  }
  auto decision = risk_->evaluate(envelope, signal,
                                  account.value_or(domain::AccountSnapshot{}),
                                  supervisor_->snapshot(), market);

  if (const auto* rejection = std::get_if<domain::Rejection>(&decision)) {
    const std::string code = domain::toString(rejection->reason);
    recordDecision(envelope, signal.symbol, "REJECTED", code, false,
                   {{"detail", rejection->detail}});
    sink_->notify({NotificationKind::Rejection, signal.symbol, code,
                   rejection->detail, clock_.now_ms()});
    return {"REJECTED", code, rejection->detail};
  }

  if (const auto* pending =
          std::get_if<domain::PendingConfirmation>(&decision)) {
    std::ostringstream detail;
    detail << "confidence " << pending->confidence << " below threshold "
           << pending->threshold << "; manual confirmation required";
    recordDecision(envelope, signal.symbol, "PENDING_CONFIRMATION",
                   "PENDING_CONFIRMATION", false,
                   {{"confidence", pending->confidence},
                    {"threshold", pending->threshold}});
    sink_->notify({NotificationKind::PendingConfirmation, signal.symbol,
                   "PENDING_CONFIRMATION", detail.str(), clock_.now_ms()});
    return {"PENDING_CONFIRMATION", "PENDING_CONFIRMATION", detail.str()};
  }

  const auto& plan = std::get<domain::OrderPlan>(decision);
  // Written before the first exchange call: a redelivery of this signal_id
  // stops at the idempotency check above.
  recordDecision(envelope, signal.symbol, "ACCEPTED", "ACCEPTED", true,
                 {{"plan_id", plan.plan_id},
                  {"side", domain::toString(plan.side)},
                  {"quantity", plan.quantity},
                  {"entry_price", plan.entry_price},
                  {"stop_price", plan.stop_price},
                  {"stop_mode", domain::toString(plan.stop_mode)},
                  {"leverage", plan.leverage},
                  {"notional", plan.notional},
                  {"risk_amount", plan.risk_amount},
                  {"dry_run", config_.execution.dry_run}});

  auto result = lifecycle_->submitPlan(plan);
  return {result.ok ? "EXECUTED" : "FAILED", result.code, result.detail};
}

SignalOutcome WardenEngine::handleManage(const domain::SignalEnvelope& envelope,
                                         const domain::ManageAction& action) {
  if (auto rejection = risk_->validateManage(action)) {
    const std::string code = domain::toString(rejection->reason);
    recordDecision(envelope, action.symbol, "REJECTED", code, false,
                   {{"action", domain::toString(action.kind)},
                    {"detail", rejection->detail}});
    sink_->notify({NotificationKind::Rejection, action.symbol, code,
                   rejection->detail, clock_.now_ms()});
    return {"REJECTED", code, rejection->detail};
  }

  auto result = lifecycle_->applyManageAction(action);
  recordDecision(envelope, action.symbol, "MANAGE", result.code, result.ok,
                 {{"action", domain::toString(action.kind)},
                  {"detail", result.detail}});
  return {result.ok ? "EXECUTED" : "FAILED", result.code, result.detail};
}

void WardenEngine::recordDecision(const domain::SignalEnvelope& envelope,
                                  const std::string& symbol,
                                  const std::string& decision,
                                  const std::string& code, bool executed,
                                  nlohmann::json extra) {
  extra["message_id"] = envelope.message_id;
  extra["version"] = envelope.version;
  extra["symbol"] = symbol;
  extra["decision"] = decision;
  extra["code"] = code;
  extra["executed"] = executed;
  ledger_->append(LedgerKind::RiskDecision, envelope.signal_id,
                  std::move(extra));
}

std::optional<double> WardenEngine::currentPrice(const std::string& symbol) {
  const auto now = clock_.now_ms();
  if (auto px = prices_->fresh(symbol, now, config_.market.max_price_age_ms)) {
    return px;
  }
  try {
    const double px = executor_->getPrice(symbol);
    prices_->update(symbol, px, now, PriceSource::Polling);
    return px;
  } catch (const ExchangeError& e) {
    std::cerr << "[WardenEngine] no price for " << symbol << ": " << e.what()
              << "\n";
  }
  return std::nullopt;
}

std::optional<domain::AccountSnapshot> WardenEngine::lastAccount() const {
  std::lock_guard lock(account_mutex_);
  return last_account_;
}

// -----------------------------------------------------------------------------
// Worker tasks
// -----------------------------------------------------------------------------
void WardenEngine::runAccountPoll() {
  auto account = executor_->getBalance();
  if (account.timestamp_ms == 0) {
    account.timestamp_ms = clock_.now_ms();
  }
  std::lock_guard lock(account_mutex_);
  last_account_ = account;
  last_account_ms_ = clock_.now_ms();
}

void WardenEngine::runOrderSync() { lifecycle_->syncWithExchange(); }

void WardenEngine::runPriceRefresh() {
  const auto now = clock_.now_ms();
  std::set<std::string> symbols;
  for (const auto& pos : book_->exposure()) {
    symbols.insert(pos.symbol);
  }
  if (symbols.empty()) {
    return;
  }

  if (!prices_->streamHealthy(now)) {
    if (!polled_fallback_noted_.exchange(true)) {
      ledger_->append(LedgerKind::Fallback, "price_feed",
                      {{"code", "PRICE_FEED_POLLING"},
                       {"stream_stale_ms", prices_->streamStaleMs()}});
      sink_->notify({NotificationKind::Fallback, "", "PRICE_FEED_POLLING",
                     "price stream stale, polling the exchange", now});
    }
    for (const auto& symbol : symbols) {
      try {
        prices_->update(symbol, executor_->getPrice(symbol), now,
                        PriceSource::Polling);
      } catch (const ExchangeError& e) {
        std::cerr << "[WardenEngine] price poll " << symbol
                  << " failed: " << e.what() << "\n";
      }
    }
  } else if (polled_fallback_noted_.exchange(false)) {
    std::cout << "[WardenEngine] price stream restored\n";
  }

  std::map<std::string, double> current;
  for (const auto& symbol : symbols) {
    if (auto px = prices_->fresh(symbol, now, config_.market.max_price_age_ms)) {
      current[symbol] = *px;
    }
  }
  const int triggered = lifecycle_->processLocalGuards(current);
  if (triggered > 0) {
    std::cerr << "[WardenEngine] " << triggered
              << " local guard(s) triggered\n";
  }
}

ReconciliationReport WardenEngine::runReconcile() {
  return reconciler_->reconcileOnce();
}

void WardenEngine::runSafetyCheck() {
  std::vector<domain::ExchangePosition> positions;
  try {
    positions = executor_->getPositions();
  } catch (const ExchangeError& e) {
    std::cerr << "[WardenEngine] safety check without exchange positions: "
              << e.what() << "\n";
  }
  supervisor_->evaluate(lastAccount(), positions, book_->exposure());
}

// A sweep that left positions open is retried by the safety worker; pull
// its next iteration forward instead of waiting out the interval.
void WardenEngine::wakeSafetyIfPanicPending() {
  if (!supervisor_->panicRequested()) {
    return;
  }
  for (auto& worker : workers_) {
    if (worker->name() == "safety") {
      std::cout << "[WardenEngine] panic sweep pending; waking safety worker\n";
      worker->wake();
    }
  }
}

void WardenEngine::runCapabilityRefresh() {
  const auto refreshed = capabilities_->refreshExpired();
  if (refreshed > 0) {
    std::cout << "[WardenEngine] refreshed " << refreshed
              << " capability record(s)\n";
  }
}

void WardenEngine::runStartupProbe() {
  using domain::CapabilityValue;

  const auto record = capabilities_->probe(domain::kCapabilityPlanOrders);
  std::cout << "[WardenEngine] startup probe " << record.kind << " = "
            << domain::toString(record.value) << " (" << record.reason
            << ")\n";
  if (record.value == CapabilityValue::Supported) {
    return;
  }

  const auto mode = stops_->resolveMode("");
  if (record.value == CapabilityValue::Unsupported &&
      config_.capability.safe_mode_on_unsupported &&
      config_.execution.stop_loss_mode == domain::StopLossMode::Trigger &&
      mode == domain::StopLossMode::LocalGuard) {
    supervisor_->requestSafeMode("PLAN_ORDERS_UNSUPPORTED", "startup_probe");
  }
}

void WardenEngine::onWorkerError(const std::string& worker,
                                 const std::string& what) {
  std::cerr << "[WardenEngine] worker " << worker << " error: " << what
            << "\n";
}

// -----------------------------------------------------------------------------
// healthSnapshot()
// -----------------------------------------------------------------------------
HealthSnapshot WardenEngine::healthSnapshot() const {
  const auto now = clock_.now_ms();
  HealthSnapshot h;
  h.safety = supervisor_->snapshot();
  h.positions = book_->exposure();
  h.capabilities = capabilities_->snapshot();
  h.price_source = prices_->source();
  h.stop_loss_fallback = stops_->sessionFallback();

  // Account freshness.
  {
    std::lock_guard lock(account_mutex_);
    const auto max_age = 3 * config_.workers.account_poll.count();
    ReadinessCheck c{"account", true, ""};
    if (!last_account_) {
      c.ok = false;
      c.detail = "no account snapshot";
    } else if (now - last_account_ms_ > max_age) {
      c.ok = false;
      c.detail = "account snapshot " + std::to_string(now - last_account_ms_) +
                 "ms old";
    } else {
      h.metrics.equity = last_account_->equity;
    }
    h.checks.push_back(c);
  }

  // Safety mode.
  {
    ReadinessCheck c{"safety", domain::allowsNewEntries(h.safety),
                     domain::toString(h.safety.mode)};
    for (const auto& r : h.safety.reasons) {
      c.detail += " " + r;
    }
    h.checks.push_back(c);
  }

  // Stop-loss coverage and local guards.
  int unprotected = 0;
  bool guard_armed = false;
  for (const auto& p : h.positions) {
    if (p.size > 0.0 && !domain::hasProtection(p)) {
      ++unprotected;
    }
    guard_armed = guard_armed || p.guard.armed;
  }
  h.checks.push_back({"stop_loss", unprotected == 0,
                      std::to_string(unprotected) + " unprotected position(s)"});

  // Price feed: a local guard is only as good as the feed that drives it.
  {
    const bool streaming = prices_->streamHealthy(now);
    ReadinessCheck c{"price_feed", true,
                     streaming ? "streaming" : toString(h.price_source)};
    if (guard_armed && !streaming) {
      c.ok = !config_.market.require_streaming_for_local_guard;
      c.detail = "LOCAL_GUARD_ON_POLLED_FEED";
    }
    h.checks.push_back(c);
  }

  h.ready = std::all_of(h.checks.begin(), h.checks.end(),
                        [](const ReadinessCheck& c) { return c.ok; });

  h.metrics.peak_equity = supervisor_->peakEquity();
  h.metrics.open_positions = static_cast<int>(h.positions.size());
  h.metrics.missing_stop_loss = supervisor_->missingStopLossCount();
  h.metrics.api_errors_in_window = supervisor_->apiErrorsInWindow();
  h.metrics.exchange_calls = executor_->callCount();
  h.metrics.exchange_errors = executor_->errorCount();
  h.metrics.signals_received = signals_received_.load();
  h.metrics.reconcile_passes = reconciler_->passCount();
  return h;
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC command requests
// -----------------------------------------------------------------------------
std::string WardenEngine::executeCommand(const std::string& cmd) {
  std::istringstream in(cmd);
  std::string verb;
  std::string arg;
  in >> verb >> arg;
  std::transform(verb.begin(), verb.end(), verb.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  nlohmann::json response;
  try {
    if (verb == "PING") {
      response["status"] = "ok";
      response["response"] = "PONG";
    } else if (verb == "STATUS") {
      response = toJson(healthSnapshot());
      response["status"] = "ok";
    } else if (verb == "READY") {
      auto health = healthSnapshot();
      response = toJson(health);
      response["status"] = "ok";
      response["response"] = health.ready ? "READY" : "NOT_READY";
    } else if (verb == "SAFE") {
      const bool changed = supervisor_->requestSafeMode(kOperatorReason, "ipc");
      response["status"] = "ok";
      response["changed"] = changed;
      response["mode"] = domain::toString(supervisor_->snapshot().mode);
    } else if (verb == "PANIC") {
      const bool changed = supervisor_->requestPanic(kOperatorReason, "ipc");
      wakeSafetyIfPanicPending();
      response["status"] = "ok";
      response["changed"] = changed;
      response["mode"] = domain::toString(supervisor_->snapshot().mode);
    } else if (verb == "RESET") {
      const bool changed = supervisor_->operatorReset("ipc");
      response["status"] = "ok";
      response["changed"] = changed;
      response["mode"] = domain::toString(supervisor_->snapshot().mode);
    } else if (verb == "RECONCILE") {
      response = toJson(runReconcile());
      response["status"] = "ok";
    } else if (verb == "KILL_SWITCH") {
      std::transform(arg.begin(), arg.end(), arg.begin(),
                     [](unsigned char c) { return std::tolower(c); });
      if (arg.empty()) {
        return errorResponse("KILL_SWITCH needs a value: none, safe or panic")
            .dump();
      }
      ledger_->setStoredKillSwitch(arg == "none" || arg == "off" ? "" : arg);
      supervisor_->applyKillSwitch();
      wakeSafetyIfPanicPending();
      const auto reading = kill_switch_->read();
      response["status"] = "ok";
      response["kill_switch"] = toString(reading.level);
      response["source"] = reading.source;
      response["mode"] = domain::toString(supervisor_->snapshot().mode);
    } else {
      response = errorResponse("Unknown command: " + cmd);
    }
  } catch (const std::exception& e) {
    std::cerr << "[WardenEngine] command '" << cmd << "' failed: " << e.what()
              << "\n";
    response = errorResponse(e.what());
  }
  return response.dump();
}

}  // namespace warden
