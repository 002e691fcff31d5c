#pragma once

#include <cstdint>
#include <string>

namespace warden {

// -----------------------------------------------------------------------------
// NotificationKind
// -----------------------------------------------------------------------------
// Operator-facing categories. code inside the event is the stable
// machine-parseable reason (e.g. "PLAN_ORDER_FALLBACK", "STALE_SIGNAL").
// -----------------------------------------------------------------------------
enum class NotificationKind {
  PendingConfirmation,  // Low-confidence signal awaiting a human
  NotifyOnly,           // Recorded, not executed (edits, dry-run, non-signals)
  Rejection,            // Policy rejection of an entry
  Fallback,             // Degradation (local guard, polling feed)
  Finding,              // Reconciliation / risk-daemon finding
  ProtectiveClose,      // Engine-initiated close of a position
  Escalation,           // Failure handed to the safety supervisor
};

// -----------------------------------------------------------------------------
// NotificationEvent
// -----------------------------------------------------------------------------
//
// @brief  Fire-and-forget notice for the operator channel.
//
// @details
// Emitted through INotificationSink. Delivery is best effort: the sink
// only enqueues, and a failed or slow delivery downstream never reaches
// back into the component that produced the notice.
// -----------------------------------------------------------------------------
struct NotificationEvent {
  NotificationKind kind{NotificationKind::NotifyOnly};
  std::string symbol;
  std::string code;
  std::string message;
  std::int64_t timestamp_ms{0};
};

const char* toString(NotificationKind kind);

}  // namespace warden
