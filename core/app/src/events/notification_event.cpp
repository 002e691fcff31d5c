#include "warden/events/notification_event.hpp"

namespace warden {

const char* toString(NotificationKind kind) {
  switch (kind) {
    case NotificationKind::PendingConfirmation: return "pending_confirmation";
    case NotificationKind::NotifyOnly:          return "notify_only";
    case NotificationKind::Rejection:           return "rejection";
    case NotificationKind::Fallback:            return "fallback";
    case NotificationKind::Finding:             return "finding";
    case NotificationKind::ProtectiveClose:     return "protective_close";
    case NotificationKind::Escalation:          return "escalation";
  }
  return "unknown";
}

}  // namespace warden
