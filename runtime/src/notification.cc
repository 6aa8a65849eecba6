#include "keyflow/notification.h"

#include <algorithm>

namespace keyflow {

const char* ToString(LifecycleEvent event) noexcept {
  switch (event) {
    case LifecycleEvent::START_SESSION:
      return "START_SESSION";
    case LifecycleEvent::BEGIN_TRANSACTION:
      return "BEGIN_TRANSACTION";
    case LifecycleEvent::COMMIT_TRANSACTION:
      return "COMMIT_TRANSACTION";
    case LifecycleEvent::ROLLBACK_TRANSACTION:
      return "ROLLBACK_TRANSACTION";
    case LifecycleEvent::SHUTDOWN:
      return "SHUTDOWN";
  }
  return "UNKNOWN";
}

bool Notification::contains(LifecycleEvent event) const noexcept {
  return std::find(events_.begin(), events_.end(), event) != events_.end();
}

}  // namespace keyflow
