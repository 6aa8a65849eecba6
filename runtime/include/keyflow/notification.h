#pragma once

#include <initializer_list>
#include <vector>

namespace keyflow {

// Lifecycle markers broadcast to every stage of a pipeline.
enum class LifecycleEvent {
  START_SESSION,
  BEGIN_TRANSACTION,
  COMMIT_TRANSACTION,
  ROLLBACK_TRANSACTION,
  SHUTDOWN,
};

const char* ToString(LifecycleEvent event) noexcept;

/**
 * Immutable lifecycle notification.
 *
 * Carries one or more lifecycle markers. Stages react to the
 * markers they understand and forward the notification unchanged.
 */
class Notification {
 public:
  Notification() = default;
  Notification(std::initializer_list<LifecycleEvent> events) : events_(events) {}

  static Notification StartSession() {
    return Notification{LifecycleEvent::START_SESSION};
  }

  static Notification Shutdown() {
    return Notification{LifecycleEvent::SHUTDOWN};
  }

  bool contains(LifecycleEvent event) const noexcept;

  const std::vector<LifecycleEvent>& events() const noexcept {
    return events_;
  }

 private:
  std::vector<LifecycleEvent> events_;
};

}  // namespace keyflow
