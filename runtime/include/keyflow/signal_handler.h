#pragma once

#include <atomic>

namespace keyflow {

// Sets the flag on SIGINT / SIGTERM.
class SignalHandler {
 public:
  static void install(std::atomic<bool>& stop_flag);

  // Restores default handlers and forgets the flag.
  static void reset();
};

}  // namespace keyflow
