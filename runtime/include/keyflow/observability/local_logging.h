#pragma once

namespace keyflow::observability {

// ------------------------------------------------------------
// Initialize local (stdout) logging
//
// - Uses spdlog
// - Always safe to call, replaces the default logger
//
// Params:
//   debug: enables debug-level logging
// ------------------------------------------------------------
void InitLocalLogging(bool debug);

}  // namespace keyflow::observability
