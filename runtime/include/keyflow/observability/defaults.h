#pragma once

namespace keyflow::observability {

// ------------------------------------------------------------
// GlobalDefaults
// ------------------------------------------------------------
// Deployment-level logging policy loaded from env vars.
// Pipeline configs can raise verbosity, never lower it.
//
struct GlobalDefaults {
  bool debug = false;  // KEYFLOW_DEBUG
};

// Load GlobalDefaults from environment variables.
// This function is the *only* place env vars are read.
GlobalDefaults LoadFromEnv();

}  // namespace keyflow::observability
