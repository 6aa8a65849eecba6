#include "keyflow/observability/defaults.h"

#include <cstdlib>  // std::getenv
#include <string>

namespace keyflow::observability {

// Read boolean env var with fallback
static bool GetEnvBool(const char* key, bool def) {
  if (const char* v = std::getenv(key)) {
    std::string s(v);
    return s == "1" || s == "true" || s == "TRUE";
  }
  return def;
}

GlobalDefaults LoadFromEnv() {
  GlobalDefaults cfg;
  cfg.debug = GetEnvBool("KEYFLOW_DEBUG", false);
  return cfg;
}

}  // namespace keyflow::observability
