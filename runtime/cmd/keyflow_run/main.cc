#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "keyflow/observability/defaults.h"
#include "keyflow/observability/local_logging.h"
#include "keyflow/pipeline_config.h"
#include "keyflow/runtime.h"
#include "keyflow/stage_registry.h"
#include "keyflow/v1/pipeline.pb.h"

// ============================================================
// Main
// ============================================================

int main(int argc, char** argv) {
  // ----------------------------------------------------------
  // Argument parsing
  // ----------------------------------------------------------
  //
  //   argv[1]    pipeline specification (YAML or JSON)
  //   argv[2..]  input files, one session each
  //
  if (argc < 3) {
    std::cerr << "usage: keyflow_run <pipeline.yaml|pipeline.json> <input>...\n";
    return 1;
  }

  const std::string path = argv[1];
  const std::vector<std::string> inputs(argv + 2, argv + argc);

  // ----------------------------------------------------------
  // Load pipeline specification
  // ----------------------------------------------------------
  keyflow::v1::PipelineSpec spec;
  std::string error;
  if (!keyflow::LoadPipelineSpec(path, spec, &error)) {
    std::cerr << error << "\n";
    std::cerr << "failed to load pipeline config\n";
    return 1;
  }

  // ----------------------------------------------------------
  // Logging
  // ----------------------------------------------------------
  //
  // The environment can force debug logging; the pipeline
  // config can only raise verbosity on top of it.
  //
  const auto defaults = keyflow::observability::LoadFromEnv();
  keyflow::observability::InitLocalLogging(defaults.debug || spec.log_level() == "debug");

  // ----------------------------------------------------------
  // Run
  // ----------------------------------------------------------
  keyflow::StageRegistry registry;
  keyflow::RegisterBuiltinStages(registry);

  keyflow::Runtime runtime(std::move(registry));
  return runtime.run(spec, inputs);
}
