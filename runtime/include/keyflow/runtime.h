#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "keyflow/pipeline.h"
#include "keyflow/stage_registry.h"
#include "keyflow/stop_token.h"
#include "keyflow/v1/pipeline.pb.h"

namespace keyflow {

// Fields of the records produced from input lines.
inline constexpr const char* kPathField = "path";
inline constexpr const char* kMessageField = "message";

struct RunStats {
  uint64_t sessions = 0;
  uint64_t records = 0;
  uint64_t dropped = 0;
};

// Feeds every input file through the pipeline as one session:
// START_SESSION, then one record per line ({path, message}).
// A SHUTDOWN notification follows the last file. Stops between
// records once `stop` is requested. Throws std::runtime_error if
// a file cannot be opened; stage errors propagate unchanged.
RunStats FeedFiles(Pipeline& pipeline, const std::vector<std::string>& inputs,
                   const StopToken& stop);

class Runtime {
 public:
  explicit Runtime(StageRegistry registry);

  // Builds the pipeline and feeds the inputs. Returns the process
  // exit code; errors are logged, not thrown.
  int run(const keyflow::v1::PipelineSpec& spec, const std::vector<std::string>& inputs);

 private:
  StageRegistry registry_;
};

}  // namespace keyflow
