#include "keyflow/runtime.h"

#include <atomic>
#include <exception>
#include <fstream>
#include <stdexcept>
#include <utility>

#include "keyflow/observability/logging.h"
#include "keyflow/signal_handler.h"

namespace keyflow {

RunStats FeedFiles(Pipeline& pipeline, const std::vector<std::string>& inputs,
                   const StopToken& stop) {
  RunStats stats;

  for (const auto& path : inputs) {
    if (stop.stop_requested()) {
      break;
    }

    std::ifstream in(path);
    if (!in) {
      throw std::runtime_error("failed to open input file: " + path);
    }

    KF_LOG_DEBUG_FMT("pipeline '{}': starting session for '{}'", pipeline.name(), path);
    pipeline.notify(Notification::StartSession());
    ++stats.sessions;

    std::string line;
    while (!stop.stop_requested() && std::getline(in, line)) {
      Record record;
      record.put(kPathField, path);
      record.put(kMessageField, line);

      ++stats.records;
      if (!pipeline.process(record)) {
        ++stats.dropped;
      }
    }
  }

  pipeline.notify(Notification::Shutdown());
  return stats;
}

Runtime::Runtime(StageRegistry registry) : registry_(std::move(registry)) {}

int Runtime::run(const keyflow::v1::PipelineSpec& spec, const std::vector<std::string>& inputs) {
  std::atomic<bool> stop_flag{false};
  SignalHandler::install(stop_flag);
  StopToken stop{&stop_flag};

  try {
    Pipeline pipeline(spec, registry_);
    const RunStats stats = FeedFiles(pipeline, inputs, stop);

    KF_LOG_INFO_FMT("pipeline '{}' finished: {} session(s), {} record(s), {} dropped",
                    pipeline.name(), stats.sessions, stats.records, stats.dropped);
  } catch (const std::exception& ex) {
    KF_LOG_ERROR_FMT("pipeline '{}' failed: {}", spec.name(), ex.what());
    SignalHandler::reset();
    return 1;
  }

  SignalHandler::reset();
  return stop.stop_requested() ? 130 : 0;
}

}  // namespace keyflow
