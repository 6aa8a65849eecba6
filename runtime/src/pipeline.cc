#include "keyflow/pipeline.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "keyflow/observability/logging.h"

namespace keyflow {

Pipeline::Pipeline(const keyflow::v1::PipelineSpec& spec, const StageRegistry& registry)
    : name_(spec.name()) {
  if (spec.stages_size() == 0) {
    throw std::invalid_argument("pipeline '" + spec.name() + "' has no stages");
  }

  // Build back to front so every stage is created with its successor.
  IRecordStage* next = nullptr;
  for (int i = spec.stages_size() - 1; i >= 0; --i) {
    const auto& s = spec.stages(i);
    auto stage = registry.create(s, next);
    next = stage.get();
    stages_.push_back(std::move(stage));
    KF_LOG_DEBUG_FMT("pipeline '{}': built stage '{}' ({})", name_, next->name(), s.type());
  }
  std::reverse(stages_.begin(), stages_.end());

  KF_LOG_INFO_FMT("pipeline '{}' ready with {} stage(s)", name_, stages_.size());
}

bool Pipeline::process(Record& record) {
  return stages_.front()->process(record);
}

void Pipeline::notify(const Notification& notification) {
  stages_.front()->notify(notification);
}

}  // namespace keyflow
