#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "keyflow/stage.h"
#include "keyflow/stage_registry.h"
#include "keyflow/v1/pipeline.pb.h"

namespace keyflow {

/**
 * An ordered chain of record stages built from a PipelineSpec.
 *
 * Owns:
 *  - every stage instance (and thus all per-stage state)
 *
 * Does NOT:
 *  - run concurrently; process() and notify() are called one at a time
 *  - catch stage errors; exceptions propagate to the caller
 */
class Pipeline {
 public:
  // Throws std::invalid_argument for an empty spec or unknown stage types.
  Pipeline(const keyflow::v1::PipelineSpec& spec, const StageRegistry& registry);

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  // Feeds a record to the first stage. Returns false if it was dropped.
  bool process(Record& record);

  // Broadcasts a notification down the chain.
  void notify(const Notification& notification);

  const std::string& name() const noexcept {
    return name_;
  }

  std::size_t size() const noexcept {
    return stages_.size();
  }

  IRecordStage& stage(std::size_t index) const {
    return *stages_.at(index);
  }

 private:
  std::string name_;

  // stages_[0] is the head of the chain.
  std::vector<std::unique_ptr<IRecordStage>> stages_;
};

}  // namespace keyflow
