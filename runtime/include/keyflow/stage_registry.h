#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "keyflow/stage.h"
#include "keyflow/v1/pipeline.pb.h"

namespace keyflow {

// Builds a stage from its spec. `next` is the successor in the chain
// (null for the last stage) and outlives the created stage.
using StageFactoryFn =
    std::function<std::unique_ptr<IRecordStage>(const keyflow::v1::StageSpec&, IRecordStage*)>;

/**
 * Maps stage type names to factories.
 *
 * Registration happens at startup; lookups are read-only afterwards.
 */
class StageRegistry {
 public:
  StageRegistry() = default;

  StageRegistry(const StageRegistry&) = delete;
  StageRegistry& operator=(const StageRegistry&) = delete;
  StageRegistry(StageRegistry&&) = default;
  StageRegistry& operator=(StageRegistry&&) = default;

  // Replaces any factory already registered under `type`.
  void add(const std::string& type, StageFactoryFn factory);

  bool contains(const std::string& type) const;

  std::vector<std::string> types() const;

  // Throws std::invalid_argument for unknown types and
  // std::runtime_error if the factory returns null.
  std::unique_ptr<IRecordStage> create(const keyflow::v1::StageSpec& spec,
                                       IRecordStage* next) const;

 private:
  std::unordered_map<std::string, StageFactoryFn> factories_;
};

// Registers sanitize_unique_key (alias sanitizeUniqueKey) and stdout_sink.
void RegisterBuiltinStages(StageRegistry& registry);

}  // namespace keyflow
