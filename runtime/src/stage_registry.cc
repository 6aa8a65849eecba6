#include "keyflow/stage_registry.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "keyflow/stages/builtin.h"

namespace keyflow {

void StageRegistry::add(const std::string& type, StageFactoryFn factory) {
  factories_[type] = std::move(factory);
}

bool StageRegistry::contains(const std::string& type) const {
  return factories_.find(type) != factories_.end();
}

std::vector<std::string> StageRegistry::types() const {
  std::vector<std::string> out;
  out.reserve(factories_.size());
  for (const auto& kv : factories_) {
    out.push_back(kv.first);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::unique_ptr<IRecordStage> StageRegistry::create(const keyflow::v1::StageSpec& spec,
                                                    IRecordStage* next) const {
  auto it = factories_.find(spec.type());
  if (it == factories_.end()) {
    throw std::invalid_argument("unknown stage type: '" + spec.type() + "'");
  }

  auto stage = it->second(spec, next);
  if (!stage) {
    throw std::runtime_error("factory returned null stage for type '" + spec.type() + "'");
  }
  return stage;
}

std::string StageName(const keyflow::v1::StageSpec& spec) {
  return spec.name().empty() ? spec.type() : spec.name();
}

void RegisterBuiltinStages(StageRegistry& registry) {
  registry.add("sanitize_unique_key", MakeSanitizeUniqueKey);
  registry.add("sanitizeUniqueKey", MakeSanitizeUniqueKey);
  registry.add("stdout_sink", MakeStdoutSink);
}

}  // namespace keyflow
