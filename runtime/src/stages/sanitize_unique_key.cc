#include <optional>
#include <stdexcept>
#include <utility>

#include "keyflow/key_assigner.h"
#include "keyflow/observability/logging.h"
#include "keyflow/protobuf_config.h"
#include "keyflow/schema_locator.h"
#include "keyflow/stages/builtin.h"

namespace keyflow {

std::unique_ptr<IRecordStage> MakeSanitizeUniqueKey(const keyflow::v1::StageSpec& spec,
                                                    IRecordStage* next) {
  const std::string name = StageName(spec);

  keyflow::v1::SanitizeUniqueKeyConfig config;
  std::string error;
  if (!ProtobufConfigParser<keyflow::v1::SanitizeUniqueKeyConfig>::Parse(spec.params(), &config,
                                                                         &error)) {
    throw std::invalid_argument("stage '" + name + "': invalid params: " + error);
  }

  auto locator = MakeSchemaLocator(config.schema_locator());
  KF_LOG_DEBUG_FMT("stage '{}' schema locator: {}", name, locator->describe());

  KeyAssignerOptions options;
  if (!config.base_id_field().empty()) {
    options.base_id_field = config.base_id_field();
  }
  options.unique_key_field = locator->unique_key_field();
  options.prefix = ParsePrefixMode(config.has_id_prefix()
                                       ? std::optional<std::string>(config.id_prefix())
                                       : std::nullopt);

  return std::make_unique<KeyAssigner>(name, std::move(options), next);
}

}  // namespace keyflow
