#include "keyflow/schema_locator.h"

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <stdexcept>

namespace keyflow {

std::string StaticSchemaLocator::describe() const {
  return fmt::format("static(unique_key={})", unique_key_field_.value_or("<none>"));
}

YamlSchemaLocator::YamlSchemaLocator(std::string path) : path_(std::move(path)) {
  YAML::Node loaded;
  try {
    loaded = YAML::LoadFile(path_);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(fmt::format("cannot load schema '{}': {}", path_, e.what()));
  }

  const YAML::Node& root = loaded;
  if (!root.IsMap()) {
    throw std::runtime_error(fmt::format("schema '{}' must be a YAML map", path_));
  }

  try {
    if (const auto name = root["name"]) {
      schema_name_ = name.as<std::string>();
    }

    if (const auto fields = root["fields"]) {
      if (!fields.IsSequence()) {
        throw std::runtime_error(fmt::format("schema '{}': 'fields' must be a list", path_));
      }
      for (const auto& field : fields) {
        const auto field_name = field["name"];
        if (!field_name) {
          throw std::runtime_error(fmt::format("schema '{}': field without a name", path_));
        }
        fields_.push_back(field_name.as<std::string>());
      }
    }

    if (const auto unique_key = root["unique_key"]; unique_key && !unique_key.IsNull()) {
      unique_key_field_ = unique_key.as<std::string>();
    }
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(fmt::format("invalid schema '{}': {}", path_, e.what()));
  }

  if (unique_key_field_ && !fields_.empty() &&
      std::find(fields_.begin(), fields_.end(), *unique_key_field_) == fields_.end()) {
    throw std::runtime_error(fmt::format("schema '{}': unique key '{}' is not a declared field",
                                         path_, *unique_key_field_));
  }
}

std::string YamlSchemaLocator::describe() const {
  return fmt::format("yaml(path={}, schema={}, unique_key={})", path_, schema_name_,
                     unique_key_field_.value_or("<none>"));
}

std::unique_ptr<SchemaLocator> MakeSchemaLocator(const keyflow::v1::SchemaLocatorConfig& config) {
  if (!config.unique_key_field().empty()) {
    return std::make_unique<StaticSchemaLocator>(config.unique_key_field());
  }
  if (!config.schema_file().empty()) {
    return std::make_unique<YamlSchemaLocator>(config.schema_file());
  }
  throw std::invalid_argument("schema locator requires unique_key_field or schema_file");
}

}  // namespace keyflow
