#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "keyflow/v1/pipeline.pb.h"

namespace keyflow {

/**
 * Resolves the name of the record field that holds the unique key.
 *
 * Resolution happens once while a pipeline is built. A schema
 * without a unique key resolves to nullopt.
 */
class SchemaLocator {
 public:
  virtual ~SchemaLocator() = default;

  virtual std::optional<std::string> unique_key_field() const = 0;

  // Human readable origin, for logs.
  virtual std::string describe() const = 0;
};

class StaticSchemaLocator final : public SchemaLocator {
 public:
  explicit StaticSchemaLocator(std::optional<std::string> unique_key_field)
      : unique_key_field_(std::move(unique_key_field)) {}

  std::optional<std::string> unique_key_field() const override {
    return unique_key_field_;
  }

  std::string describe() const override;

 private:
  std::optional<std::string> unique_key_field_;
};

/**
 * Reads a YAML schema document:
 *
 *   name: logs
 *   unique_key: id
 *   fields:
 *     - { name: id, type: string }
 *     - { name: path, type: string }
 *
 * The file is parsed eagerly; errors throw std::runtime_error.
 * When `fields` is declared the unique key must be one of them.
 */
class YamlSchemaLocator final : public SchemaLocator {
 public:
  explicit YamlSchemaLocator(std::string path);

  std::optional<std::string> unique_key_field() const override {
    return unique_key_field_;
  }

  std::string describe() const override;

  const std::string& schema_name() const noexcept {
    return schema_name_;
  }

  const std::vector<std::string>& fields() const noexcept {
    return fields_;
  }

 private:
  std::string path_;
  std::string schema_name_;
  std::optional<std::string> unique_key_field_;
  std::vector<std::string> fields_;
};

// Inline unique_key_field wins over schema_file. Throws
// std::invalid_argument if neither is set.
std::unique_ptr<SchemaLocator> MakeSchemaLocator(const keyflow::v1::SchemaLocatorConfig& config);

}  // namespace keyflow
