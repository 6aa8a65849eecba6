#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

#include "keyflow/random_source.h"
#include "keyflow/stage.h"

namespace keyflow {

// Field read when no base id field is configured.
inline constexpr const char* kDefaultBaseIdField = "id";

// id_prefix value that selects a random per-record prefix.
inline constexpr const char* kRandomPrefixSentinel = "random";

// Thrown when a key must be synthesized but the record has no base id.
class MissingBaseIdError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct NoPrefix {};

struct FixedPrefix {
  std::string prefix;
};

struct RandomPrefix {
  std::unique_ptr<RandomSource> source;
};

// Optional rewrite of an assigned key, for load testing.
using PrefixMode = std::variant<NoPrefix, FixedPrefix, RandomPrefix>;

// "random" selects RandomPrefix seeded from a secure source, any other
// value (including "") is a fixed prefix, nullopt disables prefixing.
PrefixMode ParsePrefixMode(const std::optional<std::string>& id_prefix);

struct KeyAssignerOptions {
  std::string base_id_field = kDefaultBaseIdField;

  // Resolved from the schema. nullopt disables key assignment.
  std::optional<std::string> unique_key_field;

  PrefixMode prefix = NoPrefix{};
};

/**
 * Assigns each record a unique key of the form `<base id>#<n>`.
 *
 * `n` counts records within the current session, starting at 0, and
 * is reset by a START_SESSION notification. Records that already carry
 * the unique key field keep their key. A configured prefix is applied
 * to the key of every record afterwards.
 *
 * Not thread-safe; each pipeline owns its own instance.
 */
class KeyAssigner final : public ChainedStage {
 public:
  KeyAssigner(std::string name, KeyAssignerOptions options, IRecordStage* next);

  bool process(Record& record) override;
  void notify(const Notification& notification) override;

  uint64_t session_counter() const noexcept {
    return session_counter_;
  }

  const KeyAssignerOptions& options() const noexcept {
    return options_;
  }

 private:
  void ApplyPrefix(Record& record, const std::string& field);

  KeyAssignerOptions options_;
  uint64_t session_counter_ = 0;
};

}  // namespace keyflow
