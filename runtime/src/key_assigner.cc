#include "keyflow/key_assigner.h"

#include <fmt/core.h>

#include <utility>

#include "keyflow/observability/logging.h"

namespace keyflow {

PrefixMode ParsePrefixMode(const std::optional<std::string>& id_prefix) {
  if (!id_prefix) {
    return NoPrefix{};
  }
  if (*id_prefix == kRandomPrefixSentinel) {
    return RandomPrefix{SeededRandomSource::FromSecureSeed()};
  }
  return FixedPrefix{*id_prefix};
}

KeyAssigner::KeyAssigner(std::string name, KeyAssignerOptions options, IRecordStage* next)
    : ChainedStage(std::move(name), next), options_(std::move(options)) {
  if (const auto* random = std::get_if<RandomPrefix>(&options_.prefix); random && !random->source) {
    throw std::invalid_argument("random key prefix requires a random source");
  }

  if (!options_.unique_key_field) {
    KF_LOG_WARN_FMT("stage '{}': schema defines no unique key, records pass through unchanged",
                    this->name());
  }
}

bool KeyAssigner::process(Record& record) {
  const uint64_t num = session_counter_++;

  if (options_.unique_key_field) {
    const std::string& field = *options_.unique_key_field;

    if (!record.has_field(field)) {
      auto base_id = record.first_value(options_.base_id_field);
      if (!base_id) {
        throw MissingBaseIdError(fmt::format(
            "record field '{}' must not be null as it is needed as a basis for a unique key: {}",
            options_.base_id_field, record.ToString()));
      }
      record.replace_values(field, ToString(*base_id) + "#" + std::to_string(num));
    }

    ApplyPrefix(record, field);
  }

  if (observability::IsLogEnabled(observability::LogLevel::Debug)) {
    KF_LOG_DEBUG_FMT("record #{} id sanitized to this: {}", num, record.ToString());
  }

  return ChainedStage::process(record);
}

void KeyAssigner::notify(const Notification& notification) {
  if (notification.contains(LifecycleEvent::START_SESSION)) {
    session_counter_ = 0;
  }
  ChainedStage::notify(notification);
}

void KeyAssigner::ApplyPrefix(Record& record, const std::string& field) {
  if (std::holds_alternative<NoPrefix>(options_.prefix)) {
    return;
  }

  auto current = record.first_value(field);
  if (!current) {
    return;
  }
  std::string id = ToString(*current);

  if (const auto* fixed = std::get_if<FixedPrefix>(&options_.prefix)) {
    id = fixed->prefix + id;
  } else if (auto* random = std::get_if<RandomPrefix>(&options_.prefix)) {
    id = std::to_string(random->source->next_non_negative()) + "#" + id;
  }

  record.replace_values(field, std::move(id));
}

}  // namespace keyflow
