#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace keyflow {

// A single field value. Every alternative has a canonical string form.
using FieldValue = std::variant<std::string, int64_t, double, bool>;

std::string ToString(const FieldValue& value);

/**
 * Mutable record passed through a pipeline.
 *
 * Each named field holds an ordered list of values. Duplicates are
 * allowed and insertion order is preserved. A field without values
 * does not exist.
 */
class Record {
 public:
  Record() = default;

  bool has_field(const std::string& name) const;

  // First value of a field, or nullopt if the field is absent.
  std::optional<FieldValue> first_value(const std::string& name) const;

  // All values of a field; empty if the field is absent.
  const std::vector<FieldValue>& values(const std::string& name) const;

  // Appends a value to a field, creating the field if needed.
  void put(const std::string& name, FieldValue value);

  // Discards any existing values and stores a single value.
  void replace_values(const std::string& name, FieldValue value);

  void remove_all(const std::string& name);

  std::vector<std::string> field_names() const;

  // Number of fields.
  std::size_t size() const noexcept {
    return fields_.size();
  }

  bool empty() const noexcept {
    return fields_.empty();
  }

  // Deterministic rendering, fields ordered by name:
  // {message=[hello], path=[/a/b.csv]}
  std::string ToString() const;

  bool operator==(const Record& other) const = default;

 private:
  std::map<std::string, std::vector<FieldValue>> fields_;
};

}  // namespace keyflow
