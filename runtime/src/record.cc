#include "keyflow/record.h"

#include <fmt/core.h>

#include <utility>

namespace keyflow {

namespace {

struct ValueFormatter {
  std::string operator()(const std::string& v) const {
    return v;
  }
  std::string operator()(int64_t v) const {
    return std::to_string(v);
  }
  std::string operator()(double v) const {
    return fmt::format("{}", v);
  }
  std::string operator()(bool v) const {
    return v ? "true" : "false";
  }
};

const std::vector<FieldValue>& EmptyValues() {
  static const std::vector<FieldValue> empty;
  return empty;
}

}  // namespace

std::string ToString(const FieldValue& value) {
  return std::visit(ValueFormatter{}, value);
}

bool Record::has_field(const std::string& name) const {
  return fields_.find(name) != fields_.end();
}

std::optional<FieldValue> Record::first_value(const std::string& name) const {
  auto it = fields_.find(name);
  if (it == fields_.end() || it->second.empty()) {
    return std::nullopt;
  }
  return it->second.front();
}

const std::vector<FieldValue>& Record::values(const std::string& name) const {
  auto it = fields_.find(name);
  if (it == fields_.end()) {
    return EmptyValues();
  }
  return it->second;
}

void Record::put(const std::string& name, FieldValue value) {
  fields_[name].push_back(std::move(value));
}

void Record::replace_values(const std::string& name, FieldValue value) {
  auto& values = fields_[name];
  values.clear();
  values.push_back(std::move(value));
}

void Record::remove_all(const std::string& name) {
  fields_.erase(name);
}

std::vector<std::string> Record::field_names() const {
  std::vector<std::string> names;
  names.reserve(fields_.size());
  for (const auto& kv : fields_) {
    names.push_back(kv.first);
  }
  return names;
}

std::string Record::ToString() const {
  std::string out = "{";
  bool first_field = true;
  for (const auto& [name, field_values] : fields_) {
    if (!first_field) {
      out += ", ";
    }
    first_field = false;

    out += name;
    out += "=[";
    for (std::size_t i = 0; i < field_values.size(); ++i) {
      if (i > 0) {
        out += ", ";
      }
      out += keyflow::ToString(field_values[i]);
    }
    out += "]";
  }
  out += "}";
  return out;
}

}  // namespace keyflow
