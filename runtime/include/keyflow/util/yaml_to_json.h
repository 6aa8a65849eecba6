#pragma once

#include <yaml-cpp/yaml.h>

#include <cstdio>
#include <ostream>
#include <string>

/*
 * Minimal YAML → JSON emitter.
 *
 * Purpose:
 *   - Convert YAML syntax into JSON text
 *   - Let Protobuf JSON parser handle schema + validation
 *
 * Supported:
 *   - maps
 *   - sequences
 *   - scalars (string, escaped)
 *   - null
 *
 * NOTE:
 *   Scalars are emitted as strings. Every config field the
 *   pipeline reads is a string, a message or a Struct.
 */

namespace keyflow::util {

inline void yaml_to_json(const YAML::Node& node, std::ostream& out);

inline void json_escape(const std::string& s, std::ostream& out) {
  out << "\"";
  for (char c : s) {
    switch (c) {
      case '"':
        out << "\\\"";
        break;
      case '\\':
        out << "\\\\";
        break;
      case '\n':
        out << "\\n";
        break;
      case '\r':
        out << "\\r";
        break;
      case '\t':
        out << "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out << buf;
        } else {
          out << c;
        }
    }
  }
  out << "\"";
}

inline void yaml_map_to_json(const YAML::Node& node, std::ostream& out) {
  out << "{";
  bool first = true;
  for (const auto& it : node) {
    if (!first)
      out << ",";
    first = false;

    json_escape(it.first.as<std::string>(), out);
    out << ":";

    yaml_to_json(it.second, out);
  }
  out << "}";
}

inline void yaml_seq_to_json(const YAML::Node& node, std::ostream& out) {
  out << "[";
  for (std::size_t i = 0; i < node.size(); ++i) {
    if (i > 0)
      out << ",";
    yaml_to_json(node[i], out);
  }
  out << "]";
}

inline void yaml_to_json(const YAML::Node& node, std::ostream& out) {
  switch (node.Type()) {
    case YAML::NodeType::Map:
      yaml_map_to_json(node, out);
      break;

    case YAML::NodeType::Sequence:
      yaml_seq_to_json(node, out);
      break;

    case YAML::NodeType::Scalar:
      json_escape(node.as<std::string>(), out);
      break;

    case YAML::NodeType::Null:
    default:
      out << "null";
      break;
  }
}

}  // namespace keyflow::util
