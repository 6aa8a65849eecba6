#include "keyflow/pipeline_config.h"

#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <utility>

#include "keyflow/util/yaml_to_json.h"

namespace keyflow {

static bool SetError(std::string* error, std::string message) {
  if (error) {
    *error = std::move(message);
  }
  return false;
}

static bool ParseJson(const std::string& json, keyflow::v1::PipelineSpec& spec,
                      std::string* error) {
  google::protobuf::util::JsonParseOptions opts;
  opts.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &spec, opts);
  if (!status.ok()) {
    return SetError(error, "json → protobuf parse failed: " + status.ToString());
  }
  return true;
}

static bool ParseYamlNode(const YAML::Node& root, keyflow::v1::PipelineSpec& spec,
                          std::string* error) {
  std::stringstream json;
  keyflow::util::yaml_to_json(root, json);
  return ParseJson(json.str(), spec, error);
}

bool ParsePipelineYaml(const std::string& text, keyflow::v1::PipelineSpec& spec,
                       std::string* error) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    return SetError(error, std::string("yaml parse error: ") + e.what());
  }
  return ParseYamlNode(root, spec, error);
}

bool LoadPipelineSpec(const std::string& path, keyflow::v1::PipelineSpec& spec,
                      std::string* error) {
  if (path.ends_with(".yaml") || path.ends_with(".yml")) {
    YAML::Node root;
    try {
      root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
      return SetError(error, std::string("yaml parse error: ") + e.what());
    }
    return ParseYamlNode(root, spec, error);
  }

  if (path.ends_with(".json")) {
    std::ifstream in(path);
    if (!in) {
      return SetError(error, "failed to open json file: " + path);
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    return ParseJson(buffer.str(), spec, error);
  }

  return SetError(error, "unsupported file type (use .yaml or .json): " + path);
}

}  // namespace keyflow
