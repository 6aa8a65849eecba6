#pragma once

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <string>

namespace keyflow {

// Converts opaque stage params into a typed config message.
// Unknown fields are rejected.
template <typename Config>
class ProtobufConfigParser {
 public:
  static bool Parse(const google::protobuf::Struct& config,
                    Config* out,
                    std::string* error = nullptr) {
    if (!out) {
      if (error) {
        *error = "config output pointer is null";
      }
      return false;
    }

    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(config, &json);
    if (!status.ok()) {
      if (error) {
        *error = status.ToString();
      }
      return false;
    }

    google::protobuf::util::JsonParseOptions opts;
    opts.ignore_unknown_fields = false;

    status = google::protobuf::util::JsonStringToMessage(json, out, opts);
    if (!status.ok()) {
      if (error) {
        *error = status.ToString();
      }
      return false;
    }

    return true;
  }
};

}  // namespace keyflow
