#pragma once

#include <string>

#include "keyflow/v1/pipeline.pb.h"

namespace keyflow {

// ------------------------------------------------------------
// Load a pipeline spec from a file
// ------------------------------------------------------------
// Supported formats:
//   - YAML (.yaml / .yml), converted to JSON text first
//   - JSON (.json)
//
// Both end up in protobuf's JSON mapping, unknown fields are
// rejected. On failure `error` (if given) describes the problem.
//
bool LoadPipelineSpec(const std::string& path, keyflow::v1::PipelineSpec& spec,
                      std::string* error = nullptr);

// Same as LoadPipelineSpec, for YAML text already in memory.
bool ParsePipelineYaml(const std::string& text, keyflow::v1::PipelineSpec& spec,
                       std::string* error = nullptr);

}  // namespace keyflow
