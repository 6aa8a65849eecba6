#pragma once

#include <memory>
#include <ostream>
#include <string>

#include "keyflow/stage.h"
#include "keyflow/v1/pipeline.pb.h"

namespace keyflow {

// Stage name from the spec, falling back to its type.
std::string StageName(const keyflow::v1::StageSpec& spec);

// sanitize_unique_key: parses SanitizeUniqueKeyConfig from the params,
// resolves the unique key field and builds a KeyAssigner.
// Throws std::invalid_argument on bad params.
std::unique_ptr<IRecordStage> MakeSanitizeUniqueKey(const keyflow::v1::StageSpec& spec,
                                                    IRecordStage* next);

// stdout_sink: writes one line per record, then forwards.
std::unique_ptr<IRecordStage> MakeStdoutSink(const keyflow::v1::StageSpec& spec,
                                             IRecordStage* next);

// Same, writing to `out` instead of stdout.
std::unique_ptr<IRecordStage> MakeStreamSink(const keyflow::v1::StageSpec& spec,
                                             IRecordStage* next, std::ostream& out);

}  // namespace keyflow
