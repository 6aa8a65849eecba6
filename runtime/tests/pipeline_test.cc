#include "keyflow/pipeline.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "keyflow/pipeline_config.h"
#include "keyflow/runtime.h"
#include "keyflow/stage_registry.h"
#include "keyflow/stop_token.h"

namespace keyflow {
namespace {

struct TempFile {
  TempFile(const std::string& suffix, const std::string& contents) {
    static int counter = 0;
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    path = std::filesystem::temp_directory_path() /
           ("keyflow_pipeline_test_" + std::to_string(now) + "_" + std::to_string(counter++) +
            suffix);
    std::ofstream out(path);
    out << contents;
  }

  ~TempFile() {
    std::error_code error;
    std::filesystem::remove(path, error);
  }

  std::string str() const {
    return path.string();
  }

  std::filesystem::path path;
};

// Shared by every capture stage a registry creates.
struct Captured {
  std::vector<Record> records;
  std::vector<Notification> notifications;
  bool accept = true;
};

class CaptureStage final : public ChainedStage {
 public:
  CaptureStage(std::string name, IRecordStage* next, Captured& captured)
      : ChainedStage(std::move(name), next), captured_(captured) {}

  bool process(Record& record) override {
    captured_.records.push_back(record);
    if (!captured_.accept) {
      return false;
    }
    return ChainedStage::process(record);
  }

  void notify(const Notification& notification) override {
    captured_.notifications.push_back(notification);
    ChainedStage::notify(notification);
  }

 private:
  Captured& captured_;
};

StageRegistry MakeRegistry(Captured& captured) {
  StageRegistry registry;
  RegisterBuiltinStages(registry);
  registry.add("capture", [&captured](const keyflow::v1::StageSpec& spec, IRecordStage* next) {
    return std::make_unique<CaptureStage>(spec.name(), next, captured);
  });
  return registry;
}

keyflow::v1::PipelineSpec ParseOrDie(const std::string& yaml) {
  keyflow::v1::PipelineSpec spec;
  std::string error;
  EXPECT_TRUE(ParsePipelineYaml(yaml, spec, &error)) << error;
  return spec;
}

const char* kSanitizeYaml = R"(
name: ingest
stages:
  - name: sanitize
    type: sanitize_unique_key
    params:
      baseIdField: path
      schemaLocator:
        uniqueKeyField: id
  - name: capture
    type: capture
)";

std::string KeyOf(const Record& record) {
  auto value = record.first_value("id");
  return value ? ToString(*value) : std::string();
}

}  // namespace

TEST(PipelineConfigTest, ParsesYamlPipeline) {
  auto spec = ParseOrDie(kSanitizeYaml);

  EXPECT_EQ(spec.name(), "ingest");
  ASSERT_EQ(spec.stages_size(), 2);
  EXPECT_EQ(spec.stages(0).type(), "sanitize_unique_key");
  EXPECT_EQ(spec.stages(0).params().fields().at("baseIdField").string_value(), "path");
}

TEST(PipelineConfigTest, RejectsUnknownTopLevelFields) {
  keyflow::v1::PipelineSpec spec;
  std::string error;
  EXPECT_FALSE(ParsePipelineYaml("name: x\nbogus: 1\n", spec, &error));
  EXPECT_FALSE(error.empty());
}

TEST(PipelineConfigTest, LoadsYamlAndJsonFiles) {
  TempFile yaml(".yaml", "name: from_yaml\nlog_level: debug\nstages:\n  - type: stdout_sink\n");
  TempFile json(".json", R"({"name": "from_json", "stages": [{"type": "stdout_sink"}]})");

  keyflow::v1::PipelineSpec a;
  keyflow::v1::PipelineSpec b;
  ASSERT_TRUE(LoadPipelineSpec(yaml.str(), a));
  ASSERT_TRUE(LoadPipelineSpec(json.str(), b));

  EXPECT_EQ(a.name(), "from_yaml");
  EXPECT_EQ(a.log_level(), "debug");
  EXPECT_EQ(b.name(), "from_json");
  EXPECT_EQ(b.stages(0).type(), "stdout_sink");
}

TEST(PipelineConfigTest, RejectsUnsupportedExtension) {
  keyflow::v1::PipelineSpec spec;
  std::string error;
  EXPECT_FALSE(LoadPipelineSpec("/tmp/pipeline.toml", spec, &error));
  EXPECT_NE(error.find("unsupported"), std::string::npos);
}

TEST(PipelineTest, BuildsChainInOrder) {
  Captured captured;
  auto registry = MakeRegistry(captured);
  Pipeline pipeline(ParseOrDie(kSanitizeYaml), registry);

  ASSERT_EQ(pipeline.size(), 2u);
  EXPECT_EQ(pipeline.name(), "ingest");
  EXPECT_EQ(pipeline.stage(0).name(), "sanitize");
  EXPECT_EQ(pipeline.stage(1).name(), "capture");
}

TEST(PipelineTest, EmptyPipelineIsRejected) {
  Captured captured;
  auto registry = MakeRegistry(captured);
  keyflow::v1::PipelineSpec spec;
  spec.set_name("empty");

  EXPECT_THROW((void)Pipeline(spec, registry), std::invalid_argument);
}

TEST(PipelineTest, UnknownStageTypeIsRejected) {
  Captured captured;
  auto registry = MakeRegistry(captured);

  EXPECT_THROW((void)Pipeline(ParseOrDie("name: x\nstages:\n  - type: nope\n"), registry),
               std::invalid_argument);
}

TEST(PipelineTest, AssignsKeysAndResetsPerSession) {
  Captured captured;
  auto registry = MakeRegistry(captured);
  Pipeline pipeline(ParseOrDie(kSanitizeYaml), registry);

  for (int i = 0; i < 2; ++i) {
    Record record;
    record.put("path", std::string("/a/b.csv"));
    EXPECT_TRUE(pipeline.process(record));
  }
  pipeline.notify(Notification::StartSession());
  Record again;
  again.put("path", std::string("/a/b.csv"));
  pipeline.process(again);

  ASSERT_EQ(captured.records.size(), 3u);
  EXPECT_EQ(KeyOf(captured.records[0]), "/a/b.csv#0");
  EXPECT_EQ(KeyOf(captured.records[1]), "/a/b.csv#1");
  EXPECT_EQ(KeyOf(captured.records[2]), "/a/b.csv#0");
  ASSERT_EQ(captured.notifications.size(), 1u);
  EXPECT_TRUE(captured.notifications[0].contains(LifecycleEvent::START_SESSION));
}

TEST(PipelineTest, ReportsDroppedRecords) {
  Captured captured;
  captured.accept = false;
  auto registry = MakeRegistry(captured);
  Pipeline pipeline(ParseOrDie(kSanitizeYaml), registry);

  Record record;
  record.put("path", std::string("/x"));
  EXPECT_FALSE(pipeline.process(record));
}

TEST(PipelineTest, SchemaFileWithoutUniqueKeyPassesRecordsThrough) {
  TempFile schema(".yaml", "name: nokey\nfields:\n  - { name: path }\n");

  Captured captured;
  auto registry = MakeRegistry(captured);
  Pipeline pipeline(ParseOrDie("name: x\n"
                               "stages:\n"
                               "  - type: sanitize_unique_key\n"
                               "    params:\n"
                               "      idPrefix: LOAD-\n"
                               "      schemaLocator:\n"
                               "        schemaFile: " +
                               schema.str() +
                               "\n"
                               "  - type: capture\n"),
                    registry);

  Record record;
  record.put("path", std::string("/a"));
  const Record before = record;
  pipeline.process(record);

  ASSERT_EQ(captured.records.size(), 1u);
  EXPECT_EQ(captured.records[0], before);
}

TEST(FeedFilesTest, EachFileIsOneSession) {
  TempFile first(".log", "alpha\nbeta\n");
  TempFile second(".log", "gamma\n");

  Captured captured;
  auto registry = MakeRegistry(captured);
  Pipeline pipeline(ParseOrDie(kSanitizeYaml), registry);

  const RunStats stats = FeedFiles(pipeline, {first.str(), second.str()}, StopToken{});

  EXPECT_EQ(stats.sessions, 2u);
  EXPECT_EQ(stats.records, 3u);
  EXPECT_EQ(stats.dropped, 0u);

  ASSERT_EQ(captured.records.size(), 3u);
  EXPECT_EQ(KeyOf(captured.records[0]), first.str() + "#0");
  EXPECT_EQ(KeyOf(captured.records[1]), first.str() + "#1");
  EXPECT_EQ(KeyOf(captured.records[2]), second.str() + "#0");
  EXPECT_EQ(ToString(*captured.records[1].first_value(kMessageField)), "beta");

  ASSERT_EQ(captured.notifications.size(), 3u);
  EXPECT_TRUE(captured.notifications[0].contains(LifecycleEvent::START_SESSION));
  EXPECT_TRUE(captured.notifications[1].contains(LifecycleEvent::START_SESSION));
  EXPECT_TRUE(captured.notifications[2].contains(LifecycleEvent::SHUTDOWN));
}

TEST(FeedFilesTest, StopsWhenRequested) {
  TempFile input(".log", "a\nb\n");

  Captured captured;
  auto registry = MakeRegistry(captured);
  Pipeline pipeline(ParseOrDie(kSanitizeYaml), registry);

  std::atomic<bool> stop_flag{true};
  const RunStats stats = FeedFiles(pipeline, {input.str()}, StopToken{&stop_flag});

  EXPECT_EQ(stats.sessions, 0u);
  EXPECT_TRUE(captured.records.empty());
}

TEST(FeedFilesTest, MissingInputThrows) {
  Captured captured;
  auto registry = MakeRegistry(captured);
  Pipeline pipeline(ParseOrDie(kSanitizeYaml), registry);

  EXPECT_THROW(FeedFiles(pipeline, {"/nonexistent/keyflow/input.log"}, StopToken{}),
               std::runtime_error);
}

TEST(RuntimeTest, MissingBaseIdAbortsRun) {
  TempFile input(".log", "line\n");

  StageRegistry registry;
  RegisterBuiltinStages(registry);
  Runtime runtime(std::move(registry));

  auto spec = ParseOrDie(
      "name: broken\n"
      "stages:\n"
      "  - type: sanitize_unique_key\n"
      "    params:\n"
      "      baseIdField: file\n"
      "      schemaLocator:\n"
      "        uniqueKeyField: id\n");

  EXPECT_EQ(runtime.run(spec, {input.str()}), 1);
}

TEST(RuntimeTest, SuccessfulRunReturnsZero) {
  TempFile input(".log", "line\n");

  Captured captured;
  Runtime runtime(MakeRegistry(captured));

  EXPECT_EQ(runtime.run(ParseOrDie(kSanitizeYaml), {input.str()}), 0);
  ASSERT_EQ(captured.records.size(), 1u);
  EXPECT_EQ(KeyOf(captured.records[0]), input.str() + "#0");
}

}  // namespace keyflow
