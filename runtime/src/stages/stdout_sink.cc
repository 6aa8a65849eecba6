#include <iostream>
#include <string>
#include <utility>

#include "keyflow/stages/builtin.h"

namespace keyflow {

class StreamSink final : public ChainedStage {
 public:
  StreamSink(std::string name, IRecordStage* next, std::ostream& out)
      : ChainedStage(std::move(name), next), out_(out) {}

  bool process(Record& record) override {
    out_ << record.ToString() << "\n";
    return ChainedStage::process(record);
  }

  void notify(const Notification& notification) override {
    if (notification.contains(LifecycleEvent::SHUTDOWN)) {
      out_.flush();
    }
    ChainedStage::notify(notification);
  }

 private:
  std::ostream& out_;
};

std::unique_ptr<IRecordStage> MakeStreamSink(const keyflow::v1::StageSpec& spec,
                                             IRecordStage* next, std::ostream& out) {
  return std::make_unique<StreamSink>(StageName(spec), next, out);
}

std::unique_ptr<IRecordStage> MakeStdoutSink(const keyflow::v1::StageSpec& spec,
                                             IRecordStage* next) {
  return MakeStreamSink(spec, next, std::cout);
}

}  // namespace keyflow
