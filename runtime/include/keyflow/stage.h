#pragma once

#include <string>
#include <utility>

#include "keyflow/notification.h"
#include "keyflow/record.h"

namespace keyflow {

struct IStage {
  virtual ~IStage() = default;
  virtual std::string name() const = 0;
};

/**
 * A stage in a synchronous record chain.
 *
 * The driver calls process() and notify() sequentially, one at a time.
 * process() returns false when the record was dropped or the chain
 * asked to stop.
 */
struct IRecordStage : IStage {
  virtual bool process(Record& record) = 0;
  virtual void notify(const Notification& notification) = 0;
};

/**
 * Base for stages that hand records on to a successor.
 *
 * The successor is not owned. The default implementations forward
 * unchanged; a null successor terminates the chain and accepts.
 */
class ChainedStage : public IRecordStage {
 public:
  ChainedStage(std::string name, IRecordStage* next) : name_(std::move(name)), next_(next) {}

  std::string name() const override {
    return name_;
  }

  bool process(Record& record) override {
    return next_ ? next_->process(record) : true;
  }

  void notify(const Notification& notification) override {
    if (next_) {
      next_->notify(notification);
    }
  }

 protected:
  IRecordStage* next() const noexcept {
    return next_;
  }

 private:
  std::string name_;
  IRecordStage* next_;
};

}  // namespace keyflow
