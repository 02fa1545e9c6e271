#pragma once

#include "model/epoch_record.hpp"

namespace neuro_guard::sinks {

class StdoutDebugSink {
 public:
  void publish(const model::epoch_record& record) const;
};

}  // namespace neuro_guard::sinks
