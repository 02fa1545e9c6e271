#include "sinks/stdout_debug.hpp"

#include <cstdio>

namespace neuro_guard::sinks {

void StdoutDebugSink::publish(const model::epoch_record& record) const {
  std::printf("[epoch] index=%llu tier=%s roh=%.4f decision=%s DECAY=%.3f WAVE=%.3f\n",
              static_cast<unsigned long long>(record.epoch_index), model::tier_name(record.tier), record.risk,
              record.accepted ? "ACCEPT" : "DENY", record.assets.get(model::asset::DECAY),
              record.assets.get(model::asset::WAVE));
}

}  // namespace neuro_guard::sinks
