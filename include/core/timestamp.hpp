#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace neuro_guard::core {

// Injected wall clock so decisions can be replayed with fixed timestamps.
using Clock = std::function<std::uint64_t()>;

inline std::uint64_t unix_timestamp_now_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

inline Clock system_clock_ms() {
  return [] { return unix_timestamp_now_ms(); };
}

}  // namespace neuro_guard::core
