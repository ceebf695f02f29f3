#pragma once

#include <chrono>
#include <cstdint>

namespace lendflow {

// Event timestamp type.
using Timestamp = std::chrono::system_clock::time_point;

// -------------------------------------------------------------------------
// ms_to_timestamp / timestamp_to_ms
// -------------------------------------------------------------------------
// @brief  Bridge between ITimeProvider's epoch milliseconds and the
//         Timestamp carried by events. Each is the inverse of the other at
//         millisecond resolution.
// -------------------------------------------------------------------------
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace lendflow
