#pragma once

#include <chrono>
#include <cstdint>

namespace folio {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock time carried by every event and stamped on positions and account
// snapshots. The accounting core never reads a clock itself: timestamps come
// from the events that upstream collaborators produce.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// Wire messages carry epoch milliseconds.
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace folio
