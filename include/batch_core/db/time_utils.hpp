#pragma once

#include <chrono>
#include <optional>

namespace batch_core {

// Timestamps are stored as INTEGER milliseconds since the Unix epoch.
inline long long time_point_to_millis(const std::chrono::system_clock::time_point &tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point millis_to_time_point(long long millis) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::milliseconds(millis)));
}

inline std::optional<std::chrono::system_clock::time_point> millis_to_time_point(
    const std::optional<long long> &millis) {
  if (!millis) {
    return std::nullopt;
  }
  return millis_to_time_point(*millis);
}

inline long long now_millis() {
  return time_point_to_millis(std::chrono::system_clock::now());
}

}  // namespace batch_core
