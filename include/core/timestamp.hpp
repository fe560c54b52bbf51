#pragma once

#include <chrono>
#include <cstdint>

namespace gpu_health::core {

inline std::uint64_t unix_timestamp_now_ns() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

inline constexpr std::uint64_t to_ns(const std::chrono::milliseconds interval) noexcept {
  return static_cast<std::uint64_t>(interval.count()) * 1'000'000ULL;
}

inline constexpr double ns_to_seconds(const std::uint64_t ns) noexcept {
  return static_cast<double>(ns) / 1e9;
}

}  // namespace gpu_health::core
