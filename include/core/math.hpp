#pragma once

#include <algorithm>

namespace gpu_health::core {

inline constexpr double clamp_score(const double value) noexcept {
  return std::clamp(value, 0.0, 100.0);
}

// 100 at or below `baseline`, 100 -> 60 between baseline and `warn`,
// 60 -> 0 between warn and `crit`, 0 beyond crit.
inline double piecewise_health(const double value, const double baseline, const double warn,
                               const double crit) noexcept {
  if (value <= baseline) {
    return 100.0;
  }
  if (value >= crit) {
    return 0.0;
  }
  if (value <= warn) {
    const double span = warn - baseline;
    return span > 0.0 ? 100.0 - (40.0 * (value - baseline) / span) : 60.0;
  }
  const double span = crit - warn;
  return span > 0.0 ? 60.0 - (60.0 * (value - warn) / span) : 0.0;
}

}  // namespace gpu_health::core
