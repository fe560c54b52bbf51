#include "analysis/memory_health.hpp"

#include <algorithm>
#include <cmath>

#include "analysis/trend_analyzer.hpp"

namespace gpu_health::analysis {

namespace {

double clamp01(const double value) {
  if (value < 0.0) {
    return 0.0;
  }
  if (value > 1.0) {
    return 1.0;
  }
  return value;
}

double mean_of(const history::MetricWindow& window, const std::size_t first, const std::size_t count) {
  double sum = 0.0;
  for (std::size_t i = first; i < first + count; ++i) {
    sum += window.at(i).value;
  }
  return count > 0 ? sum / static_cast<double>(count) : 0.0;
}

}  // namespace

MemoryHealth assess_memory(const history::MetricWindow& usage_pct, const core::MemoryTuning& tuning,
                           const std::size_t expected_samples) noexcept {
  MemoryHealth health{};
  const std::size_t n = usage_pct.size();
  if (n == 0) {
    return health;
  }

  health.confidence = expected_samples > 0 ? clamp01(static_cast<double>(n) / static_cast<double>(expected_samples)) : 0.0;
  health.usage_trend_slope = least_squares_slope(usage_pct);
  if (n < 3) {
    return health;
  }

  const std::size_t deltas = n - 1;
  std::size_t non_decreasing = 0;
  double delta_sum = 0.0;
  for (std::size_t i = 1; i < n; ++i) {
    const double delta = usage_pct.at(i).value - usage_pct.at(i - 1).value;
    delta_sum += delta;
    if (delta >= 0.0) {
      ++non_decreasing;
    }
  }
  const double delta_mean = delta_sum / static_cast<double>(deltas);
  double delta_var = 0.0;
  for (std::size_t i = 1; i < n; ++i) {
    const double deviation = (usage_pct.at(i).value - usage_pct.at(i - 1).value) - delta_mean;
    delta_var += deviation * deviation;
  }
  delta_var /= static_cast<double>(deltas);

  health.non_decreasing_fraction = static_cast<double>(non_decreasing) / static_cast<double>(deltas);

  const std::size_t third = n / 3;
  const double oldest_mean = mean_of(usage_pct, 0, third);
  const double newest_mean = mean_of(usage_pct, n - third, third);
  if (oldest_mean > 1e-9) {
    health.growth_ratio = newest_mean / oldest_mean;
  }

  health.leak_suspected = n >= tuning.leak_min_samples && health.growth_ratio >= tuning.leak_ratio &&
                          health.non_decreasing_fraction >= tuning.leak_monotonic_fraction;

  const double variance_norm = clamp01(std::sqrt(delta_var) / tuning.fragmentation_delta_stddev);
  const double usage_mean = mean_of(usage_pct, 0, n);
  const double usage_norm =
      clamp01((usage_mean - tuning.fragmentation_usage_floor) / (100.0 - tuning.fragmentation_usage_floor));
  health.fragmentation_pressure = 100.0 * variance_norm * usage_norm;

  return health;
}

MemoryHealth assess_memory(const history::HistoryBuffer& buffer, const core::MemoryTuning& tuning) noexcept {
  return assess_memory(buffer.window(history::Metric::MEMORY_USAGE_PCT), tuning, buffer.capacity());
}

}  // namespace gpu_health::analysis
