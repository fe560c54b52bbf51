#pragma once

#include <cstddef>
#include <cstdint>

#include "core/settings.hpp"
#include "history/history_buffer.hpp"

namespace gpu_health::analysis {

struct TrendStats {
  std::size_t samples{0};
  double mean{0.0};
  double min{0.0};
  double max{0.0};
  double slope_per_s{0.0};
  double span_s{0.0};
  double peak{0.0};
  std::uint64_t peak_timestamp_ns{0};
};

[[nodiscard]] TrendStats compute_trend(const history::MetricWindow& window) noexcept;

[[nodiscard]] double least_squares_slope(const history::MetricWindow& window) noexcept;

// Sum of the time covered by points whose value is >= threshold. Each point owns the
// gap back to its predecessor; the oldest point owns the window's mean spacing.
[[nodiscard]] double seconds_above(const history::MetricWindow& window, double threshold) noexcept;

// Number of consecutive-point increases larger than `step` among the newest `lookback` deltas.
[[nodiscard]] std::uint32_t count_spikes(const history::MetricWindow& window, double step,
                                         std::size_t lookback) noexcept;

struct PowerTrend {
  TrendStats draw{};
  TrendStats load_pct{};
  double average_draw_w{0.0};
  std::uint32_t spikes{0};
  double efficiency{0.0};
  double best_efficiency{0.0};
};

struct TrendReport {
  TrendStats utilization{};
  TrendStats temperature{};
  TrendStats memory_usage_pct{};
  TrendStats fan{};
  TrendStats core_clock{};
  TrendStats mem_clock{};
  PowerTrend power{};
  double temperature_change_c{0.0};
  double seconds_above_temp_warn{0.0};
  double seconds_above_temp_crit{0.0};
  double throttled_seconds{0.0};
};

// Utilization per watt for one sample, 0 when idle below `idle_floor_pct` or not drawing power.
[[nodiscard]] double efficiency_of(const model::MetricSample& sample, double idle_floor_pct) noexcept;

[[nodiscard]] double best_efficiency(const history::HistoryBuffer& buffer, double idle_floor_pct) noexcept;

[[nodiscard]] TrendReport analyze_trends(const history::HistoryBuffer& buffer, const core::HealthSettings& settings);

}  // namespace gpu_health::analysis
