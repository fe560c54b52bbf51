#include "analysis/trend_analyzer.hpp"

#include <algorithm>

#include "core/timestamp.hpp"

namespace gpu_health::analysis {

using history::Metric;
using history::MetricPoint;
using history::MetricWindow;

double least_squares_slope(const MetricWindow& window) noexcept {
  const std::size_t n = window.size();
  if (n < 2) {
    return 0.0;
  }

  // Offsets from the first timestamp keep the regression well conditioned.
  const std::uint64_t origin = window.front().timestamp_ns;
  double mean_x = 0.0;
  double mean_y = 0.0;
  for (const MetricPoint point : window) {
    mean_x += core::ns_to_seconds(point.timestamp_ns - origin);
    mean_y += point.value;
  }
  mean_x /= static_cast<double>(n);
  mean_y /= static_cast<double>(n);

  double sxx = 0.0;
  double sxy = 0.0;
  for (const MetricPoint point : window) {
    const double dx = core::ns_to_seconds(point.timestamp_ns - origin) - mean_x;
    sxx += dx * dx;
    sxy += dx * (point.value - mean_y);
  }

  if (sxx <= 1e-12) {
    return 0.0;
  }
  return sxy / sxx;
}

TrendStats compute_trend(const MetricWindow& window) noexcept {
  TrendStats stats{};
  if (window.empty()) {
    return stats;
  }

  const MetricPoint first = window.front();
  stats.samples = window.size();
  stats.min = first.value;
  stats.max = first.value;
  stats.peak = first.value;
  stats.peak_timestamp_ns = first.timestamp_ns;

  double sum = 0.0;
  for (const MetricPoint point : window) {
    sum += point.value;
    stats.min = std::min(stats.min, point.value);
    if (point.value > stats.peak) {
      stats.peak = point.value;
      stats.peak_timestamp_ns = point.timestamp_ns;
    }
  }
  stats.max = stats.peak;
  stats.mean = sum / static_cast<double>(stats.samples);
  stats.span_s = core::ns_to_seconds(window.back().timestamp_ns - first.timestamp_ns);
  stats.slope_per_s = least_squares_slope(window);
  return stats;
}

double seconds_above(const MetricWindow& window, const double threshold) noexcept {
  const std::size_t n = window.size();
  if (n == 0) {
    return 0.0;
  }

  const double span_s = core::ns_to_seconds(window.back().timestamp_ns - window.front().timestamp_ns);
  const double mean_spacing_s = n > 1 ? span_s / static_cast<double>(n - 1) : 0.0;

  double total = 0.0;
  std::uint64_t previous_ts = 0;
  std::size_t index = 0;
  for (const MetricPoint point : window) {
    if (point.value >= threshold) {
      if (index == 0) {
        total += mean_spacing_s;
      } else if (point.timestamp_ns > previous_ts) {
        total += core::ns_to_seconds(point.timestamp_ns - previous_ts);
      }
    }
    previous_ts = point.timestamp_ns;
    ++index;
  }
  return total;
}

std::uint32_t count_spikes(const MetricWindow& window, const double step, const std::size_t lookback) noexcept {
  const MetricWindow recent = window.newest(lookback + 1);
  std::uint32_t spikes = 0;
  bool has_previous = false;
  double previous = 0.0;
  for (const MetricPoint point : recent) {
    if (has_previous && point.value - previous > step) {
      ++spikes;
    }
    previous = point.value;
    has_previous = true;
  }
  return spikes;
}

double efficiency_of(const model::MetricSample& sample, const double idle_floor_pct) noexcept {
  if (sample.power_watts <= 0.0F || sample.utilization_pct < idle_floor_pct) {
    return 0.0;
  }
  return static_cast<double>(sample.utilization_pct) / static_cast<double>(sample.power_watts);
}

double best_efficiency(const history::HistoryBuffer& buffer, const double idle_floor_pct) noexcept {
  double best = 0.0;
  for (std::size_t i = 0; i < buffer.size(); ++i) {
    best = std::max(best, efficiency_of(buffer.at(i), idle_floor_pct));
  }
  return best;
}

TrendReport analyze_trends(const history::HistoryBuffer& buffer, const core::HealthSettings& settings) {
  TrendReport report{};
  if (buffer.empty()) {
    return report;
  }

  const auto& thresholds = settings.thresholds;
  const double idle_floor = settings.scoring.efficiency_idle_floor_pct;

  const MetricWindow temperature = buffer.window(Metric::TEMPERATURE);
  const MetricWindow power = buffer.window(Metric::POWER);

  report.utilization = compute_trend(buffer.window(Metric::UTILIZATION));
  report.temperature = compute_trend(temperature);
  report.memory_usage_pct = compute_trend(buffer.window(Metric::MEMORY_USAGE_PCT));
  report.fan = compute_trend(buffer.window(Metric::FAN_PCT));
  report.core_clock = compute_trend(buffer.window(Metric::CORE_CLOCK));
  report.mem_clock = compute_trend(buffer.window(Metric::MEM_CLOCK));

  report.temperature_change_c = temperature.back().value - temperature.front().value;
  report.seconds_above_temp_warn = seconds_above(temperature, thresholds.temp_warn);
  report.seconds_above_temp_crit = seconds_above(temperature, thresholds.temp_crit);
  report.throttled_seconds = seconds_above(buffer.window(Metric::THROTTLED), 0.5);

  report.power.draw = compute_trend(power);
  report.power.load_pct = compute_trend(buffer.window(Metric::POWER_LOAD_PCT));
  report.power.average_draw_w = report.power.draw.mean;
  report.power.spikes =
      count_spikes(power, settings.alerts.power_spike_watts, settings.alerts.power_spike_lookback);
  report.power.efficiency = efficiency_of(buffer.latest(), idle_floor);
  report.power.best_efficiency = best_efficiency(buffer, idle_floor);

  return report;
}

}  // namespace gpu_health::analysis
