#include <cmath>
#include <cstdint>
#include <iostream>

#include "analysis/memory_health.hpp"
#include "analysis/trend_analyzer.hpp"
#include "core/settings.hpp"
#include "history/history_buffer.hpp"
#include "model/metric_sample.hpp"

using gpu_health::analysis::MemoryHealth;
using gpu_health::analysis::TrendReport;
using gpu_health::analysis::TrendStats;
using gpu_health::analysis::analyze_trends;
using gpu_health::analysis::assess_memory;
using gpu_health::analysis::compute_trend;
using gpu_health::analysis::count_spikes;
using gpu_health::analysis::efficiency_of;
using gpu_health::analysis::least_squares_slope;
using gpu_health::analysis::seconds_above;
using gpu_health::core::HealthSettings;
using gpu_health::core::MemoryTuning;
using gpu_health::history::HistoryBuffer;
using gpu_health::history::Metric;
using gpu_health::model::MetricSample;

namespace {

constexpr std::uint64_t kSecond = 1'000'000'000ULL;

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool almost_equal(double a, double b, double eps = 1e-6) {
  return std::fabs(a - b) <= eps;
}

MetricSample base_sample(const std::uint64_t timestamp_ns) {
  MetricSample sample{};
  sample.timestamp_ns = timestamp_ns;
  sample.utilization_pct = 60.0F;
  sample.memory_total = 1000;
  sample.memory_used = 500;
  sample.temperature_c = 50.0F;
  sample.power_watts = 100.0F;
  sample.power_limit_watts = 250.0F;
  return sample;
}

int test_slope_on_linear_series() {
  HistoryBuffer buffer(50);
  for (std::uint64_t i = 0; i < 30; ++i) {
    auto sample = base_sample(i * kSecond);
    sample.temperature_c = 40.0F + 2.0F * static_cast<float>(i);
    buffer.append(sample);
  }

  const TrendStats stats = compute_trend(buffer.window(Metric::TEMPERATURE));
  if (!almost_equal(stats.slope_per_s, 2.0, 1e-6)) {
    return fail("test_slope_on_linear_series", "slope should be 2 C/s");
  }
  if (!almost_equal(stats.mean, 69.0, 1e-6) || !almost_equal(stats.min, 40.0) || !almost_equal(stats.max, 98.0)) {
    return fail("test_slope_on_linear_series", "mean/min/max mismatch");
  }
  if (!almost_equal(stats.span_s, 29.0)) {
    return fail("test_slope_on_linear_series", "span should follow timestamps");
  }

  HistoryBuffer irregular(8);
  const std::uint64_t offsets_ms[] = {0, 500, 3000, 3100, 9000};
  for (const std::uint64_t offset : offsets_ms) {
    auto sample = base_sample(offset * 1'000'000ULL);
    sample.utilization_pct = 10.0F + 4.0F * (static_cast<float>(offset) / 1000.0F);
    irregular.append(sample);
  }
  if (!almost_equal(least_squares_slope(irregular.window(Metric::UTILIZATION)), 4.0, 1e-4)) {
    return fail("test_slope_on_linear_series", "slope must use real timestamp gaps");
  }

  return 0;
}

int test_short_windows_degrade_gracefully() {
  HistoryBuffer empty(4);
  const TrendStats none = compute_trend(empty.window(Metric::TEMPERATURE));
  if (none.samples != 0 || none.slope_per_s != 0.0 || seconds_above(empty.window(Metric::TEMPERATURE), 0.0) != 0.0) {
    return fail("test_short_windows_degrade_gracefully", "empty window should give zeroed stats");
  }

  HistoryBuffer single(4);
  auto sample = base_sample(5 * kSecond);
  sample.temperature_c = 77.0F;
  single.append(sample);
  const TrendStats one = compute_trend(single.window(Metric::TEMPERATURE));
  if (one.samples != 1 || !almost_equal(one.mean, 77.0) || one.slope_per_s != 0.0) {
    return fail("test_short_windows_degrade_gracefully", "single sample should give its own value and zero slope");
  }

  HistoryBuffer same_time(4);
  same_time.append(base_sample(kSecond));
  auto hotter = base_sample(kSecond);
  hotter.temperature_c = 90.0F;
  same_time.append(hotter);
  if (least_squares_slope(same_time.window(Metric::TEMPERATURE)) != 0.0) {
    return fail("test_short_windows_degrade_gracefully", "zero time spread should give zero slope");
  }

  const TrendReport report = analyze_trends(empty, HealthSettings{});
  if (report.temperature.samples != 0 || report.power.spikes != 0) {
    return fail("test_short_windows_degrade_gracefully", "empty history should give an empty report");
  }

  return 0;
}

int test_seconds_above_uses_timestamp_gaps() {
  HistoryBuffer buffer(20);
  for (std::uint64_t i = 0; i < 10; ++i) {
    auto sample = base_sample(i * kSecond);
    sample.temperature_c = 85.0F;
    buffer.append(sample);
  }
  if (!almost_equal(seconds_above(buffer.window(Metric::TEMPERATURE), 80.0), 10.0)) {
    return fail("test_seconds_above_uses_timestamp_gaps", "ten 1 Hz samples above should count ten seconds");
  }

  HistoryBuffer half(20);
  for (std::uint64_t i = 0; i < 10; ++i) {
    auto sample = base_sample(i * kSecond);
    sample.temperature_c = i >= 5 ? 85.0F : 70.0F;
    half.append(sample);
  }
  if (!almost_equal(seconds_above(half.window(Metric::TEMPERATURE), 80.0), 5.0)) {
    return fail("test_seconds_above_uses_timestamp_gaps", "only samples at or above the threshold should count");
  }

  HistoryBuffer gap(8);
  const std::uint64_t seconds[] = {0, 1, 2, 5};
  for (const std::uint64_t s : seconds) {
    auto sample = base_sample(s * kSecond);
    sample.temperature_c = s == 5 ? 81.0F : 60.0F;
    gap.append(sample);
  }
  if (!almost_equal(seconds_above(gap.window(Metric::TEMPERATURE), 80.0), 3.0)) {
    return fail("test_seconds_above_uses_timestamp_gaps", "a late sample should be credited its real gap");
  }

  if (!almost_equal(seconds_above(half.window(Metric::TEMPERATURE), 85.0), 5.0)) {
    return fail("test_seconds_above_uses_timestamp_gaps", "threshold comparison should be inclusive");
  }

  return 0;
}

int test_peak_reports_first_occurrence() {
  HistoryBuffer buffer(10);
  const float temps[] = {50.0F, 60.0F, 88.0F, 70.0F, 88.0F, 65.0F};
  std::uint64_t second = 0;
  for (const float temp : temps) {
    auto sample = base_sample(second * kSecond);
    sample.temperature_c = temp;
    buffer.append(sample);
    ++second;
  }

  const TrendStats stats = compute_trend(buffer.window(Metric::TEMPERATURE));
  if (!almost_equal(stats.peak, 88.0) || stats.peak_timestamp_ns != 2 * kSecond) {
    return fail("test_peak_reports_first_occurrence", "peak should carry the first timestamp it was reached");
  }

  const TrendReport report = analyze_trends(buffer, HealthSettings{});
  if (!almost_equal(report.temperature_change_c, 15.0)) {
    return fail("test_peak_reports_first_occurrence", "temperature change should be newest minus oldest");
  }

  return 0;
}

int test_power_spikes_and_efficiency() {
  HistoryBuffer buffer(30);
  const float draws[] = {100.0F, 130.0F, 120.0F, 145.0F, 150.0F, 180.0F, 90.0F, 95.0F};
  std::uint64_t second = 0;
  for (const float draw : draws) {
    auto sample = base_sample(second * kSecond);
    sample.power_watts = draw;
    buffer.append(sample);
    ++second;
  }

  if (count_spikes(buffer.window(Metric::POWER), 20.0, 10) != 3) {
    return fail("test_power_spikes_and_efficiency", "three increases above 20 W expected");
  }
  if (count_spikes(buffer.window(Metric::POWER), 20.0, 3) != 1) {
    return fail("test_power_spikes_and_efficiency", "lookback should only consider the newest deltas");
  }

  auto idle = base_sample(0);
  idle.utilization_pct = 5.0F;
  if (efficiency_of(idle, 10.0) != 0.0) {
    return fail("test_power_spikes_and_efficiency", "idle samples should not count towards efficiency");
  }
  auto busy = base_sample(0);
  busy.utilization_pct = 50.0F;
  busy.power_watts = 100.0F;
  if (!almost_equal(efficiency_of(busy, 10.0), 0.5)) {
    return fail("test_power_spikes_and_efficiency", "efficiency should be utilization per watt");
  }

  const TrendReport report = analyze_trends(buffer, HealthSettings{});
  if (!almost_equal(report.power.best_efficiency, 60.0 / 90.0, 1e-6) || !almost_equal(report.power.average_draw_w, 126.25)) {
    return fail("test_power_spikes_and_efficiency", "power trend aggregates mismatch");
  }

  return 0;
}

int test_memory_leak_detection() {
  const MemoryTuning tuning{};

  HistoryBuffer constant(300);
  for (std::uint64_t i = 0; i < 300; ++i) {
    constant.append(base_sample(i * kSecond));
  }
  const MemoryHealth flat = assess_memory(constant, tuning);
  if (flat.leak_suspected || !almost_equal(flat.fragmentation_pressure, 0.0) || !almost_equal(flat.growth_ratio, 1.0)) {
    return fail("test_memory_leak_detection", "constant usage must not look like a leak");
  }
  if (!flat.heuristic || !almost_equal(flat.confidence, 1.0)) {
    return fail("test_memory_leak_detection", "full window should be flagged heuristic with full confidence");
  }

  HistoryBuffer ramp(300);
  for (std::uint64_t i = 0; i < 300; ++i) {
    auto sample = base_sample(i * kSecond);
    sample.memory_used = 500 + (450 * i) / 299;
    ramp.append(sample);
  }
  const MemoryHealth growing = assess_memory(ramp, tuning);
  if (!growing.leak_suspected || growing.growth_ratio < 1.10 || growing.non_decreasing_fraction < 0.99) {
    return fail("test_memory_leak_detection", "steady growth from 50% to 95% should be a suspected leak");
  }
  if (growing.usage_trend_slope <= 0.0) {
    return fail("test_memory_leak_detection", "usage slope should be positive");
  }

  HistoryBuffer short_ramp(300);
  for (std::uint64_t i = 0; i < 6; ++i) {
    auto sample = base_sample(i * kSecond);
    sample.memory_used = 500 + 80 * i;
    short_ramp.append(sample);
  }
  const MemoryHealth early = assess_memory(short_ramp, tuning);
  if (early.leak_suspected) {
    return fail("test_memory_leak_detection", "too few samples must not raise a leak");
  }
  if (early.confidence >= 0.1) {
    return fail("test_memory_leak_detection", "confidence should reflect window fill");
  }

  return 0;
}

int test_fragmentation_proxy() {
  HistoryBuffer buffer(100);
  for (std::uint64_t i = 0; i < 40; ++i) {
    auto sample = base_sample(i * kSecond);
    sample.memory_used = (i % 2 == 0) ? 600 : 800;
    buffer.append(sample);
  }

  const MemoryHealth health = assess_memory(buffer, MemoryTuning{});
  if (health.leak_suspected) {
    return fail("test_fragmentation_proxy", "oscillating usage is not a leak");
  }
  if (!almost_equal(health.fragmentation_pressure, 40.0, 1e-6)) {
    return fail("test_fragmentation_proxy", "volatile usage at 70% should map to 40 pressure");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_slope_on_linear_series(); rc != 0) return rc;
  if (int rc = test_short_windows_degrade_gracefully(); rc != 0) return rc;
  if (int rc = test_seconds_above_uses_timestamp_gaps(); rc != 0) return rc;
  if (int rc = test_peak_reports_first_occurrence(); rc != 0) return rc;
  if (int rc = test_power_spikes_and_efficiency(); rc != 0) return rc;
  if (int rc = test_memory_leak_detection(); rc != 0) return rc;
  if (int rc = test_fragmentation_proxy(); rc != 0) return rc;

  std::cout << "[PASS] analysis unit tests\n";
  return 0;
}
