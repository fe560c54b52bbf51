#include "scoring/health_scorer.hpp"

#include <algorithm>
#include <cmath>

#include "core/math.hpp"
#include "history/history_buffer.hpp"

namespace gpu_health::scoring {

HealthStatus status_of(const int overall) noexcept {
  if (overall >= 90) {
    return HealthStatus::EXCELLENT;
  }
  if (overall >= 70) {
    return HealthStatus::GOOD;
  }
  if (overall >= 50) {
    return HealthStatus::WARNING;
  }
  return HealthStatus::CRITICAL;
}

HealthStatus status_of(const HealthScore& score) noexcept { return status_of(score.overall); }

const char* status_name(const HealthStatus status) noexcept {
  switch (status) {
    case HealthStatus::EXCELLENT:
      return "excellent";
    case HealthStatus::GOOD:
      return "good";
    case HealthStatus::WARNING:
      return "warning";
    case HealthStatus::CRITICAL:
      return "critical";
  }
  return "unknown";
}

double temperature_component(const model::MetricSample& sample, const core::HealthSettings& settings) noexcept {
  const auto& t = settings.thresholds;
  return core::clamp_score(
      core::piecewise_health(sample.temperature_c, settings.scoring.temp_baseline, t.temp_warn, t.temp_crit));
}

double power_component(const model::MetricSample& sample, const analysis::TrendReport& trends,
                       const core::HealthSettings& settings) noexcept {
  const auto& t = settings.thresholds;
  const auto& s = settings.scoring;

  const double load_pct = history::metric_value(sample, history::Metric::POWER_LOAD_PCT);
  const double consumption = core::piecewise_health(load_pct, s.power_baseline, t.power_warn, t.power_crit);

  double efficiency = 100.0;
  const double current = analysis::efficiency_of(sample, s.efficiency_idle_floor_pct);
  const double best = trends.power.best_efficiency;
  if (current > 0.0 && best > 0.0) {
    const double regression_pct = std::max(0.0, (1.0 - (current / best)) * 100.0);
    efficiency = core::piecewise_health(regression_pct, s.efficiency_baseline, s.efficiency_warn, s.efficiency_crit);
  }

  return core::clamp_score(std::min(consumption, efficiency));
}

double memory_component(const model::MetricSample& sample, const analysis::MemoryHealth& memory,
                        const core::HealthSettings& settings) noexcept {
  const auto& t = settings.thresholds;
  const auto& s = settings.scoring;

  double score = core::piecewise_health(model::memory_usage_pct(sample), s.mem_baseline, t.mem_warn, t.mem_crit);
  if (memory.leak_suspected) {
    score -= s.leak_penalty;
  }
  score -= memory.fragmentation_pressure * s.fragmentation_weight;
  return core::clamp_score(score);
}

int composite(const double temperature, const double power, const double memory) noexcept {
  const double weighted = (kTemperatureWeight * core::clamp_score(temperature)) + (kPowerWeight * core::clamp_score(power)) +
                          (kMemoryWeight * core::clamp_score(memory));
  return static_cast<int>(std::clamp<long>(std::lround(weighted), 0L, 100L));
}

HealthScore score_health(const model::MetricSample& sample, const analysis::TrendReport& trends,
                         const analysis::MemoryHealth& memory, const core::HealthSettings& settings) noexcept {
  HealthScore score{};
  score.temperature_component = temperature_component(sample, settings);
  score.power_component = power_component(sample, trends, settings);
  score.memory_component = memory_component(sample, memory, settings);
  score.overall = composite(score.temperature_component, score.power_component, score.memory_component);
  return score;
}

}  // namespace gpu_health::scoring
