#include "core/settings.hpp"

#include <cmath>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <utility>

namespace gpu_health::core {
namespace {

void require_ordered(const float baseline, const float warn, const float crit, const std::string& name) {
  if (!(warn < crit)) {
    throw std::runtime_error(name + " warn threshold must be below its crit threshold");
  }
  if (!(baseline < warn)) {
    throw std::runtime_error(name + " baseline must be below its warn threshold");
  }
}

void require_finite(std::initializer_list<float> values, const std::string& group) {
  for (const float value : values) {
    if (!std::isfinite(value)) {
      throw std::runtime_error(group + " values must be finite");
    }
  }
}

}  // namespace

void validate_settings(const HealthSettings& settings) {
  const auto& t = settings.thresholds;
  const auto& s = settings.scoring;
  const auto& m = settings.memory;
  require_finite({t.temp_warn, t.temp_crit, t.power_warn, t.power_crit, t.mem_warn, t.mem_crit}, "thresholds");
  require_finite({s.temp_baseline, s.power_baseline, s.mem_baseline, s.fallback_power_limit_w, s.efficiency_baseline,
                  s.efficiency_warn, s.efficiency_crit, s.efficiency_idle_floor_pct, s.leak_penalty, s.fragmentation_weight},
                 "scoring");
  require_finite({m.leak_ratio, m.leak_monotonic_fraction, m.fragmentation_delta_stddev, m.fragmentation_usage_floor},
                 "memory");
  require_finite({settings.alerts.power_spike_watts}, "alerts");
  require_ordered(s.temp_baseline, t.temp_warn, t.temp_crit, "temperature");
  require_ordered(s.power_baseline, t.power_warn, t.power_crit, "power");
  require_ordered(s.mem_baseline, t.mem_warn, t.mem_crit, "memory");
  require_ordered(s.efficiency_baseline, s.efficiency_warn, s.efficiency_crit, "efficiency");

  if (s.fallback_power_limit_w <= 0.0F) {
    throw std::runtime_error("scoring.fallback_power_limit_w must be greater than 0");
  }
  if (s.leak_penalty < 0.0F || s.fragmentation_weight < 0.0F) {
    throw std::runtime_error("scoring penalties must not be negative");
  }

  if (m.leak_ratio <= 1.0F) {
    throw std::runtime_error("memory.leak_ratio must be greater than 1");
  }
  if (m.leak_monotonic_fraction <= 0.0F || m.leak_monotonic_fraction > 1.0F) {
    throw std::runtime_error("memory.leak_monotonic_fraction must be in range (0, 1]");
  }
  if (m.leak_min_samples < 3) {
    throw std::runtime_error("memory.leak_min_samples must be at least 3");
  }
  if (m.fragmentation_delta_stddev <= 0.0F) {
    throw std::runtime_error("memory.fragmentation_delta_stddev must be greater than 0");
  }
  if (m.fragmentation_usage_floor < 0.0F || m.fragmentation_usage_floor >= 100.0F) {
    throw std::runtime_error("memory.fragmentation_usage_floor must be in range [0, 100)");
  }

  if (settings.alerts.clear_debounce_ticks == 0) {
    throw std::runtime_error("alerts.clear_debounce_ticks must be greater than 0");
  }
}

SettingsStore::SettingsStore(HealthSettings initial)
    : current_(std::make_shared<const HealthSettings>(std::move(initial))) {}

std::shared_ptr<const HealthSettings> SettingsStore::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

void SettingsStore::replace(HealthSettings settings) {
  auto next = std::make_shared<const HealthSettings>(std::move(settings));
  std::lock_guard<std::mutex> lock(mutex_);
  current_ = std::move(next);
  ++generation_;
}

std::uint64_t SettingsStore::generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generation_;
}

}  // namespace gpu_health::core
