#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

namespace gpu_health::core {

// Temperatures in degrees C, power as percent of the device power limit,
// memory as percent of total device memory.
struct Thresholds {
  float temp_warn{80.0F};
  float temp_crit{90.0F};
  float power_warn{85.0F};
  float power_crit{95.0F};
  float mem_warn{80.0F};
  float mem_crit{95.0F};
};

struct ScoringTuning {
  float temp_baseline{60.0F};
  float power_baseline{50.0F};
  float mem_baseline{50.0F};
  float fallback_power_limit_w{100.0F};

  // Efficiency regression (percent below the best observed utilization per watt).
  float efficiency_baseline{20.0F};
  float efficiency_warn{50.0F};
  float efficiency_crit{90.0F};
  float efficiency_idle_floor_pct{10.0F};

  float leak_penalty{20.0F};
  float fragmentation_weight{0.2F};
};

struct MemoryTuning {
  float leak_ratio{1.10F};
  float leak_monotonic_fraction{0.60F};
  std::size_t leak_min_samples{10};
  float fragmentation_delta_stddev{5.0F};
  float fragmentation_usage_floor{50.0F};
};

struct AlertTuning {
  std::uint32_t clear_debounce_ticks{3};
  float power_spike_watts{20.0F};
  std::size_t power_spike_lookback{10};
  std::uint32_t power_spike_count{10};
};

// Everything one tick reads from the settings collaborator.
struct HealthSettings {
  Thresholds thresholds{};
  ScoringTuning scoring{};
  MemoryTuning memory{};
  AlertTuning alerts{};
};

// Throws std::runtime_error describing the first inconsistent value.
void validate_settings(const HealthSettings& settings);

// Single-writer / multi-reader exchange of the current settings.
// Readers take a reference-counted immutable copy and never observe a partial update.
class SettingsStore {
 public:
  explicit SettingsStore(HealthSettings initial = {});

  [[nodiscard]] std::shared_ptr<const HealthSettings> current() const;

  void replace(HealthSettings settings);

  [[nodiscard]] std::uint64_t generation() const;

 private:
  mutable std::mutex mutex_;
  std::shared_ptr<const HealthSettings> current_;
  std::uint64_t generation_{0};
};

}  // namespace gpu_health::core
