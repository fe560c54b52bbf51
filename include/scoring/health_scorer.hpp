#pragma once

#include <cstdint>

#include "analysis/memory_health.hpp"
#include "analysis/trend_analyzer.hpp"
#include "core/settings.hpp"
#include "model/metric_sample.hpp"

namespace gpu_health::scoring {

enum class HealthStatus : std::uint8_t {
  EXCELLENT = 0,
  GOOD = 1,
  WARNING = 2,
  CRITICAL = 3,
};

struct HealthScore {
  int overall{100};
  double temperature_component{100.0};
  double power_component{100.0};
  double memory_component{100.0};
};

inline constexpr double kTemperatureWeight = 0.4;
inline constexpr double kPowerWeight = 0.3;
inline constexpr double kMemoryWeight = 0.3;

[[nodiscard]] HealthStatus status_of(int overall) noexcept;
[[nodiscard]] HealthStatus status_of(const HealthScore& score) noexcept;
[[nodiscard]] const char* status_name(HealthStatus status) noexcept;

[[nodiscard]] double temperature_component(const model::MetricSample& sample, const core::HealthSettings& settings) noexcept;

[[nodiscard]] double power_component(const model::MetricSample& sample, const analysis::TrendReport& trends,
                                     const core::HealthSettings& settings) noexcept;

[[nodiscard]] double memory_component(const model::MetricSample& sample, const analysis::MemoryHealth& memory,
                                      const core::HealthSettings& settings) noexcept;

[[nodiscard]] int composite(double temperature, double power, double memory) noexcept;

// Pure: identical inputs always give an identical score.
[[nodiscard]] HealthScore score_health(const model::MetricSample& sample, const analysis::TrendReport& trends,
                                       const analysis::MemoryHealth& memory,
                                       const core::HealthSettings& settings) noexcept;

}  // namespace gpu_health::scoring
