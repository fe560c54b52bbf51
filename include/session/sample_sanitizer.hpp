#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "model/metric_sample.hpp"
#include "session/health_snapshot.hpp"

namespace gpu_health::session {

inline constexpr float kMaxTemperatureC = 150.0F;

struct SanitizedSample {
  model::MetricSample sample{};
  std::vector<Diagnostic> diagnostics{};
};

// Clamps values the hardware layer cannot legitimately report and records one
// diagnostic per adjusted field. A missing power limit is replaced by
// `fallback_power_limit_w` without a diagnostic. Timestamps never move backwards.
[[nodiscard]] SanitizedSample sanitize_sample(const model::MetricSample& raw,
                                              std::optional<std::uint64_t> previous_timestamp_ns,
                                              float fallback_power_limit_w);

}  // namespace gpu_health::session
