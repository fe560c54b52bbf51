#include "session/sample_sanitizer.hpp"

#include <cmath>
#include <string>

namespace gpu_health::session {
namespace {

void record(std::vector<Diagnostic>& diagnostics, const char* field, const double raw, const double adjusted) {
  diagnostics.push_back(Diagnostic{DiagnosticKind::OUT_OF_RANGE_SAMPLE, field, raw, adjusted});
}

void clamp_field(std::vector<Diagnostic>& diagnostics, const char* field, float& value, const float low,
                 const float high) {
  const float raw = value;
  if (!std::isfinite(raw)) {
    value = low;
  } else if (raw < low) {
    value = low;
  } else if (raw > high) {
    value = high;
  } else {
    return;
  }
  record(diagnostics, field, raw, value);
}

}  // namespace

const char* diagnostic_name(const DiagnosticKind kind) noexcept {
  switch (kind) {
    case DiagnosticKind::OUT_OF_RANGE_SAMPLE:
      return "out_of_range_sample";
    case DiagnosticKind::STALE_DEVICE:
      return "stale_device";
  }
  return "unknown";
}

SanitizedSample sanitize_sample(const model::MetricSample& raw, const std::optional<std::uint64_t> previous_timestamp_ns,
                                const float fallback_power_limit_w) {
  SanitizedSample out{raw, {}};
  auto& sample = out.sample;
  auto& diagnostics = out.diagnostics;

  constexpr float kUnbounded = 1e9F;
  clamp_field(diagnostics, "utilization_pct", sample.utilization_pct, 0.0F, 100.0F);
  clamp_field(diagnostics, "temperature_c", sample.temperature_c, 0.0F, kMaxTemperatureC);
  clamp_field(diagnostics, "power_watts", sample.power_watts, 0.0F, kUnbounded);
  clamp_field(diagnostics, "power_limit_watts", sample.power_limit_watts, 0.0F, kUnbounded);
  clamp_field(diagnostics, "fan_pct", sample.fan_pct, 0.0F, 100.0F);
  clamp_field(diagnostics, "core_clock_mhz", sample.core_clock_mhz, 0.0F, kUnbounded);
  clamp_field(diagnostics, "mem_clock_mhz", sample.mem_clock_mhz, 0.0F, kUnbounded);

  if (sample.power_limit_watts <= 0.0F) {
    sample.power_limit_watts = fallback_power_limit_w;
  }

  if (sample.memory_total > 0 && sample.memory_used > sample.memory_total) {
    record(diagnostics, "memory_used", static_cast<double>(sample.memory_used), static_cast<double>(sample.memory_total));
    sample.memory_used = sample.memory_total;
  }

  if (previous_timestamp_ns.has_value() && sample.timestamp_ns < *previous_timestamp_ns) {
    record(diagnostics, "timestamp_ns", static_cast<double>(sample.timestamp_ns),
           static_cast<double>(*previous_timestamp_ns));
    sample.timestamp_ns = *previous_timestamp_ns;
  }

  return out;
}

}  // namespace gpu_health::session
