#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "alerts/alert_engine.hpp"
#include "analysis/memory_health.hpp"
#include "analysis/trend_analyzer.hpp"
#include "model/metric_sample.hpp"
#include "scoring/health_scorer.hpp"

namespace gpu_health::session {

enum class DiagnosticKind : std::uint8_t {
  OUT_OF_RANGE_SAMPLE = 0,
  STALE_DEVICE = 1,
};

[[nodiscard]] const char* diagnostic_name(DiagnosticKind kind) noexcept;

// A data-quality condition observed while producing a snapshot.
struct Diagnostic {
  DiagnosticKind kind{DiagnosticKind::OUT_OF_RANGE_SAMPLE};
  std::string field{};
  double raw{0.0};
  double adjusted{0.0};
};

// Result of one complete tick for one device. Immutable once published.
struct HealthSnapshot {
  model::DeviceId device{0};
  std::uint64_t tick{0};
  model::MetricSample sample{};
  analysis::TrendReport trends{};
  analysis::MemoryHealth memory_health{};
  scoring::HealthScore health_score{};
  scoring::HealthStatus status{scoring::HealthStatus::EXCELLENT};
  std::vector<alerts::Alert> active_alerts{};
  std::vector<alerts::AlertTransition> transitions{};
  std::vector<Diagnostic> diagnostics{};
  bool stale{false};
  double uptime_seconds{0.0};
  std::uint64_t out_of_range_total{0};
  std::size_t history_size{0};
};

}  // namespace gpu_health::session
