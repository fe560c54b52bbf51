#pragma once

#include <cstddef>

#include "core/settings.hpp"
#include "history/history_buffer.hpp"

namespace gpu_health::analysis {

// Heuristic view of memory behaviour. No driver exposes true fragmentation,
// so `heuristic` is always set and `confidence` only reflects window fill.
struct MemoryHealth {
  bool leak_suspected{false};
  double fragmentation_pressure{0.0};
  double usage_trend_slope{0.0};
  double growth_ratio{1.0};
  double non_decreasing_fraction{0.0};
  double confidence{0.0};
  bool heuristic{true};
};

// `usage_pct` is the memory-usage-percent window; `expected_samples` is the size of a
// full window and only scales confidence.
[[nodiscard]] MemoryHealth assess_memory(const history::MetricWindow& usage_pct, const core::MemoryTuning& tuning,
                                         std::size_t expected_samples) noexcept;

[[nodiscard]] MemoryHealth assess_memory(const history::HistoryBuffer& buffer, const core::MemoryTuning& tuning) noexcept;

}  // namespace gpu_health::analysis
