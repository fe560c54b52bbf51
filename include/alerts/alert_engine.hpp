#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "analysis/memory_health.hpp"
#include "analysis/trend_analyzer.hpp"
#include "core/settings.hpp"
#include "model/metric_sample.hpp"

namespace gpu_health::alerts {

enum class AlertCategory : std::uint8_t {
  TEMPERATURE = 0,
  POWER = 1,
  MEMORY = 2,
  THROTTLING = 3,
};

inline constexpr std::size_t kCategoryCount = 4;

enum class AlertSeverity : std::uint8_t {
  INFO = 0,
  WARNING = 1,
  CRITICAL = 2,
};

[[nodiscard]] const char* category_name(AlertCategory category) noexcept;
[[nodiscard]] const char* severity_name(AlertSeverity severity) noexcept;

struct Alert {
  std::uint64_t id{0};
  model::DeviceId device{0};
  AlertCategory category{AlertCategory::TEMPERATURE};
  AlertSeverity severity{AlertSeverity::INFO};
  std::string message{};
  std::uint64_t first_seen_ns{0};
  std::uint64_t last_seen_ns{0};
  std::uint32_t occurrence_count{0};
  double value{0.0};
  double threshold{0.0};
};

// Outcome of evaluating one category against one tick. No severity means the
// condition is absent on this tick.
struct Condition {
  AlertCategory category{AlertCategory::TEMPERATURE};
  std::optional<AlertSeverity> severity{};
  double value{0.0};
  double threshold{0.0};
  std::string message{};
};

enum class TransitionKind : std::uint8_t {
  RAISED = 0,
  ESCALATED = 1,
  CLEARED = 2,
};

[[nodiscard]] const char* transition_name(TransitionKind kind) noexcept;

struct AlertTransition {
  TransitionKind kind{TransitionKind::RAISED};
  Alert alert{};
};

struct ClearState {};

struct ActiveState {
  Alert alert{};
  std::uint32_t clear_ticks{0};
};

using AlertState = std::variant<ClearState, ActiveState>;

// Lifecycle of one (device, category) pair: Clear -> Active -> Clear, with
// severity escalation inside Active and a debounce before clearing.
class AlertTracker {
 public:
  AlertTracker() = default;

  std::optional<AlertTransition> observe(const Condition& condition, model::DeviceId device, std::uint64_t now_ns,
                                         std::uint32_t debounce_ticks, std::uint64_t& next_id);

  [[nodiscard]] const AlertState& state() const noexcept { return state_; }
  [[nodiscard]] bool active() const noexcept { return std::holds_alternative<ActiveState>(state_); }

 private:
  AlertState state_{ClearState{}};
};

[[nodiscard]] std::array<Condition, kCategoryCount> evaluate_conditions(const model::MetricSample& sample,
                                                                        const analysis::TrendReport& trends,
                                                                        const analysis::MemoryHealth& memory,
                                                                        const core::HealthSettings& settings);

// Per-device alert state. Never rate limits: every tick reflects the true state.
class AlertEngine {
 public:
  explicit AlertEngine(model::DeviceId device) noexcept;

  std::vector<AlertTransition> evaluate(const model::MetricSample& sample, const analysis::TrendReport& trends,
                                        const analysis::MemoryHealth& memory, const core::HealthSettings& settings);

  std::vector<AlertTransition> apply(const std::array<Condition, kCategoryCount>& conditions, std::uint64_t now_ns,
                                     std::uint32_t debounce_ticks);

  [[nodiscard]] std::vector<Alert> active_alerts() const;

  [[nodiscard]] const AlertTracker& tracker(AlertCategory category) const noexcept {
    return trackers_[static_cast<std::size_t>(category)];
  }

 private:
  model::DeviceId device_{0};
  std::uint64_t next_id_{1};
  std::array<AlertTracker, kCategoryCount> trackers_{};
};

}  // namespace gpu_health::alerts
