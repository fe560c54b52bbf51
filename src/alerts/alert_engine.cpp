#include "alerts/alert_engine.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

#include "history/history_buffer.hpp"

namespace gpu_health::alerts {
namespace {

std::string describe(const char* what, const double value, const char* unit, const char* level, const double threshold) {
  std::ostringstream message;
  message << std::fixed << std::setprecision(1) << what << ' ' << value << unit << " at or above " << level
          << " threshold " << threshold << unit;
  return message.str();
}

// Picks the higher of crit/warn when `value` crosses them.
Condition threshold_condition(const AlertCategory category, const char* what, const char* unit, const double value,
                              const double warn, const double crit) {
  Condition condition{};
  condition.category = category;
  condition.value = value;
  if (value >= crit) {
    condition.severity = AlertSeverity::CRITICAL;
    condition.threshold = crit;
    condition.message = describe(what, value, unit, "critical", crit);
  } else if (value >= warn) {
    condition.severity = AlertSeverity::WARNING;
    condition.threshold = warn;
    condition.message = describe(what, value, unit, "warning", warn);
  }
  return condition;
}

}  // namespace

const char* category_name(const AlertCategory category) noexcept {
  switch (category) {
    case AlertCategory::TEMPERATURE:
      return "temperature";
    case AlertCategory::POWER:
      return "power";
    case AlertCategory::MEMORY:
      return "memory";
    case AlertCategory::THROTTLING:
      return "throttling";
  }
  return "unknown";
}

const char* severity_name(const AlertSeverity severity) noexcept {
  switch (severity) {
    case AlertSeverity::INFO:
      return "info";
    case AlertSeverity::WARNING:
      return "warning";
    case AlertSeverity::CRITICAL:
      return "critical";
  }
  return "unknown";
}

const char* transition_name(const TransitionKind kind) noexcept {
  switch (kind) {
    case TransitionKind::RAISED:
      return "raised";
    case TransitionKind::ESCALATED:
      return "escalated";
    case TransitionKind::CLEARED:
      return "cleared";
  }
  return "unknown";
}

std::optional<AlertTransition> AlertTracker::observe(const Condition& condition, const model::DeviceId device,
                                                     const std::uint64_t now_ns, const std::uint32_t debounce_ticks,
                                                     std::uint64_t& next_id) {
  if (auto* active = std::get_if<ActiveState>(&state_)) {
    Alert& alert = active->alert;
    // A fallback Info condition does not hold a Warning or Critical alert open.
    const bool holds = condition.severity.has_value() &&
                       (*condition.severity != AlertSeverity::INFO || alert.severity == AlertSeverity::INFO);
    if (holds) {
      active->clear_ticks = 0;
      alert.last_seen_ns = now_ns;
      ++alert.occurrence_count;
      alert.value = condition.value;
      if (*condition.severity > alert.severity) {
        alert.severity = *condition.severity;
        alert.threshold = condition.threshold;
        alert.message = condition.message;
        return AlertTransition{TransitionKind::ESCALATED, alert};
      }
      return std::nullopt;
    }

    ++active->clear_ticks;
    if (active->clear_ticks < debounce_ticks) {
      return std::nullopt;
    }
    AlertTransition cleared{TransitionKind::CLEARED, std::move(alert)};
    state_ = ClearState{};
    return cleared;
  }

  if (!condition.severity.has_value()) {
    return std::nullopt;
  }

  Alert alert{};
  alert.id = (static_cast<std::uint64_t>(device) << 32U) | (next_id++ & 0xFFFFFFFFULL);
  alert.device = device;
  alert.category = condition.category;
  alert.severity = *condition.severity;
  alert.message = condition.message;
  alert.first_seen_ns = now_ns;
  alert.last_seen_ns = now_ns;
  alert.occurrence_count = 1;
  alert.value = condition.value;
  alert.threshold = condition.threshold;

  state_ = ActiveState{alert, 0};
  return AlertTransition{TransitionKind::RAISED, std::move(alert)};
}

std::array<Condition, kCategoryCount> evaluate_conditions(const model::MetricSample& sample,
                                                          const analysis::TrendReport& trends,
                                                          const analysis::MemoryHealth& memory,
                                                          const core::HealthSettings& settings) {
  const auto& t = settings.thresholds;
  const auto& tuning = settings.alerts;

  Condition temperature = threshold_condition(AlertCategory::TEMPERATURE, "GPU temperature", "C",
                                               sample.temperature_c, t.temp_warn, t.temp_crit);

  Condition power = threshold_condition(AlertCategory::POWER, "GPU power load",
                                        "%", history::metric_value(sample, history::Metric::POWER_LOAD_PCT),
                                        t.power_warn, t.power_crit);
  // Inclusive so the default count can be reached within the default lookback.
  if (!power.severity.has_value() && trends.power.spikes >= tuning.power_spike_count) {
    power.severity = AlertSeverity::INFO;
    power.value = static_cast<double>(trends.power.spikes);
    power.threshold = static_cast<double>(tuning.power_spike_count);
    power.message = "Detected " + std::to_string(trends.power.spikes) + " power spikes, check power supply stability";
  }

  Condition mem = threshold_condition(AlertCategory::MEMORY, "GPU memory usage", "%", model::memory_usage_pct(sample),
                                      t.mem_warn, t.mem_crit);
  if (!mem.severity.has_value() && memory.leak_suspected) {
    mem.severity = AlertSeverity::INFO;
    mem.value = memory.growth_ratio;
    mem.threshold = settings.memory.leak_ratio;
    mem.message = "Possible memory leak, usage increasing steadily";
  }

  Condition throttling{};
  throttling.category = AlertCategory::THROTTLING;
  throttling.value = sample.throttled ? 1.0 : 0.0;
  throttling.threshold = 1.0;
  if (sample.throttled) {
    throttling.severity = AlertSeverity::WARNING;
    throttling.message = "GPU is throttling, performance reduced";
  }

  return {std::move(temperature), std::move(power), std::move(mem), std::move(throttling)};
}

AlertEngine::AlertEngine(const model::DeviceId device) noexcept : device_(device) {}

std::vector<AlertTransition> AlertEngine::evaluate(const model::MetricSample& sample, const analysis::TrendReport& trends,
                                                   const analysis::MemoryHealth& memory,
                                                   const core::HealthSettings& settings) {
  return apply(evaluate_conditions(sample, trends, memory, settings), sample.timestamp_ns,
               settings.alerts.clear_debounce_ticks);
}

std::vector<AlertTransition> AlertEngine::apply(const std::array<Condition, kCategoryCount>& conditions,
                                                const std::uint64_t now_ns, const std::uint32_t debounce_ticks) {
  std::vector<AlertTransition> transitions;
  for (const auto& condition : conditions) {
    auto& tracker = trackers_[static_cast<std::size_t>(condition.category)];
    if (auto transition = tracker.observe(condition, device_, now_ns, debounce_ticks, next_id_)) {
      transitions.push_back(std::move(*transition));
    }
  }
  return transitions;
}

std::vector<Alert> AlertEngine::active_alerts() const {
  std::vector<Alert> alerts;
  for (const auto& tracker : trackers_) {
    if (const auto* active = std::get_if<ActiveState>(&tracker.state())) {
      alerts.push_back(active->alert);
    }
  }
  return alerts;
}

}  // namespace gpu_health::alerts
