#include "sinks/notification_gate.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace gpu_health::sinks {

NotificationGate::NotificationGate(core::NotificationConfig config) : NotificationGate(std::move(config), std::cerr) {}

NotificationGate::NotificationGate(core::NotificationConfig config, std::ostream& out)
    : config_(std::move(config)), out_(out) {}

bool NotificationGate::offer(const alerts::AlertTransition& transition, const std::uint64_t now_ns) {
  const auto& alert = transition.alert;
  std::lock_guard<std::mutex> lock(mutex_);

  if (!config_.enabled || alert.severity == alerts::AlertSeverity::INFO) {
    ++suppressed_;
    return false;
  }

  if (transition.kind == alerts::TransitionKind::CLEARED) {
    deliver(transition);
    return true;
  }

  const auto min_interval_ns =
      static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(config_.min_interval).count());
  const auto it = last_delivery_ns_.find(alert.device);
  if (it != last_delivery_ns_.end() && now_ns >= it->second && now_ns - it->second < min_interval_ns) {
    ++suppressed_;
    return false;
  }

  last_delivery_ns_[alert.device] = now_ns;
  deliver(transition);
  return true;
}

std::uint64_t NotificationGate::delivered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return delivered_;
}

std::uint64_t NotificationGate::suppressed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return suppressed_;
}

void NotificationGate::deliver(const alerts::AlertTransition& transition) {
  const auto& alert = transition.alert;
  ++delivered_;
  out_ << "[notify] gpu" << alert.device << ' ' << alerts::transition_name(transition.kind) << ' '
       << alerts::severity_name(alert.severity) << ' ' << alerts::category_name(alert.category) << ": "
       << alert.message << '\n';
}

}  // namespace gpu_health::sinks
