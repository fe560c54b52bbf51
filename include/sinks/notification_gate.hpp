#pragma once

#include <cstdint>
#include <iosfwd>
#include <map>
#include <mutex>

#include "alerts/alert_engine.hpp"
#include "core/config.hpp"

namespace gpu_health::sinks {

// Rate limits alert transitions before they reach a human. The engine itself
// never throttles; this sits on the listener side only.
class NotificationGate {
 public:
  explicit NotificationGate(core::NotificationConfig config);
  NotificationGate(core::NotificationConfig config, std::ostream& out);

  // Returns true when the transition was delivered.
  bool offer(const alerts::AlertTransition& transition, std::uint64_t now_ns);

  [[nodiscard]] std::uint64_t delivered() const;
  [[nodiscard]] std::uint64_t suppressed() const;

 private:
  void deliver(const alerts::AlertTransition& transition);

  core::NotificationConfig config_;
  std::ostream& out_;

  mutable std::mutex mutex_;
  std::map<model::DeviceId, std::uint64_t> last_delivery_ns_{};
  std::uint64_t delivered_{0};
  std::uint64_t suppressed_{0};
};

}  // namespace gpu_health::sinks
