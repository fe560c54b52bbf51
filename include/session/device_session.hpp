#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "alerts/alert_engine.hpp"
#include "core/settings.hpp"
#include "history/history_buffer.hpp"
#include "model/metric_sample.hpp"
#include "session/health_snapshot.hpp"

namespace gpu_health::session {

// All state for one device. Ticks are serialized per session; the latest
// snapshot is published by pointer replacement so readers never wait on a tick.
class DeviceSession {
 public:
  DeviceSession(model::DeviceId device, std::size_t history_capacity);

  DeviceSession(const DeviceSession&) = delete;
  DeviceSession& operator=(const DeviceSession&) = delete;

  // append -> trends -> memory -> score -> alerts, all against `settings`.
  std::shared_ptr<const HealthSnapshot> tick(const model::MetricSample& raw, const core::HealthSettings& settings);

  // Republishes the latest snapshot flagged stale when no sample arrived within
  // `stale_after_ns` of `now_ns`. Returns the new snapshot only on the transition.
  std::shared_ptr<const HealthSnapshot> mark_stale_if_idle(std::uint64_t now_ns, std::uint64_t stale_after_ns);

  [[nodiscard]] std::shared_ptr<const HealthSnapshot> snapshot() const;

  [[nodiscard]] std::vector<model::MetricSample> history() const;

  [[nodiscard]] std::vector<history::MetricPoint> window(history::Metric metric, history::WindowSpec spec) const;

  // Newest first, at most `limit` entries.
  [[nodiscard]] std::vector<alerts::AlertTransition> recent_alerts(std::size_t limit) const;

  [[nodiscard]] model::DeviceId device() const noexcept { return device_; }

  static constexpr std::size_t kRecentAlertCapacity = 100;

 private:
  void publish(std::shared_ptr<const HealthSnapshot> snapshot);

  const model::DeviceId device_;

  mutable std::mutex tick_mutex_;
  history::HistoryBuffer history_;
  alerts::AlertEngine alerts_;
  std::uint64_t ticks_{0};
  std::optional<std::uint64_t> first_timestamp_ns_{};
  std::optional<std::uint64_t> last_timestamp_ns_{};
  std::uint64_t out_of_range_total_{0};
  bool stale_{false};
  std::deque<alerts::AlertTransition> recent_alerts_{};

  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const HealthSnapshot> snapshot_{};
};

}  // namespace gpu_health::session
