#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <vector>

#include "alerts/alert_engine.hpp"
#include "core/settings.hpp"
#include "history/history_buffer.hpp"
#include "model/metric_sample.hpp"
#include "session/device_session.hpp"
#include "session/health_snapshot.hpp"

namespace gpu_health::session {

class UnknownDevice : public std::runtime_error {
 public:
  explicit UnknownDevice(model::DeviceId device);

  [[nodiscard]] model::DeviceId device() const noexcept { return device_; }

 private:
  model::DeviceId device_;
};

// Invoked after a tick completes, once per transition, from the ticking thread.
using AlertListener = std::function<void(const alerts::AlertTransition&)>;

class DeviceRegistry {
 public:
  explicit DeviceRegistry(const core::SettingsStore& settings,
                          std::size_t history_capacity = history::HistoryBuffer::kDefaultCapacity);

  DeviceRegistry(const DeviceRegistry&) = delete;
  DeviceRegistry& operator=(const DeviceRegistry&) = delete;

  // Single ingestion entry point. Creates the session on the first sample of a device.
  // Ticks for different devices may run concurrently.
  std::shared_ptr<const HealthSnapshot> tick(model::DeviceId device, const model::MetricSample& sample);

  // Throws UnknownDevice when the device has not produced a sample yet.
  void select(model::DeviceId device);
  [[nodiscard]] std::optional<model::DeviceId> selected() const;

  // Throws UnknownDevice when the device has not produced a sample yet.
  [[nodiscard]] std::shared_ptr<const HealthSnapshot> snapshot(model::DeviceId device) const;

  // nullptr when no device is selected yet.
  [[nodiscard]] std::shared_ptr<const HealthSnapshot> selected_snapshot() const;

  // Full retained history, oldest first. Throws UnknownDevice.
  [[nodiscard]] std::vector<model::MetricSample> history(model::DeviceId device) const;

  // Empty for unknown devices.
  [[nodiscard]] std::vector<history::MetricPoint> window(model::DeviceId device, history::Metric metric,
                                                         history::WindowSpec spec = history::WindowSpec::all()) const;

  // Latest alert transitions of a device, newest first. Throws UnknownDevice.
  [[nodiscard]] std::vector<alerts::AlertTransition> recent_alerts(model::DeviceId device, std::size_t limit = 10) const;

  [[nodiscard]] std::vector<model::DeviceId> devices() const;

  // Flags every device idle for at least `stale_after_ns`; returns the ones that just became stale.
  std::vector<model::DeviceId> sweep_stale(std::uint64_t now_ns, std::uint64_t stale_after_ns);

  // Must be installed before the first tick.
  void set_alert_listener(AlertListener listener);

  [[nodiscard]] std::size_t history_capacity() const noexcept { return history_capacity_; }

 private:
  DeviceSession* find(model::DeviceId device) const;
  DeviceSession& find_or_create(model::DeviceId device);

  const core::SettingsStore& settings_;
  const std::size_t history_capacity_;

  mutable std::shared_mutex sessions_mutex_;
  std::map<model::DeviceId, std::unique_ptr<DeviceSession>> sessions_;

  mutable std::mutex selection_mutex_;
  std::optional<model::DeviceId> selected_{};

  AlertListener alert_listener_{};
};

}  // namespace gpu_health::session
