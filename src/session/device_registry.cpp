#include "session/device_registry.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace gpu_health::session {

UnknownDevice::UnknownDevice(const model::DeviceId device)
    : std::runtime_error("unknown device: " + std::to_string(device)), device_(device) {}

DeviceRegistry::DeviceRegistry(const core::SettingsStore& settings, const std::size_t history_capacity)
    : settings_(settings), history_capacity_(history_capacity) {}

std::shared_ptr<const HealthSnapshot> DeviceRegistry::tick(const model::DeviceId device,
                                                           const model::MetricSample& sample) {
  // Settings are read exactly once per tick.
  const std::shared_ptr<const core::HealthSettings> settings = settings_.current();

  DeviceSession& session = find_or_create(device);
  auto snapshot = session.tick(sample, *settings);

  {
    std::lock_guard<std::mutex> lock(selection_mutex_);
    if (!selected_.has_value()) {
      selected_ = device;
    }
  }

  if (alert_listener_) {
    for (const auto& transition : snapshot->transitions) {
      alert_listener_(transition);
    }
  }

  return snapshot;
}

void DeviceRegistry::select(const model::DeviceId device) {
  if (find(device) == nullptr) {
    throw UnknownDevice(device);
  }
  std::lock_guard<std::mutex> lock(selection_mutex_);
  selected_ = device;
}

std::optional<model::DeviceId> DeviceRegistry::selected() const {
  std::lock_guard<std::mutex> lock(selection_mutex_);
  return selected_;
}

std::shared_ptr<const HealthSnapshot> DeviceRegistry::snapshot(const model::DeviceId device) const {
  const DeviceSession* session = find(device);
  if (session == nullptr) {
    throw UnknownDevice(device);
  }
  return session->snapshot();
}

std::shared_ptr<const HealthSnapshot> DeviceRegistry::selected_snapshot() const {
  const auto device = selected();
  if (!device.has_value()) {
    return nullptr;
  }
  return snapshot(*device);
}

std::vector<model::MetricSample> DeviceRegistry::history(const model::DeviceId device) const {
  const DeviceSession* session = find(device);
  if (session == nullptr) {
    throw UnknownDevice(device);
  }
  return session->history();
}

std::vector<history::MetricPoint> DeviceRegistry::window(const model::DeviceId device, const history::Metric metric,
                                                         const history::WindowSpec spec) const {
  const DeviceSession* session = find(device);
  if (session == nullptr) {
    return {};
  }
  return session->window(metric, spec);
}

std::vector<alerts::AlertTransition> DeviceRegistry::recent_alerts(const model::DeviceId device,
                                                                    const std::size_t limit) const {
  const DeviceSession* session = find(device);
  if (session == nullptr) {
    throw UnknownDevice(device);
  }
  return session->recent_alerts(limit);
}

std::vector<model::DeviceId> DeviceRegistry::devices() const {
  std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
  std::vector<model::DeviceId> out;
  out.reserve(sessions_.size());
  for (const auto& [device, _] : sessions_) {
    out.push_back(device);
  }
  return out;
}

std::vector<model::DeviceId> DeviceRegistry::sweep_stale(const std::uint64_t now_ns, const std::uint64_t stale_after_ns) {
  std::vector<model::DeviceId> newly_stale;
  std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
  for (const auto& [device, session] : sessions_) {
    if (session->mark_stale_if_idle(now_ns, stale_after_ns) != nullptr) {
      newly_stale.push_back(device);
    }
  }
  return newly_stale;
}

void DeviceRegistry::set_alert_listener(AlertListener listener) { alert_listener_ = std::move(listener); }

DeviceSession* DeviceRegistry::find(const model::DeviceId device) const {
  std::shared_lock<std::shared_mutex> lock(sessions_mutex_);
  const auto it = sessions_.find(device);
  return it == sessions_.end() ? nullptr : it->second.get();
}

DeviceSession& DeviceRegistry::find_or_create(const model::DeviceId device) {
  if (DeviceSession* existing = find(device)) {
    return *existing;
  }

  std::unique_lock<std::shared_mutex> lock(sessions_mutex_);
  auto& slot = sessions_[device];
  if (slot == nullptr) {
    slot = std::make_unique<DeviceSession>(device, history_capacity_);
    std::cerr << "[registry] tracking device " << device << " (history capacity " << history_capacity_ << ")\n";
  }
  return *slot;
}

}  // namespace gpu_health::session
