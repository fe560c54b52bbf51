#include <atomic>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <thread>
#include <vector>

#include "alerts/alert_engine.hpp"
#include "core/settings.hpp"
#include "history/history_buffer.hpp"
#include "model/metric_sample.hpp"
#include "scoring/health_scorer.hpp"
#include "session/device_registry.hpp"

using gpu_health::alerts::AlertCategory;
using gpu_health::alerts::AlertSeverity;
using gpu_health::alerts::AlertTransition;
using gpu_health::alerts::TransitionKind;
using gpu_health::core::HealthSettings;
using gpu_health::core::SettingsStore;
using gpu_health::history::Metric;
using gpu_health::history::WindowSpec;
using gpu_health::model::DeviceId;
using gpu_health::model::MetricSample;
using gpu_health::scoring::HealthStatus;
using gpu_health::session::DeviceRegistry;
using gpu_health::session::DiagnosticKind;
using gpu_health::session::UnknownDevice;

namespace {

constexpr std::uint64_t kSecond = 1'000'000'000ULL;

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

MetricSample sample_at(const std::uint64_t second, const float temperature_c) {
  MetricSample sample{};
  sample.timestamp_ns = second * kSecond;
  sample.utilization_pct = 60.0F;
  sample.memory_total = 1000;
  sample.memory_used = 300;
  sample.temperature_c = temperature_c;
  sample.power_watts = 100.0F;
  sample.power_limit_watts = 250.0F;
  return sample;
}

// Five minutes at 1 Hz: temperature climbs 40 -> 95 C and power load 40% -> 95%.
int test_thermal_ramp_scenario() {
  constexpr std::size_t kSamples = 300;
  SettingsStore settings;
  DeviceRegistry registry(settings);

  std::vector<AlertTransition> temperature_transitions;
  std::vector<std::size_t> transition_ticks;
  std::size_t current_tick = 0;
  registry.set_alert_listener([&](const AlertTransition& transition) {
    if (transition.alert.category == AlertCategory::TEMPERATURE) {
      temperature_transitions.push_back(transition);
      transition_ticks.push_back(current_tick);
    }
  });

  std::vector<float> temperatures(kSamples);
  std::size_t first_warn = kSamples;
  std::size_t first_crit = kSamples;
  std::size_t samples_at_or_above_warn = 0;
  for (std::size_t i = 0; i < kSamples; ++i) {
    const float progress = static_cast<float>(i) / static_cast<float>(kSamples - 1);
    temperatures[i] = 40.0F + (55.0F * progress);
    if (temperatures[i] >= 80.0F) {
      ++samples_at_or_above_warn;
      if (first_warn == kSamples) first_warn = i;
    }
    if (temperatures[i] >= 90.0F && first_crit == kSamples) {
      first_crit = i;
    }
  }

  int previous_score = 101;
  for (std::size_t i = 0; i < kSamples; ++i) {
    current_tick = i;
    const float progress = static_cast<float>(i) / static_cast<float>(kSamples - 1);

    MetricSample sample{};
    sample.timestamp_ns = (i + 1) * kSecond;
    sample.utilization_pct = 80.0F;
    sample.memory_total = 1000;
    sample.memory_used = 250;
    sample.temperature_c = temperatures[i];
    sample.power_limit_watts = 200.0F;
    sample.power_watts = 200.0F * (0.40F + (0.55F * progress));

    const auto snapshot = registry.tick(3, sample);
    if (snapshot == nullptr || snapshot->tick != i + 1) {
      return fail("test_thermal_ramp_scenario", "every tick should publish a snapshot");
    }
    if (i == 0 && (snapshot->health_score.overall != 100 || snapshot->status != HealthStatus::EXCELLENT)) {
      return fail("test_thermal_ramp_scenario", "ramp should start excellent");
    }
    if (snapshot->health_score.overall > previous_score) {
      return fail("test_thermal_ramp_scenario", "score must not improve while every metric worsens");
    }
    previous_score = snapshot->health_score.overall;
  }

  if (temperature_transitions.size() != 2 || transition_ticks.size() != 2) {
    return fail("test_thermal_ramp_scenario", "expected exactly a raise and an escalation for temperature");
  }
  if (temperature_transitions[0].kind != TransitionKind::RAISED ||
      temperature_transitions[0].alert.severity != AlertSeverity::WARNING || transition_ticks[0] != first_warn) {
    return fail("test_thermal_ramp_scenario", "warning should be raised on the first sample at 80 C");
  }
  if (temperature_transitions[1].kind != TransitionKind::ESCALATED ||
      temperature_transitions[1].alert.severity != AlertSeverity::CRITICAL || transition_ticks[1] != first_crit ||
      temperature_transitions[1].alert.id != temperature_transitions[0].alert.id) {
    return fail("test_thermal_ramp_scenario", "the same alert should escalate on the first sample at 90 C");
  }

  const auto last = registry.snapshot(3);
  if (last->health_score.overall != 30 || last->status != HealthStatus::CRITICAL) {
    return fail("test_thermal_ramp_scenario", "ramp should end critical with only memory healthy");
  }
  if (std::fabs(last->trends.seconds_above_temp_warn - static_cast<double>(samples_at_or_above_warn)) > 1e-6) {
    return fail("test_thermal_ramp_scenario", "time above warn should equal the hot samples at 1 Hz");
  }
  if (std::fabs(last->trends.temperature_change_c - 55.0) > 1e-3 || last->history_size != kSamples) {
    return fail("test_thermal_ramp_scenario", "trend over the full window mismatch");
  }
  if (std::fabs(last->uptime_seconds - 299.0) > 1e-9) {
    return fail("test_thermal_ramp_scenario", "uptime should span first to last sample");
  }

  return 0;
}

int test_unknown_device_queries() {
  SettingsStore settings;
  DeviceRegistry registry(settings);

  if (registry.selected_snapshot() != nullptr || registry.selected().has_value() || !registry.devices().empty()) {
    return fail("test_unknown_device_queries", "empty registry should have no selection");
  }

  bool snapshot_threw = false;
  try {
    (void)registry.snapshot(7);
  } catch (const UnknownDevice& ex) {
    snapshot_threw = ex.device() == 7;
  }

  bool select_threw = false;
  try {
    registry.select(7);
  } catch (const UnknownDevice&) {
    select_threw = true;
  }

  bool history_threw = false;
  try {
    (void)registry.history(7);
  } catch (const UnknownDevice&) {
    history_threw = true;
  }

  bool alerts_threw = false;
  try {
    (void)registry.recent_alerts(7);
  } catch (const UnknownDevice&) {
    alerts_threw = true;
  }

  if (!snapshot_threw || !select_threw || !history_threw || !alerts_threw) {
    return fail("test_unknown_device_queries", "unknown device should throw for snapshot, select, history and alerts");
  }
  if (!registry.window(7, Metric::TEMPERATURE).empty()) {
    return fail("test_unknown_device_queries", "window of an unknown device should be empty");
  }

  return 0;
}

// Sixty short overheating episodes: each raises and clears one temperature alert.
int test_recent_alerts_are_bounded() {
  SettingsStore settings;
  DeviceRegistry registry(settings);

  std::uint64_t second = 0;
  for (int episode = 0; episode < 60; ++episode) {
    registry.tick(0, sample_at(++second, 85.0F));
    for (int i = 0; i < 3; ++i) {
      registry.tick(0, sample_at(++second, 70.0F));
    }
  }

  const auto latest = registry.recent_alerts(0);
  if (latest.size() != 10) {
    return fail("test_recent_alerts_are_bounded", "default limit should return ten entries");
  }
  if (latest[0].kind != TransitionKind::CLEARED || latest[1].kind != TransitionKind::RAISED ||
      latest[0].alert.id != 60 || latest[1].alert.id != 60 || latest[2].alert.id != 59) {
    return fail("test_recent_alerts_are_bounded", "entries should be newest first");
  }

  const auto all = registry.recent_alerts(0, 1000);
  if (all.size() != gpu_health::session::DeviceSession::kRecentAlertCapacity) {
    return fail("test_recent_alerts_are_bounded", "log should keep only the newest hundred transitions");
  }
  if (all.back().kind != TransitionKind::RAISED || all.back().alert.id != 11 ||
      all.back().alert.category != AlertCategory::TEMPERATURE) {
    return fail("test_recent_alerts_are_bounded", "oldest episodes should have been evicted");
  }

  if (!registry.snapshot(0)->active_alerts.empty() || !registry.recent_alerts(0, 0).empty()) {
    return fail("test_recent_alerts_are_bounded", "cleared alerts live only in the recent log");
  }

  return 0;
}

int test_selection_follows_first_device_until_changed() {
  SettingsStore settings;
  DeviceRegistry registry(settings);

  registry.tick(2, sample_at(1, 60.0F));
  registry.tick(0, sample_at(1, 70.0F));

  if (!registry.selected().has_value() || *registry.selected() != 2) {
    return fail("test_selection_follows_first_device_until_changed", "first ticking device should be selected");
  }
  const auto devices = registry.devices();
  if (devices.size() != 2 || devices[0] != 0 || devices[1] != 2) {
    return fail("test_selection_follows_first_device_until_changed", "devices should be listed in id order");
  }

  registry.select(0);
  const auto selected = registry.selected_snapshot();
  if (selected == nullptr || selected->device != 0 || selected->sample.temperature_c != 70.0F) {
    return fail("test_selection_follows_first_device_until_changed", "selected snapshot should follow select()");
  }

  const auto history = registry.history(2);
  const auto points = registry.window(2, Metric::TEMPERATURE, WindowSpec::last_samples(5));
  if (history.size() != 1 || points.size() != 1 || points.front().value != 60.0) {
    return fail("test_selection_follows_first_device_until_changed", "per-device history should be isolated");
  }

  return 0;
}

int test_out_of_range_samples_are_clamped() {
  SettingsStore settings;
  DeviceRegistry registry(settings);

  registry.tick(0, sample_at(10, 60.0F));

  MetricSample bad = sample_at(11, std::numeric_limits<float>::quiet_NaN());
  bad.utilization_pct = 130.0F;
  bad.memory_used = 1200;
  const auto first = registry.tick(0, bad);
  if (first->diagnostics.size() != 3 || first->out_of_range_total != 3) {
    return fail("test_out_of_range_samples_are_clamped", "each adjusted field should produce one diagnostic");
  }
  if (first->sample.utilization_pct != 100.0F || first->sample.temperature_c != 0.0F ||
      first->sample.memory_used != 1000) {
    return fail("test_out_of_range_samples_are_clamped", "fields should be clamped to their valid range");
  }
  for (const auto& diagnostic : first->diagnostics) {
    if (diagnostic.kind != DiagnosticKind::OUT_OF_RANGE_SAMPLE) {
      return fail("test_out_of_range_samples_are_clamped", "unexpected diagnostic kind");
    }
  }

  const auto backwards = registry.tick(0, sample_at(5, 60.0F));
  if (backwards->diagnostics.size() != 1 || backwards->diagnostics.front().field != "timestamp_ns" ||
      backwards->sample.timestamp_ns != 11 * kSecond || backwards->out_of_range_total != 4) {
    return fail("test_out_of_range_samples_are_clamped", "timestamps must never move backwards");
  }

  const auto clean = registry.tick(0, sample_at(12, 60.0F));
  if (!clean->diagnostics.empty() || clean->out_of_range_total != 4) {
    return fail("test_out_of_range_samples_are_clamped", "clean sample should not add diagnostics");
  }

  MetricSample no_limit = sample_at(13, 60.0F);
  no_limit.power_limit_watts = 0.0F;
  no_limit.power_watts = 50.0F;
  const auto fallback = registry.tick(0, no_limit);
  if (fallback->sample.power_limit_watts != 100.0F || !fallback->diagnostics.empty()) {
    return fail("test_out_of_range_samples_are_clamped", "missing power limit should use the fallback silently");
  }

  return 0;
}

int test_stale_sweep_and_recovery() {
  SettingsStore settings;
  DeviceRegistry registry(settings);
  for (std::uint64_t s = 1; s <= 5; ++s) {
    registry.tick(1, sample_at(s, 60.0F));
  }

  if (!registry.sweep_stale(6 * kSecond, 5 * kSecond).empty()) {
    return fail("test_stale_sweep_and_recovery", "recent device must not be stale");
  }

  const auto stale = registry.sweep_stale(20 * kSecond, 5 * kSecond);
  if (stale.size() != 1 || stale.front() != 1) {
    return fail("test_stale_sweep_and_recovery", "idle device should be flagged");
  }
  const auto flagged = registry.snapshot(1);
  if (!flagged->stale || flagged->diagnostics.empty() ||
      flagged->diagnostics.back().kind != DiagnosticKind::STALE_DEVICE || flagged->tick != 5) {
    return fail("test_stale_sweep_and_recovery", "stale snapshot should keep the last values with a diagnostic");
  }
  if (!registry.sweep_stale(30 * kSecond, 5 * kSecond).empty()) {
    return fail("test_stale_sweep_and_recovery", "stale transition should be reported once");
  }

  const auto fresh = registry.tick(1, sample_at(31, 60.0F));
  if (fresh->stale || fresh->tick != 6 || std::fabs(fresh->uptime_seconds - 30.0) > 1e-9) {
    return fail("test_stale_sweep_and_recovery", "a new sample should clear the stale flag");
  }

  return 0;
}

int test_settings_replacement_applies_on_next_tick() {
  SettingsStore settings;
  DeviceRegistry registry(settings);
  std::size_t raised = 0;
  registry.set_alert_listener([&](const AlertTransition& transition) {
    if (transition.kind == TransitionKind::RAISED) {
      ++raised;
    }
  });

  registry.tick(0, sample_at(1, 75.0F));
  if (raised != 0 || settings.generation() != 0) {
    return fail("test_settings_replacement_applies_on_next_tick", "75 C is below the default warn threshold");
  }

  HealthSettings strict{};
  strict.scoring.temp_baseline = 50.0F;
  strict.thresholds.temp_warn = 70.0F;
  strict.thresholds.temp_crit = 85.0F;
  gpu_health::core::validate_settings(strict);
  settings.replace(strict);

  const auto snapshot = registry.tick(0, sample_at(2, 75.0F));
  if (raised != 1 || settings.generation() != 1 || snapshot->active_alerts.size() != 1 ||
      snapshot->active_alerts.front().threshold != 70.0) {
    return fail("test_settings_replacement_applies_on_next_tick", "new thresholds should apply from the next tick");
  }

  return 0;
}

int test_concurrent_devices() {
  constexpr DeviceId kDevices = 4;
  constexpr std::uint64_t kTicks = 500;
  SettingsStore settings;
  DeviceRegistry registry(settings);

  std::atomic<bool> done{false};
  std::atomic<bool> reader_failed{false};
  std::thread reader([&] {
    while (!done.load()) {
      for (const DeviceId device : registry.devices()) {
        const auto snapshot = registry.snapshot(device);
        // A session is listed before its first snapshot is published.
        if (snapshot != nullptr && (snapshot->device != device || snapshot->history_size > 300)) {
          reader_failed.store(true);
        }
        const auto points = registry.window(device, Metric::POWER, WindowSpec::last_samples(10));
        if (points.size() > 10) {
          reader_failed.store(true);
        }
      }
      (void)registry.selected_snapshot();
      if (reader_failed.load()) {
        return;
      }
    }
  });

  std::vector<std::thread> writers;
  for (DeviceId device = 0; device < kDevices; ++device) {
    writers.emplace_back([&registry, device] {
      for (std::uint64_t s = 1; s <= kTicks; ++s) {
        MetricSample sample = sample_at(s, 50.0F + static_cast<float>(device));
        sample.power_watts = 100.0F + static_cast<float>(s % 7);
        registry.tick(device, sample);
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }
  done.store(true);
  reader.join();

  if (reader_failed.load()) {
    return fail("test_concurrent_devices", "reader observed an inconsistent snapshot");
  }
  if (registry.devices().size() != kDevices) {
    return fail("test_concurrent_devices", "every device should have a session");
  }
  for (DeviceId device = 0; device < kDevices; ++device) {
    const auto snapshot = registry.snapshot(device);
    if (snapshot->tick != kTicks || snapshot->history_size != 300 || registry.history(device).size() != 300) {
      return fail("test_concurrent_devices", "each device should see all of its own ticks");
    }
    if (snapshot->sample.temperature_c != 50.0F + static_cast<float>(device)) {
      return fail("test_concurrent_devices", "device histories must not mix");
    }
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_thermal_ramp_scenario(); rc != 0) return rc;
  if (int rc = test_unknown_device_queries(); rc != 0) return rc;
  if (int rc = test_recent_alerts_are_bounded(); rc != 0) return rc;
  if (int rc = test_selection_follows_first_device_until_changed(); rc != 0) return rc;
  if (int rc = test_out_of_range_samples_are_clamped(); rc != 0) return rc;
  if (int rc = test_stale_sweep_and_recovery(); rc != 0) return rc;
  if (int rc = test_settings_replacement_applies_on_next_tick(); rc != 0) return rc;
  if (int rc = test_concurrent_devices(); rc != 0) return rc;

  std::cout << "[PASS] registry unit tests\n";
  return 0;
}
