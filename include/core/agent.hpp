#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/settings.hpp"
#include "model/agent_health.hpp"
#include "sensors/gpu/gpu.hpp"
#include "session/device_registry.hpp"
#include "sinks/notification_gate.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"

namespace gpu_health::core {

struct AgentStats {
  std::size_t ticks_executed{0};
  std::size_t samples_ingested{0};
  std::size_t source_failures{0};
  std::size_t sink_cycles{0};
  std::size_t config_reloads{0};
};

class Agent {
 public:
  // `config_path` enables hot reload of thresholds and tuning; empty disables it.
  explicit Agent(AgentConfig config = {}, std::string config_path = {});
  Agent(AgentConfig config, std::unique_ptr<sensors::gpu::SampleSource> source, std::string config_path = {});

  // Zero ticks means run until `stop` becomes true.
  AgentStats run_for_ticks(std::size_t total_ticks, const std::atomic<bool>* stop = nullptr);

  // Re-reads the config file when its modification time changed. Keeps the current
  // settings and returns false when the new file does not parse or validate.
  bool reload_config_if_changed();

  [[nodiscard]] const session::DeviceRegistry& registry() const noexcept { return registry_; }
  [[nodiscard]] session::DeviceRegistry& registry() noexcept { return registry_; }
  [[nodiscard]] const SettingsStore& settings() const noexcept { return settings_; }
  [[nodiscard]] const model::AgentHealth& health() const noexcept { return health_; }

 private:
  void collect_and_tick(AgentStats& stats);
  void sweep_stale();
  void publish_sinks(AgentStats& stats);
  void update_agent_health(float actual_period_ms, float compute_time_ms);

  AgentConfig config_;
  std::string config_path_;
  std::optional<std::filesystem::file_time_type> config_mtime_{};

  std::chrono::milliseconds tick_interval_{};
  std::chrono::steady_clock::time_point next_wakeup_{};
  bool first_tick_{true};
  std::optional<std::chrono::steady_clock::time_point> previous_cycle_start_{};
  std::uint64_t tick_counter_{0};

  SettingsStore settings_;
  session::DeviceRegistry registry_;
  std::unique_ptr<sensors::gpu::SampleSource> source_{};
  std::vector<bool> source_ok_{};
  model::AgentHealth health_{};

  sinks::StdoutDebugSink stdout_sink_{};
  std::unique_ptr<sinks::RedisTsSink> redis_sink_{};
  bool redis_was_ok_{true};
  std::unique_ptr<sinks::NotificationGate> notification_gate_{};
};

}  // namespace gpu_health::core
