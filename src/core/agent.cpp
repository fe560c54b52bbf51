#include "core/agent.hpp"

#include <cmath>
#include <exception>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "core/timestamp.hpp"

namespace gpu_health::core {
namespace {

std::unique_ptr<sensors::gpu::SampleSource> make_source(const AgentConfig& config) {
  if (config.gpu_source == SampleSourceKind::SIMULATED) {
    std::cerr << "[agent] using simulated GPU source\n";
    return sensors::gpu::make_simulated_source();
  }

  auto nvml = sensors::gpu::make_nvml_source(config.gpu_devices);
  if (nvml != nullptr && nvml->available()) {
    std::cerr << "[agent] detected NVML GPU source\n";
    return nvml;
  }

  if (config.gpu_source == SampleSourceKind::NVML) {
    std::cerr << "[agent] NVML GPU source unavailable; samples will be missing until it appears\n";
    return nvml;
  }

  std::cerr << "[agent] NVML GPU source unavailable; falling back to simulated source\n";
  return sensors::gpu::make_simulated_source();
}

std::optional<std::filesystem::file_time_type> modification_time(const std::string& path) {
  std::error_code ec;
  const auto mtime = std::filesystem::last_write_time(path, ec);
  if (ec) {
    return std::nullopt;
  }
  return mtime;
}

}  // namespace

Agent::Agent(AgentConfig config, std::string config_path)
    : Agent(config, make_source(config), std::move(config_path)) {}

Agent::Agent(AgentConfig config, std::unique_ptr<sensors::gpu::SampleSource> source, std::string config_path)
    : config_(std::move(config)),
      config_path_(std::move(config_path)),
      tick_interval_(config_.tick_interval),
      settings_(config_.health),
      registry_(settings_, config_.history_capacity),
      source_(std::move(source)),
      source_ok_(config_.gpu_devices.size(), true),
      stdout_sink_(config_.stdout_format) {
  if (!config_path_.empty()) {
    config_mtime_ = modification_time(config_path_);
  }

  if (config_.notifications.enabled) {
    notification_gate_ = std::make_unique<sinks::NotificationGate>(config_.notifications);
    sinks::NotificationGate* gate = notification_gate_.get();
    registry_.set_alert_listener(
        [gate](const alerts::AlertTransition& transition) { gate->offer(transition, transition.alert.last_seen_ns); });
  }

  if (config_.redis.enabled) {
    sinks::RedisTsOptions options{};
    options.host = config_.redis.host;
    options.port = config_.redis.port;
    options.unix_socket = config_.redis.unix_socket;
    options.key_prefix = config_.redis.key_prefix;
    redis_sink_ = std::make_unique<sinks::RedisTsSink>(options);

    const std::string address =
        !options.unix_socket.empty() ? "unix://" + options.unix_socket : options.host + ':' + std::to_string(options.port);
    if (redis_sink_->check_connectivity()) {
      std::cerr << "[agent] redis connectivity confirmed at " << address << '\n';
    } else {
      std::cerr << "[agent] redis connectivity check failed at " << address << '\n';
    }
  }
}

AgentStats Agent::run_for_ticks(const std::size_t total_ticks, const std::atomic<bool>* stop) {
  AgentStats stats{};

  if (first_tick_) {
    next_wakeup_ = std::chrono::steady_clock::now();
    first_tick_ = false;
  }

  for (std::size_t i = 0; total_ticks == 0 || i < total_ticks; ++i) {
    if (stop != nullptr && stop->load()) {
      break;
    }

    const auto cycle_start = std::chrono::steady_clock::now();

    collect_and_tick(stats);
    sweep_stale();
    publish_sinks(stats);

    ++tick_counter_;
    if (config_.reload_every_ticks > 0 && tick_counter_ % config_.reload_every_ticks == 0 &&
        reload_config_if_changed()) {
      ++stats.config_reloads;
    }

    const auto cycle_end = std::chrono::steady_clock::now();
    const auto actual_period_ms = previous_cycle_start_.has_value()
                                      ? std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(cycle_start - *previous_cycle_start_).count()
                                      : 0.0F;
    const auto compute_ms = std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(cycle_end - cycle_start).count();
    update_agent_health(actual_period_ms, compute_ms);
    previous_cycle_start_ = cycle_start;

    ++stats.ticks_executed;

    next_wakeup_ += tick_interval_;
    std::this_thread::sleep_until(next_wakeup_);
  }

  return stats;
}

bool Agent::reload_config_if_changed() {
  if (config_path_.empty()) {
    return false;
  }

  const auto mtime = modification_time(config_path_);
  if (!mtime.has_value() || mtime == config_mtime_) {
    return false;
  }
  config_mtime_ = mtime;

  try {
    AgentConfig reloaded = load_agent_config(config_path_);
    settings_.replace(reloaded.health);
    std::cerr << "[config] reloaded thresholds from " << config_path_ << " (generation " << settings_.generation()
              << ")\n";
    if (reloaded.tick_interval != config_.tick_interval || reloaded.gpu_devices != config_.gpu_devices ||
        reloaded.history_capacity != config_.history_capacity) {
      std::cerr << "[config] tick interval, device list and history capacity changes apply on restart\n";
    }
    config_.health = reloaded.health;
    return true;
  } catch (const std::exception& ex) {
    std::cerr << "[config] reload failed, keeping previous settings: " << ex.what() << '\n';
    return false;
  }
}

void Agent::collect_and_tick(AgentStats& stats) {
  health_.source_failures = 0;

  for (std::size_t i = 0; i < config_.gpu_devices.size(); ++i) {
    const model::DeviceId device = config_.gpu_devices[i];
    model::MetricSample sample{};
    const bool ok = source_ != nullptr && source_->collect(device, sample);

    if (ok != source_ok_[i]) {
      std::cerr << "[agent] gpu" << device << (ok ? " sampling recovered" : " sampling failed") << '\n';
      source_ok_[i] = ok;
    }
    if (!ok) {
      ++health_.source_failures;
      ++stats.source_failures;
      continue;
    }

    registry_.tick(device, sample);
    ++stats.samples_ingested;
  }
  health_.devices_tracked = static_cast<std::uint32_t>(registry_.devices().size());
}

void Agent::sweep_stale() {
  const std::uint64_t stale_after_ns =
      static_cast<std::uint64_t>(config_.stale_after_intervals) * to_ns(tick_interval_);
  for (const model::DeviceId device : registry_.sweep_stale(unix_timestamp_now_ns(), stale_after_ns)) {
    std::cerr << "[agent] gpu" << device << " marked stale after " << config_.stale_after_intervals
              << " missed intervals\n";
  }
}

void Agent::publish_sinks(AgentStats& stats) {
  ++stats.sink_cycles;
  health_.redis_errors = 0;

  std::vector<std::shared_ptr<const session::HealthSnapshot>> snapshots;
  for (const model::DeviceId device : registry_.devices()) {
    if (auto snapshot = registry_.snapshot(device)) {
      snapshots.push_back(std::move(snapshot));
    }
  }

  if (config_.stdout_debug) {
    for (const auto& snapshot : snapshots) {
      stdout_sink_.publish(*snapshot);
    }
  }

  if (redis_sink_ != nullptr) {
    const bool ok = redis_sink_->publish(snapshots, health_);
    if (!ok) {
      ++health_.redis_errors;
      if (redis_was_ok_) {
        std::cerr << "[redis] publish failed\n";
        redis_was_ok_ = false;
      }
    } else if (!redis_was_ok_) {
      std::cerr << "[redis] publish recovered\n";
      redis_was_ok_ = true;
    }
  }
}

void Agent::update_agent_health(const float actual_period_ms, const float compute_time_ms) {
  const auto tick_ms = std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(tick_interval_).count();

  health_.loop_jitter_ms = actual_period_ms > 0.0F ? std::fabs(actual_period_ms - tick_ms) : 0.0F;
  health_.compute_time_ms = compute_time_ms;
  health_.heartbeat_ms = unix_timestamp_now_ns() / 1'000'000ULL;
  if (compute_time_ms > tick_ms) {
    ++health_.missed_cycles;
  }
}

}  // namespace gpu_health::core
