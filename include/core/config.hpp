#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "core/settings.hpp"

namespace gpu_health::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string key_prefix{"gpu_health"};
  bool enabled{false};
};

struct NotificationConfig {
  bool enabled{true};
  std::chrono::seconds min_interval{10};
};

enum class SampleSourceKind : std::uint8_t {
  AUTO = 0,
  NVML = 1,
  SIMULATED = 2,
};

enum class StdoutFormat : std::uint8_t {
  TEXT = 0,
  JSON = 1,
};

struct AgentConfig {
  std::chrono::milliseconds tick_interval{1000};
  std::size_t history_capacity{300};
  std::vector<std::uint32_t> gpu_devices{0};
  SampleSourceKind gpu_source{SampleSourceKind::AUTO};
  HealthSettings health{};
  std::uint32_t stale_after_intervals{5};
  std::uint32_t reload_every_ticks{5};
  bool stdout_debug{true};
  StdoutFormat stdout_format{StdoutFormat::TEXT};
  NotificationConfig notifications{};
  RedisConfig redis{};
};

// Throws std::runtime_error on unreadable files, malformed values and inconsistent thresholds.
AgentConfig load_agent_config(const std::string& path);

// Same grammar as the file loader, for in-memory documents.
AgentConfig parse_agent_config(const std::string& text);

const char* source_kind_name(SampleSourceKind kind) noexcept;

}  // namespace gpu_health::core
