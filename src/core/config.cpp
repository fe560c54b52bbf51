#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <istream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace gpu_health::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_lower(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& value) {
  const std::string lower = to_lower(value);
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

float parse_float(const std::string& key, const std::string& value) {
  try {
    std::size_t consumed = 0;
    const float parsed = std::stof(value, &consumed);
    if (consumed != value.size() || !std::isfinite(parsed)) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw std::runtime_error(key + " must be a finite number, got '" + value + "'");
  }
}

long long parse_integer(const std::string& key, const std::string& value, const long long min_value,
                        const long long max_value) {
  long long parsed = 0;
  try {
    std::size_t consumed = 0;
    parsed = std::stoll(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument(value);
    }
  } catch (const std::logic_error&) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }

  if (parsed < min_value || parsed > max_value) {
    throw std::runtime_error(key + " must be in range " + std::to_string(min_value) + ".." + std::to_string(max_value));
  }
  return parsed;
}

std::vector<std::uint32_t> parse_device_list(const std::string& value) {
  std::vector<std::uint32_t> devices;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = trim(item);
    if (item.empty()) {
      continue;
    }
    const auto index = static_cast<std::uint32_t>(parse_integer("gpu.devices", item, 0, 0xFFFFFFFFLL));
    if (std::find(devices.begin(), devices.end(), index) == devices.end()) {
      devices.push_back(index);
    }
  }
  if (devices.empty()) {
    throw std::runtime_error("gpu.devices must list at least one device index");
  }
  return devices;
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  redis.port = static_cast<std::uint16_t>(parse_integer("redis.address port", value.substr(split + 1), 1, 65535));
}

bool apply_threshold(Thresholds& t, const std::string& name, const float value) {
  if (name == "temp_warn") {
    t.temp_warn = value;
  } else if (name == "temp_crit") {
    t.temp_crit = value;
  } else if (name == "power_warn") {
    t.power_warn = value;
  } else if (name == "power_crit") {
    t.power_crit = value;
  } else if (name == "mem_warn") {
    t.mem_warn = value;
  } else if (name == "mem_crit") {
    t.mem_crit = value;
  } else {
    return false;
  }
  return true;
}

bool apply_scoring(ScoringTuning& s, const std::string& name, const float value) {
  if (name == "temp_baseline") {
    s.temp_baseline = value;
  } else if (name == "power_baseline") {
    s.power_baseline = value;
  } else if (name == "mem_baseline") {
    s.mem_baseline = value;
  } else if (name == "fallback_power_limit_w") {
    s.fallback_power_limit_w = value;
  } else if (name == "efficiency_baseline") {
    s.efficiency_baseline = value;
  } else if (name == "efficiency_warn") {
    s.efficiency_warn = value;
  } else if (name == "efficiency_crit") {
    s.efficiency_crit = value;
  } else if (name == "efficiency_idle_floor") {
    s.efficiency_idle_floor_pct = value;
  } else if (name == "leak_penalty") {
    s.leak_penalty = value;
  } else if (name == "fragmentation_weight") {
    s.fragmentation_weight = value;
  } else {
    return false;
  }
  return true;
}

void apply_key_value(AgentConfig& config, const std::string& key, const std::string& value) {
  if (key == "tick_interval_ms") {
    config.tick_interval = std::chrono::milliseconds(parse_integer(key, value, 1, 60000));
    return;
  }

  if (key == "history.capacity") {
    config.history_capacity = static_cast<std::size_t>(parse_integer(key, value, 2, 1'000'000));
    return;
  }

  if (key == "gpu.devices") {
    config.gpu_devices = parse_device_list(value);
    return;
  }

  if (key == "gpu.source") {
    const std::string lower = to_lower(value);
    if (lower == "auto") {
      config.gpu_source = SampleSourceKind::AUTO;
    } else if (lower == "nvml") {
      config.gpu_source = SampleSourceKind::NVML;
    } else if (lower == "simulated") {
      config.gpu_source = SampleSourceKind::SIMULATED;
    } else {
      throw std::runtime_error("gpu.source must be one of auto, nvml, simulated");
    }
    return;
  }

  if (key.rfind("thresholds.", 0) == 0) {
    const std::string name = key.substr(std::string("thresholds.").size());
    if (!apply_threshold(config.health.thresholds, name, parse_float(key, value))) {
      throw std::runtime_error("unknown config key: " + key);
    }
    return;
  }

  if (key.rfind("scoring.", 0) == 0) {
    const std::string name = key.substr(std::string("scoring.").size());
    if (!apply_scoring(config.health.scoring, name, parse_float(key, value))) {
      throw std::runtime_error("unknown config key: " + key);
    }
    return;
  }

  auto& memory = config.health.memory;
  if (key == "memory.leak_ratio") {
    memory.leak_ratio = parse_float(key, value);
    return;
  }
  if (key == "memory.leak_monotonic_fraction") {
    memory.leak_monotonic_fraction = parse_float(key, value);
    return;
  }
  if (key == "memory.leak_min_samples") {
    memory.leak_min_samples = static_cast<std::size_t>(parse_integer(key, value, 0, 1'000'000));
    return;
  }
  if (key == "memory.fragmentation_delta_stddev") {
    memory.fragmentation_delta_stddev = parse_float(key, value);
    return;
  }
  if (key == "memory.fragmentation_usage_floor") {
    memory.fragmentation_usage_floor = parse_float(key, value);
    return;
  }

  auto& alerts = config.health.alerts;
  if (key == "alerts.clear_debounce_ticks") {
    alerts.clear_debounce_ticks = static_cast<std::uint32_t>(parse_integer(key, value, 0, 1'000'000));
    return;
  }
  if (key == "alerts.power_spike_watts") {
    alerts.power_spike_watts = parse_float(key, value);
    return;
  }
  if (key == "alerts.power_spike_lookback") {
    alerts.power_spike_lookback = static_cast<std::size_t>(parse_integer(key, value, 2, 1'000'000));
    return;
  }
  if (key == "alerts.power_spike_count") {
    alerts.power_spike_count = static_cast<std::uint32_t>(parse_integer(key, value, 1, 1'000'000));
    return;
  }

  if (key == "agent.stale_after_intervals") {
    config.stale_after_intervals = static_cast<std::uint32_t>(parse_integer(key, value, 1, 1'000'000));
    return;
  }
  if (key == "agent.reload_every_ticks") {
    config.reload_every_ticks = static_cast<std::uint32_t>(parse_integer(key, value, 0, 1'000'000));
    return;
  }
  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }
  if (key == "agent.stdout_format") {
    const std::string lower = to_lower(value);
    if (lower == "text") {
      config.stdout_format = StdoutFormat::TEXT;
    } else if (lower == "json") {
      config.stdout_format = StdoutFormat::JSON;
    } else {
      throw std::runtime_error("agent.stdout_format must be text or json");
    }
    return;
  }

  if (key == "notifications.enabled") {
    config.notifications.enabled = parse_bool(value);
    return;
  }
  if (key == "notifications.min_interval_s") {
    config.notifications.min_interval = std::chrono::seconds(parse_integer(key, value, 0, 86400));
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }
  if (key == "redis.key_prefix") {
    if (value.empty()) {
      throw std::runtime_error("redis.key_prefix must not be empty");
    }
    config.redis.key_prefix = value;
    return;
  }

  throw std::runtime_error("unknown config key: " + key);
}

AgentConfig parse_stream(std::istream& input) {
  AgentConfig config{};

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    std::string value = trim(stripped.substr(colon_pos + 1));
    const bool quoted = value.size() >= 2 && value.front() == '"' && value.back() == '"';
    if (quoted) {
      value = trim(value.substr(1, value.size() - 2));
    }

    if (depth > sections.size()) {
      throw std::runtime_error("unexpected indentation at key '" + key + "'");
    }
    sections.resize(depth);

    if (value.empty() && !quoted) {
      sections.push_back(key);
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate_settings(config.health);
  return config;
}

}  // namespace

AgentConfig load_agent_config(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }
  return parse_stream(input);
}

AgentConfig parse_agent_config(const std::string& text) {
  std::istringstream input(text);
  return parse_stream(input);
}

const char* source_kind_name(const SampleSourceKind kind) noexcept {
  switch (kind) {
    case SampleSourceKind::AUTO:
      return "auto";
    case SampleSourceKind::NVML:
      return "nvml";
    case SampleSourceKind::SIMULATED:
      return "simulated";
  }
  return "unknown";
}

}  // namespace gpu_health::core
