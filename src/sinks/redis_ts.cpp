#include "sinks/redis_ts.hpp"

#include "core/timestamp.hpp"
#include "history/history_buffer.hpp"

#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace gpu_health::sinks {
namespace {

double sanitize_value(const double value) { return std::isfinite(value) ? value : 0.0; }

void add_metric_args(std::vector<std::string>& args, const std::string& key, const std::uint64_t timestamp_ms,
                     const double value) {
  args.emplace_back(key);
  args.emplace_back(std::to_string(timestamp_ms));
  args.emplace_back(std::to_string(sanitize_value(value)));
}

std::string agent_series_key(const std::string& prefix, const std::string& suffix) {
  return prefix + ":agent:" + suffix;
}

}  // namespace

const std::vector<std::string>& device_metric_suffixes() {
  static const std::vector<std::string> kSuffixes = {
      "health:score",
      "health:temperature",
      "health:power",
      "health:memory",
      "raw:utilization_pct",
      "raw:memory_usage_pct",
      "raw:temperature_c",
      "raw:power_watts",
      "raw:power_load_pct",
      "raw:fan_pct",
      "raw:core_clock_mhz",
      "raw:throttled",
      "memory:fragmentation_pressure",
      "memory:leak_suspected",
      "alerts:active",
  };
  return kSuffixes;
}

const std::vector<std::string>& agent_metric_suffixes() {
  static const std::vector<std::string> kSuffixes = {
      "heartbeat",     "loop_jitter",     "compute_time",  "redis_latency",
      "redis_errors",  "source_failures", "missed_cycles", "devices",
  };
  return kSuffixes;
}

std::string device_series_key(const std::string& prefix, const model::DeviceId device, const std::string& suffix) {
  return prefix + ":gpu" + std::to_string(device) + ":" + suffix;
}

RedisTsSink::RedisTsSink(RedisTsOptions options) : options_(std::move(options)) {}

RedisTsSink::~RedisTsSink() = default;

RedisTsSink::RedisTsSink(RedisTsSink&&) noexcept = default;
RedisTsSink& RedisTsSink::operator=(RedisTsSink&&) noexcept = default;

bool RedisTsSink::check_connectivity() {
  return ensure_connected();
}

void RedisTsSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisTsSink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }

  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisTsSink::reconnect() {
  context_.reset();
  agent_schema_ready_ = false;
  device_schema_ready_.clear();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db() || !ensure_agent_schema()) {
    context_.reset();
    return false;
  }

  return true;
}

bool RedisTsSink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] AUTH rejected\n";
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

bool RedisTsSink::create_series(const std::string& key) {
  redisReply* reply =
      static_cast<redisReply*>(redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST", key.c_str()));
  if (reply == nullptr) {
    return false;
  }

  const bool already_exists =
      reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "already exists") != nullptr;
  const bool unknown_command =
      reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "unknown command") != nullptr;
  const bool ok = reply->type != REDIS_REPLY_ERROR || already_exists;
  const std::string reply_message = reply->str != nullptr ? reply->str : "unknown";
  freeReplyObject(reply);

  if (unknown_command) {
    std::cerr << "[redis] RedisTimeSeries module not available (TS.CREATE unknown command)\n";
    timeseries_available_ = false;
    return false;
  }
  if (!ok) {
    std::cerr << "[redis] schema error on TS.CREATE " << key << ": " << reply_message << '\n';
    return false;
  }
  return true;
}

bool RedisTsSink::ensure_agent_schema() {
  if (agent_schema_ready_ || !options_.publish_health) {
    return true;
  }

  for (const auto& suffix : agent_metric_suffixes()) {
    if (!create_series(agent_series_key(options_.key_prefix, suffix))) {
      return false;
    }
  }
  agent_schema_ready_ = true;
  return true;
}

bool RedisTsSink::ensure_device_schema(const model::DeviceId device) {
  if (device_schema_ready_.count(device) != 0) {
    return true;
  }

  for (const auto& suffix : device_metric_suffixes()) {
    if (!create_series(device_series_key(options_.key_prefix, device, suffix))) {
      return false;
    }
  }
  device_schema_ready_.insert(device);
  return true;
}

bool RedisTsSink::publish(const std::vector<std::shared_ptr<const session::HealthSnapshot>>& snapshots,
                          model::AgentHealth& health) {
  if (!ensure_connected()) {
    return false;
  }

  if (publish_impl(snapshots, health)) {
    return true;
  }

  if (!reconnect()) {
    return false;
  }
  return publish_impl(snapshots, health);
}

bool RedisTsSink::publish_impl(const std::vector<std::shared_ptr<const session::HealthSnapshot>>& snapshots,
                               model::AgentHealth& health) {
  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();
  command_args_.emplace_back("TS.MADD");

  for (const auto& snapshot : snapshots) {
    if (snapshot == nullptr) {
      continue;
    }
    if (!ensure_device_schema(snapshot->device)) {
      return false;
    }

    const auto& sample = snapshot->sample;
    const auto& score = snapshot->health_score;
    const std::uint64_t timestamp_ms = sample.timestamp_ns / 1'000'000ULL;

    const auto append_metric = [&](const char* suffix, const double value) {
      add_metric_args(command_args_, device_series_key(options_.key_prefix, snapshot->device, suffix), timestamp_ms,
                      value);
    };

    append_metric("health:score", static_cast<double>(score.overall));
    append_metric("health:temperature", score.temperature_component);
    append_metric("health:power", score.power_component);
    append_metric("health:memory", score.memory_component);
    append_metric("raw:utilization_pct", sample.utilization_pct);
    append_metric("raw:memory_usage_pct", model::memory_usage_pct(sample));
    append_metric("raw:temperature_c", sample.temperature_c);
    append_metric("raw:power_watts", sample.power_watts);
    append_metric("raw:power_load_pct", history::metric_value(sample, history::Metric::POWER_LOAD_PCT));
    append_metric("raw:fan_pct", sample.fan_pct);
    append_metric("raw:core_clock_mhz", sample.core_clock_mhz);
    append_metric("raw:throttled", sample.throttled ? 1.0 : 0.0);
    append_metric("memory:fragmentation_pressure", snapshot->memory_health.fragmentation_pressure);
    append_metric("memory:leak_suspected", snapshot->memory_health.leak_suspected ? 1.0 : 0.0);
    append_metric("alerts:active", static_cast<double>(snapshot->active_alerts.size()));
  }

  if (options_.publish_health) {
    const std::uint64_t now_ms = core::unix_timestamp_now_ns() / 1'000'000ULL;
    const auto append_agent = [&](const char* suffix, const double value) {
      add_metric_args(command_args_, agent_series_key(options_.key_prefix, suffix), now_ms, value);
    };

    append_agent("heartbeat", static_cast<double>(health.heartbeat_ms));
    append_agent("loop_jitter", health.loop_jitter_ms);
    append_agent("compute_time", health.compute_time_ms);
    append_agent("redis_latency", health.redis_latency_ms);
    append_agent("redis_errors", static_cast<double>(health.redis_errors));
    append_agent("source_failures", static_cast<double>(health.source_failures));
    append_agent("missed_cycles", static_cast<double>(health.missed_cycles));
    append_agent("devices", static_cast<double>(health.devices_tracked));
  }

  if (command_args_.size() == 1) {
    return true;
  }

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  const auto publish_start = std::chrono::steady_clock::now();
  redisReply* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(),
                       command_argv_len_.data()));
  const auto publish_end = std::chrono::steady_clock::now();
  health.redis_latency_ms =
      std::chrono::duration_cast<std::chrono::duration<float, std::milli>>(publish_end - publish_start).count();
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

}  // namespace gpu_health::sinks
