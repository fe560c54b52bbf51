#pragma once

#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "model/agent_health.hpp"
#include "model/metric_sample.hpp"
#include "session/health_snapshot.hpp"

struct redisContext;

namespace gpu_health::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"gpu_health"};
  std::uint32_t connect_timeout_ms{1000};
  bool publish_health{true};
};

// Per-device series suffixes, published as <prefix>:gpu<id>:<suffix>.
const std::vector<std::string>& device_metric_suffixes();

// Agent series suffixes, published as <prefix>:agent:<suffix>.
const std::vector<std::string>& agent_metric_suffixes();

std::string device_series_key(const std::string& prefix, model::DeviceId device, const std::string& suffix);

class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;
  RedisTsSink(RedisTsSink&&) noexcept;
  RedisTsSink& operator=(RedisTsSink&&) noexcept;

  bool check_connectivity();

  // One TS.MADD covering every snapshot plus the agent series. Sets `health.redis_latency_ms`.
  bool publish(const std::vector<std::shared_ptr<const session::HealthSnapshot>>& snapshots,
               model::AgentHealth& health);

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool create_series(const std::string& key);
  bool ensure_agent_schema();
  bool ensure_device_schema(model::DeviceId device);
  bool publish_impl(const std::vector<std::shared_ptr<const session::HealthSnapshot>>& snapshots,
                    model::AgentHealth& health);

  RedisTsOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  bool timeseries_available_{true};
  bool agent_schema_ready_{false};
  std::set<model::DeviceId> device_schema_ready_{};
};

}  // namespace gpu_health::sinks
