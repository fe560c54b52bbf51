#include <atomic>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>

#include "core/agent.hpp"
#include "core/config.hpp"

namespace {

std::atomic<bool> g_shutdown_requested{false};

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested.store(true);
}

std::string format_config_settings(const gpu_health::core::AgentConfig& config, const std::string& config_path) {
  const auto& t = config.health.thresholds;
  std::ostringstream output;
  output << "[agent] loaded config from " << config_path
         << " | tick_interval_ms=" << config.tick_interval.count()
         << " | history_capacity=" << config.history_capacity
         << " | devices=";
  for (std::size_t i = 0; i < config.gpu_devices.size(); ++i) {
    output << (i == 0 ? "" : ",") << config.gpu_devices[i];
  }
  output << " | source=" << gpu_health::core::source_kind_name(config.gpu_source)
         << " | temp_c=" << t.temp_warn << '/' << t.temp_crit
         << " | power_pct=" << t.power_warn << '/' << t.power_crit
         << " | mem_pct=" << t.mem_warn << '/' << t.mem_crit
         << " | notifications=" << (config.notifications.enabled ? "true" : "false")
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false");

  if (config.redis.enabled) {
    output << " | redis_address=";
    if (!config.redis.unix_socket.empty()) {
      output << "unix://" << config.redis.unix_socket;
    } else {
      output << config.redis.host << ':' << config.redis.port;
    }
  }
  return output.str();
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/agent.yaml";

  gpu_health::core::AgentConfig config{};
  try {
    config = gpu_health::core::load_agent_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  gpu_health::core::Agent agent{config, config_path};
  agent.run_for_ticks(0, &g_shutdown_requested);

  std::cerr << "[agent] shutdown signal received; exiting cleanly\n";

  return 0;
}
