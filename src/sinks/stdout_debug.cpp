#include "sinks/stdout_debug.hpp"

#include <cstdio>
#include <string>

#include "model/metric_sample.hpp"
#include "sinks/snapshot_json.hpp"

namespace gpu_health::sinks {

void StdoutDebugSink::publish(const session::HealthSnapshot& snapshot) const {
  if (format_ == core::StdoutFormat::JSON) {
    const std::string line = snapshot_to_json(snapshot).dump();
    std::fprintf(out_, "%s\n", line.c_str());
    std::fflush(out_);
    return;
  }

  const auto& sample = snapshot.sample;
  const auto& score = snapshot.health_score;
  std::fprintf(out_,
               "[gpu%u] health=%d(%s) temp.c=%.1f power.w=%.1f/%.0f mem.pct=%.1f util.pct=%.1f "
               "components=%.0f/%.0f/%.0f alerts=%zu%s\n",
               static_cast<unsigned int>(snapshot.device), score.overall, scoring::status_name(snapshot.status),
               sample.temperature_c, sample.power_watts, sample.power_limit_watts, model::memory_usage_pct(sample),
               sample.utilization_pct, score.temperature_component, score.power_component, score.memory_component,
               snapshot.active_alerts.size(), snapshot.stale ? " stale" : "");
  std::fflush(out_);
}

}  // namespace gpu_health::sinks
