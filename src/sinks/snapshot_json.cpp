#include "sinks/snapshot_json.hpp"

#include "model/metric_sample.hpp"

namespace gpu_health::analysis {

void to_json(nlohmann::json& out, const TrendStats& stats) {
  out = nlohmann::json{{"samples", stats.samples},     {"mean", stats.mean},
                       {"min", stats.min},             {"max", stats.max},
                       {"slope_per_s", stats.slope_per_s}, {"span_s", stats.span_s},
                       {"peak", stats.peak},           {"peak_timestamp_ms", stats.peak_timestamp_ns / 1'000'000ULL}};
}

void to_json(nlohmann::json& out, const PowerTrend& power) {
  out = nlohmann::json{{"draw", power.draw},
                       {"load_pct", power.load_pct},
                       {"average_draw_w", power.average_draw_w},
                       {"spikes", power.spikes},
                       {"efficiency", power.efficiency},
                       {"best_efficiency", power.best_efficiency}};
}

void to_json(nlohmann::json& out, const TrendReport& trends) {
  out = nlohmann::json{{"utilization", trends.utilization},
                       {"temperature", trends.temperature},
                       {"memory_usage_pct", trends.memory_usage_pct},
                       {"fan", trends.fan},
                       {"core_clock", trends.core_clock},
                       {"mem_clock", trends.mem_clock},
                       {"power", trends.power},
                       {"temperature_change_c", trends.temperature_change_c},
                       {"seconds_above_temp_warn", trends.seconds_above_temp_warn},
                       {"seconds_above_temp_crit", trends.seconds_above_temp_crit},
                       {"throttled_seconds", trends.throttled_seconds}};
}

void to_json(nlohmann::json& out, const MemoryHealth& memory) {
  out = nlohmann::json{{"leak_suspected", memory.leak_suspected},
                       {"fragmentation_pressure", memory.fragmentation_pressure},
                       {"usage_trend_slope", memory.usage_trend_slope},
                       {"growth_ratio", memory.growth_ratio},
                       {"non_decreasing_fraction", memory.non_decreasing_fraction},
                       {"confidence", memory.confidence},
                       {"heuristic", memory.heuristic}};
}

}  // namespace gpu_health::analysis

namespace gpu_health::alerts {

void to_json(nlohmann::json& out, const Alert& alert) {
  out = nlohmann::json{{"id", alert.id},
                       {"device", alert.device},
                       {"category", category_name(alert.category)},
                       {"severity", severity_name(alert.severity)},
                       {"message", alert.message},
                       {"first_seen_ms", alert.first_seen_ns / 1'000'000ULL},
                       {"last_seen_ms", alert.last_seen_ns / 1'000'000ULL},
                       {"occurrence_count", alert.occurrence_count},
                       {"value", alert.value},
                       {"threshold", alert.threshold}};
}

void to_json(nlohmann::json& out, const AlertTransition& transition) {
  out = nlohmann::json{{"kind", transition_name(transition.kind)}, {"alert", transition.alert}};
}

}  // namespace gpu_health::alerts

namespace gpu_health::session {

void to_json(nlohmann::json& out, const Diagnostic& diagnostic) {
  out = nlohmann::json{{"kind", diagnostic_name(diagnostic.kind)},
                       {"field", diagnostic.field},
                       {"raw", diagnostic.raw},
                       {"adjusted", diagnostic.adjusted}};
}

}  // namespace gpu_health::session

namespace gpu_health::sinks {
namespace {

nlohmann::json sample_to_json(const model::MetricSample& sample) {
  return nlohmann::json{{"timestamp_ms", sample.timestamp_ns / 1'000'000ULL},
                        {"utilization_pct", sample.utilization_pct},
                        {"memory_used", sample.memory_used},
                        {"memory_total", sample.memory_total},
                        {"memory_usage_pct", model::memory_usage_pct(sample)},
                        {"temperature_c", sample.temperature_c},
                        {"power_watts", sample.power_watts},
                        {"power_limit_watts", sample.power_limit_watts},
                        {"fan_pct", sample.fan_pct},
                        {"core_clock_mhz", sample.core_clock_mhz},
                        {"mem_clock_mhz", sample.mem_clock_mhz},
                        {"throttled", sample.throttled}};
}

}  // namespace

nlohmann::json alert_to_json(const alerts::Alert& alert) { return nlohmann::json(alert); }

nlohmann::json snapshot_to_json(const session::HealthSnapshot& snapshot) {
  const auto& score = snapshot.health_score;
  return nlohmann::json{
      {"device", snapshot.device},
      {"tick", snapshot.tick},
      {"stale", snapshot.stale},
      {"health",
       {{"score", score.overall},
        {"status", scoring::status_name(snapshot.status)},
        {"components",
         {{"temperature", score.temperature_component},
          {"power", score.power_component},
          {"memory", score.memory_component}}}}},
      {"sample", sample_to_json(snapshot.sample)},
      {"trends", snapshot.trends},
      {"memory_health", snapshot.memory_health},
      {"active_alerts", snapshot.active_alerts},
      {"transitions", snapshot.transitions},
      {"diagnostics", snapshot.diagnostics},
      {"uptime_s", snapshot.uptime_seconds},
      {"out_of_range_total", snapshot.out_of_range_total},
      {"history_size", snapshot.history_size},
  };
}

}  // namespace gpu_health::sinks
