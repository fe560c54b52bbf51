#include "session/device_session.hpp"

#include <algorithm>
#include <utility>

#include "analysis/memory_health.hpp"
#include "analysis/trend_analyzer.hpp"
#include "core/timestamp.hpp"
#include "scoring/health_scorer.hpp"
#include "session/sample_sanitizer.hpp"

namespace gpu_health::session {

DeviceSession::DeviceSession(const model::DeviceId device, const std::size_t history_capacity)
    : device_(device), history_(history_capacity), alerts_(device) {}

std::shared_ptr<const HealthSnapshot> DeviceSession::tick(const model::MetricSample& raw,
                                                          const core::HealthSettings& settings) {
  std::lock_guard<std::mutex> lock(tick_mutex_);

  SanitizedSample sanitized = sanitize_sample(raw, last_timestamp_ns_, settings.scoring.fallback_power_limit_w);
  const model::MetricSample& sample = sanitized.sample;

  history_.append(sample);
  analysis::TrendReport trends = analysis::analyze_trends(history_, settings);
  analysis::MemoryHealth memory = analysis::assess_memory(history_, settings.memory);
  const scoring::HealthScore score = scoring::score_health(sample, trends, memory, settings);
  std::vector<alerts::AlertTransition> transitions = alerts_.evaluate(sample, trends, memory, settings);

  ++ticks_;
  if (!first_timestamp_ns_.has_value()) {
    first_timestamp_ns_ = sample.timestamp_ns;
  }
  last_timestamp_ns_ = sample.timestamp_ns;
  out_of_range_total_ += sanitized.diagnostics.size();
  stale_ = false;
  for (const auto& transition : transitions) {
    recent_alerts_.push_back(transition);
  }
  while (recent_alerts_.size() > kRecentAlertCapacity) {
    recent_alerts_.pop_front();
  }

  auto snapshot = std::make_shared<HealthSnapshot>();
  snapshot->device = device_;
  snapshot->tick = ticks_;
  snapshot->sample = sample;
  snapshot->trends = std::move(trends);
  snapshot->memory_health = memory;
  snapshot->health_score = score;
  snapshot->status = scoring::status_of(score);
  snapshot->active_alerts = alerts_.active_alerts();
  snapshot->transitions = std::move(transitions);
  snapshot->diagnostics = std::move(sanitized.diagnostics);
  snapshot->stale = false;
  snapshot->uptime_seconds = core::ns_to_seconds(*last_timestamp_ns_ - *first_timestamp_ns_);
  snapshot->out_of_range_total = out_of_range_total_;
  snapshot->history_size = history_.size();

  std::shared_ptr<const HealthSnapshot> published = std::move(snapshot);
  publish(published);
  return published;
}

std::shared_ptr<const HealthSnapshot> DeviceSession::mark_stale_if_idle(const std::uint64_t now_ns,
                                                                        const std::uint64_t stale_after_ns) {
  std::lock_guard<std::mutex> lock(tick_mutex_);
  if (stale_ || !last_timestamp_ns_.has_value() || now_ns <= *last_timestamp_ns_) {
    return nullptr;
  }

  const std::uint64_t idle_ns = now_ns - *last_timestamp_ns_;
  if (idle_ns < stale_after_ns) {
    return nullptr;
  }

  const auto current = snapshot();
  if (current == nullptr) {
    return nullptr;
  }

  stale_ = true;
  auto stale = std::make_shared<HealthSnapshot>(*current);
  stale->stale = true;
  stale->transitions.clear();
  stale->diagnostics.push_back(Diagnostic{DiagnosticKind::STALE_DEVICE, "sample_age_s", core::ns_to_seconds(idle_ns),
                                          core::ns_to_seconds(stale_after_ns)});

  std::shared_ptr<const HealthSnapshot> published = std::move(stale);
  publish(published);
  return published;
}

std::shared_ptr<const HealthSnapshot> DeviceSession::snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return snapshot_;
}

std::vector<model::MetricSample> DeviceSession::history() const {
  std::lock_guard<std::mutex> lock(tick_mutex_);
  return history_.copy();
}

std::vector<history::MetricPoint> DeviceSession::window(const history::Metric metric,
                                                        const history::WindowSpec spec) const {
  std::lock_guard<std::mutex> lock(tick_mutex_);
  const history::MetricWindow view = history_.window(metric, spec);
  return std::vector<history::MetricPoint>(view.begin(), view.end());
}

std::vector<alerts::AlertTransition> DeviceSession::recent_alerts(const std::size_t limit) const {
  std::lock_guard<std::mutex> lock(tick_mutex_);
  const std::size_t count = std::min(limit, recent_alerts_.size());
  return std::vector<alerts::AlertTransition>(recent_alerts_.rbegin(), recent_alerts_.rbegin() + static_cast<std::ptrdiff_t>(count));
}

void DeviceSession::publish(std::shared_ptr<const HealthSnapshot> snapshot) {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  snapshot_ = std::move(snapshot);
}

}  // namespace gpu_health::session
