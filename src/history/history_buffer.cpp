#include "history/history_buffer.hpp"

#include <algorithm>

namespace gpu_health::history {

const char* metric_name(const Metric metric) noexcept {
  switch (metric) {
    case Metric::UTILIZATION:
      return "utilization_pct";
    case Metric::MEMORY_USED:
      return "memory_used";
    case Metric::MEMORY_USAGE_PCT:
      return "memory_usage_pct";
    case Metric::TEMPERATURE:
      return "temperature_c";
    case Metric::POWER:
      return "power_watts";
    case Metric::POWER_LOAD_PCT:
      return "power_load_pct";
    case Metric::FAN_PCT:
      return "fan_pct";
    case Metric::CORE_CLOCK:
      return "core_clock_mhz";
    case Metric::MEM_CLOCK:
      return "mem_clock_mhz";
    case Metric::THROTTLED:
      return "throttled";
  }
  return "unknown";
}

double metric_value(const model::MetricSample& sample, const Metric metric) noexcept {
  switch (metric) {
    case Metric::UTILIZATION:
      return sample.utilization_pct;
    case Metric::MEMORY_USED:
      return static_cast<double>(sample.memory_used);
    case Metric::MEMORY_USAGE_PCT:
      return model::memory_usage_pct(sample);
    case Metric::TEMPERATURE:
      return sample.temperature_c;
    case Metric::POWER:
      return sample.power_watts;
    case Metric::POWER_LOAD_PCT:
      return sample.power_limit_watts > 0.0F
                 ? (static_cast<double>(sample.power_watts) / static_cast<double>(sample.power_limit_watts)) * 100.0
                 : 0.0;
    case Metric::FAN_PCT:
      return sample.fan_pct;
    case Metric::CORE_CLOCK:
      return sample.core_clock_mhz;
    case Metric::MEM_CLOCK:
      return sample.mem_clock_mhz;
    case Metric::THROTTLED:
      return sample.throttled ? 1.0 : 0.0;
  }
  return 0.0;
}

MetricPoint MetricWindow::at(const std::size_t index) const noexcept {
  const auto& sample = buffer_->at(first_ + index);
  return MetricPoint{sample.timestamp_ns, metric_value(sample, metric_)};
}

MetricWindow MetricWindow::newest(const std::size_t count) const noexcept {
  if (count >= count_) {
    return *this;
  }
  return MetricWindow(buffer_, metric_, first_ + (count_ - count), count);
}

HistoryBuffer::HistoryBuffer(const std::size_t capacity) : slots_(std::max<std::size_t>(capacity, 1)) {}

void HistoryBuffer::append(const model::MetricSample& sample) noexcept {
  slots_[head_] = sample;
  head_ = (head_ + 1) % slots_.size();
  if (size_ < slots_.size()) {
    ++size_;
  }
}

const model::MetricSample& HistoryBuffer::at(const std::size_t index) const noexcept {
  const std::size_t oldest = (head_ + slots_.size() - size_) % slots_.size();
  return slots_[(oldest + index) % slots_.size()];
}

MetricWindow HistoryBuffer::window(const Metric metric, const WindowSpec spec) const noexcept {
  std::size_t count = size_;
  if (spec.max_samples > 0) {
    count = std::min(count, spec.max_samples);
  }

  if (spec.max_age_ns > 0 && count > 0) {
    const std::uint64_t newest_ts = latest().timestamp_ns;
    const std::uint64_t cutoff = newest_ts > spec.max_age_ns ? newest_ts - spec.max_age_ns : 0;
    std::size_t within = 0;
    while (within < count && at(size_ - 1 - within).timestamp_ns >= cutoff) {
      ++within;
    }
    count = within;
  }

  return MetricWindow(this, metric, size_ - count, count);
}

std::vector<model::MetricSample> HistoryBuffer::copy() const {
  std::vector<model::MetricSample> out;
  out.reserve(size_);
  for (std::size_t i = 0; i < size_; ++i) {
    out.push_back(at(i));
  }
  return out;
}

}  // namespace gpu_health::history
