#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

#include "model/metric_sample.hpp"

namespace gpu_health::history {

enum class Metric : std::uint8_t {
  UTILIZATION = 0,
  MEMORY_USED = 1,
  MEMORY_USAGE_PCT = 2,
  TEMPERATURE = 3,
  POWER = 4,
  POWER_LOAD_PCT = 5,
  FAN_PCT = 6,
  CORE_CLOCK = 7,
  MEM_CLOCK = 8,
  THROTTLED = 9,
};

[[nodiscard]] const char* metric_name(Metric metric) noexcept;

[[nodiscard]] double metric_value(const model::MetricSample& sample, Metric metric) noexcept;

struct MetricPoint {
  std::uint64_t timestamp_ns;
  double value;
};

// Selects the most recent samples of a buffer. Zero means "no bound".
struct WindowSpec {
  std::size_t max_samples{0};
  std::uint64_t max_age_ns{0};

  static WindowSpec all() noexcept { return {}; }
  static WindowSpec last_samples(const std::size_t count) noexcept { return {count, 0}; }
  static WindowSpec last_duration(const std::chrono::nanoseconds age) noexcept {
    return {0, static_cast<std::uint64_t>(age.count())};
  }
};

class HistoryBuffer;

// Read-only, restartable view over one metric of a buffer, oldest first.
// Valid until the next append to the underlying buffer.
class MetricWindow {
 public:
  class const_iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = MetricPoint;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = MetricPoint;

    const_iterator() = default;

    MetricPoint operator*() const noexcept { return window_->at(index_); }

    const_iterator& operator++() noexcept {
      ++index_;
      return *this;
    }

    const_iterator operator++(int) noexcept {
      const_iterator previous = *this;
      ++index_;
      return previous;
    }

    friend bool operator==(const const_iterator& lhs, const const_iterator& rhs) noexcept {
      return lhs.window_ == rhs.window_ && lhs.index_ == rhs.index_;
    }

    friend bool operator!=(const const_iterator& lhs, const const_iterator& rhs) noexcept { return !(lhs == rhs); }

   private:
    friend class MetricWindow;
    const_iterator(const MetricWindow* window, const std::size_t index) noexcept : window_(window), index_(index) {}

    const MetricWindow* window_{nullptr};
    std::size_t index_{0};
  };

  MetricWindow() = default;

  [[nodiscard]] const_iterator begin() const noexcept { return const_iterator(this, 0); }
  [[nodiscard]] const_iterator end() const noexcept { return const_iterator(this, count_); }

  [[nodiscard]] std::size_t size() const noexcept { return count_; }
  [[nodiscard]] bool empty() const noexcept { return count_ == 0; }
  [[nodiscard]] Metric metric() const noexcept { return metric_; }

  // 0 is the oldest point of the window.
  [[nodiscard]] MetricPoint at(std::size_t index) const noexcept;
  [[nodiscard]] MetricPoint front() const noexcept { return at(0); }
  [[nodiscard]] MetricPoint back() const noexcept { return at(count_ - 1); }

  // Narrows the window to its newest `count` points.
  [[nodiscard]] MetricWindow newest(std::size_t count) const noexcept;

 private:
  friend class HistoryBuffer;
  MetricWindow(const HistoryBuffer* buffer, Metric metric, std::size_t first, std::size_t count) noexcept
      : buffer_(buffer), metric_(metric), first_(first), count_(count) {}

  const HistoryBuffer* buffer_{nullptr};
  Metric metric_{Metric::UTILIZATION};
  std::size_t first_{0};
  std::size_t count_{0};
};

// Fixed-capacity ring of samples for one device. Storage is allocated once;
// append overwrites the oldest slot when full.
class HistoryBuffer {
 public:
  static constexpr std::size_t kDefaultCapacity = 300;

  explicit HistoryBuffer(std::size_t capacity = kDefaultCapacity);

  void append(const model::MetricSample& sample) noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return size_; }
  [[nodiscard]] std::size_t capacity() const noexcept { return slots_.size(); }
  [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
  [[nodiscard]] bool full() const noexcept { return size_ == slots_.size(); }

  // 0 is the oldest retained sample. Caller guarantees index < size().
  [[nodiscard]] const model::MetricSample& at(std::size_t index) const noexcept;
  [[nodiscard]] const model::MetricSample& latest() const noexcept { return at(size_ - 1); }

  [[nodiscard]] MetricWindow window(Metric metric, WindowSpec spec = WindowSpec::all()) const noexcept;

  [[nodiscard]] std::vector<model::MetricSample> copy() const;

 private:
  std::vector<model::MetricSample> slots_;
  std::size_t head_{0};
  std::size_t size_{0};
};

}  // namespace gpu_health::history
