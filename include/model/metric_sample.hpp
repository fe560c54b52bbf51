#pragma once

#include <cstdint>
#include <type_traits>

namespace gpu_health::model {

using DeviceId = std::uint32_t;

// One tick of telemetry for one device.
// POD layout: timestamp + raw readings exactly as the sample source produced them.
struct MetricSample {
    std::uint64_t timestamp_ns;

    float utilization_pct;
    std::uint64_t memory_used;
    std::uint64_t memory_total;
    float temperature_c;
    float power_watts;
    float power_limit_watts;  // 0 when the source cannot report one
    float fan_pct;
    float core_clock_mhz;
    float mem_clock_mhz;
    bool throttled;
};

static_assert(std::is_standard_layout_v<MetricSample>, "MetricSample must be standard layout");
static_assert(std::is_trivial_v<MetricSample>, "MetricSample must be trivial");

inline double memory_usage_pct(const MetricSample& sample) noexcept {
    if (sample.memory_total == 0) {
        return 0.0;
    }
    return (static_cast<double>(sample.memory_used) / static_cast<double>(sample.memory_total)) * 100.0;
}

} // namespace gpu_health::model
