#pragma once

#include <cstdint>

namespace gpu_health::model {

// Loop self-observation, refreshed once per agent tick.
struct AgentHealth {
    std::uint64_t heartbeat_ms;
    float loop_jitter_ms;
    float compute_time_ms;
    float redis_latency_ms;
    std::uint32_t redis_errors;
    std::uint32_t source_failures;
    std::uint32_t missed_cycles;
    std::uint32_t devices_tracked;
};

} // namespace gpu_health::model
