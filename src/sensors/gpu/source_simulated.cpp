#include "sensors/gpu/gpu.hpp"

#include <cmath>
#include <cstdint>
#include <map>
#include <memory>

#include "core/timestamp.hpp"

namespace gpu_health::sensors::gpu {
namespace {

constexpr std::uint64_t kGiB = 1024ULL * 1024ULL * 1024ULL;

// Stand-in board for hosts without NVML: 8 GiB, 250 W limit, idling around
// 45% utilization and 65 C with a slow deterministic wobble per device.
class SimulatedSampleSource final : public SampleSource {
 public:
  const char* name() const override { return "simulated"; }

  bool available() const override { return true; }

  bool collect(const DeviceId device, MetricSample& sample) override {
    const std::uint64_t step = steps_[device]++;
    const double phase = static_cast<double>(step) * 0.1 + static_cast<double>(device);
    const auto wave = static_cast<float>(std::sin(phase));

    sample.timestamp_ns = core::unix_timestamp_now_ns();
    sample.utilization_pct = 45.0F + 10.0F * wave;
    sample.memory_total = 8ULL * kGiB;
    sample.memory_used = 2ULL * kGiB + static_cast<std::uint64_t>((wave + 1.0F) * 128.0F) * 1024ULL * 1024ULL;
    sample.temperature_c = 65.0F + 3.0F * wave;
    sample.power_watts = 150.0F + 15.0F * wave;
    sample.power_limit_watts = 250.0F;
    sample.fan_pct = 60.0F + 5.0F * wave;
    sample.core_clock_mhz = 1500.0F;
    sample.mem_clock_mhz = 7000.0F;
    sample.throttled = false;
    return true;
  }

 private:
  std::map<DeviceId, std::uint64_t> steps_{};
};

}  // namespace

std::unique_ptr<SampleSource> make_simulated_source() { return std::make_unique<SimulatedSampleSource>(); }

}  // namespace gpu_health::sensors::gpu
