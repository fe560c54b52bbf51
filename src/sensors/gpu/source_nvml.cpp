#include "sensors/gpu/gpu.hpp"

#include <cstdint>
#include <dlfcn.h>
#include <iostream>
#include <map>
#include <memory>
#include <vector>

#include "core/timestamp.hpp"

#if defined(GPU_HEALTH_HAVE_NVML)
#include <nvml.h>
#else
using nvmlReturn_t = int;
using nvmlDevice_t = struct nvmlDevice_st*;

struct nvmlUtilization_t {
  unsigned int gpu;
  unsigned int memory;
};

struct nvmlMemory_t {
  unsigned long long total;
  unsigned long long free;
  unsigned long long used;
};

constexpr nvmlReturn_t NVML_SUCCESS = 0;
constexpr unsigned int NVML_TEMPERATURE_GPU = 0;
constexpr unsigned int NVML_CLOCK_GRAPHICS = 0;
constexpr unsigned int NVML_CLOCK_MEM = 2;
constexpr unsigned long long nvmlClocksThrottleReasonGpuIdle = 0x0000000000000001ULL;
constexpr unsigned long long nvmlClocksThrottleReasonApplicationsClocksSetting = 0x0000000000000002ULL;
#endif

namespace gpu_health::sensors::gpu {
namespace {

// Idle and application-clock reasons are normal operation, not throttling.
constexpr unsigned long long kBenignThrottleReasons =
    nvmlClocksThrottleReasonGpuIdle | nvmlClocksThrottleReasonApplicationsClocksSetting;

class NvmlSampleSource final : public SampleSource {
 public:
  explicit NvmlSampleSource(const std::vector<DeviceId>& devices) noexcept { init(devices); }

  ~NvmlSampleSource() override {
    if (initialized_ && fn_shutdown_ != nullptr) {
      (void)fn_shutdown_();
      initialized_ = false;
    }

    if (library_ != nullptr) {
      dlclose(library_);
      library_ = nullptr;
    }
  }

  const char* name() const override { return "nvml"; }

  bool available() const override { return !handles_.empty(); }

  bool collect(const DeviceId device, MetricSample& sample) override {
    const auto it = handles_.find(device);
    if (it == handles_.end()) {
      return false;
    }
    const nvmlDevice_t handle = it->second;

    nvmlUtilization_t util{};
    nvmlMemory_t memory{};
    unsigned int temp_c = 0;
    unsigned int power_mw = 0;

    if (fn_device_get_utilization_rates_(handle, &util) != NVML_SUCCESS ||
        fn_device_get_memory_info_(handle, &memory) != NVML_SUCCESS ||
        fn_device_get_temperature_(handle, NVML_TEMPERATURE_GPU, &temp_c) != NVML_SUCCESS ||
        fn_device_get_power_usage_(handle, &power_mw) != NVML_SUCCESS) {
      return false;
    }

    // Optional readings: passively cooled boards have no fan, some SKUs hide clocks.
    unsigned int fan_pct = 0;
    unsigned int graphics_clock_mhz = 0;
    unsigned int mem_clock_mhz = 0;
    unsigned int power_limit_mw = 0;
    unsigned long long throttle_reasons = 0;
    if (fn_device_get_fan_speed_ != nullptr && fn_device_get_fan_speed_(handle, &fan_pct) != NVML_SUCCESS) {
      fan_pct = 0;
    }
    if (fn_device_get_clock_info_(handle, NVML_CLOCK_GRAPHICS, &graphics_clock_mhz) != NVML_SUCCESS) {
      graphics_clock_mhz = 0;
    }
    if (fn_device_get_clock_info_(handle, NVML_CLOCK_MEM, &mem_clock_mhz) != NVML_SUCCESS) {
      mem_clock_mhz = 0;
    }
    if (fn_device_get_enforced_power_limit_(handle, &power_limit_mw) != NVML_SUCCESS) {
      power_limit_mw = 0;
    }
    if (fn_device_get_current_clocks_throttle_reasons_(handle, &throttle_reasons) != NVML_SUCCESS) {
      throttle_reasons = 0;
    }

    sample.timestamp_ns = core::unix_timestamp_now_ns();
    sample.utilization_pct = static_cast<float>(util.gpu);
    sample.memory_used = memory.used;
    sample.memory_total = memory.total;
    sample.temperature_c = static_cast<float>(temp_c);
    sample.power_watts = static_cast<float>(power_mw) / 1000.0F;
    sample.power_limit_watts = static_cast<float>(power_limit_mw) / 1000.0F;
    sample.fan_pct = static_cast<float>(fan_pct);
    sample.core_clock_mhz = static_cast<float>(graphics_clock_mhz);
    sample.mem_clock_mhz = static_cast<float>(mem_clock_mhz);
    sample.throttled = (throttle_reasons & ~kBenignThrottleReasons) != 0ULL;

    return true;
  }

 private:
  using FnNvmlInit = nvmlReturn_t (*)();
  using FnNvmlShutdown = nvmlReturn_t (*)();
  using FnNvmlDeviceGetHandleByIndex = nvmlReturn_t (*)(unsigned int, nvmlDevice_t*);
  using FnNvmlDeviceGetUtilizationRates = nvmlReturn_t (*)(nvmlDevice_t, nvmlUtilization_t*);
  using FnNvmlDeviceGetMemoryInfo = nvmlReturn_t (*)(nvmlDevice_t, nvmlMemory_t*);
  using FnNvmlDeviceGetTemperature = nvmlReturn_t (*)(nvmlDevice_t, unsigned int, unsigned int*);
  using FnNvmlDeviceGetClockInfo = nvmlReturn_t (*)(nvmlDevice_t, unsigned int, unsigned int*);
  using FnNvmlDeviceGetFanSpeed = nvmlReturn_t (*)(nvmlDevice_t, unsigned int*);
  using FnNvmlDeviceGetPowerUsage = nvmlReturn_t (*)(nvmlDevice_t, unsigned int*);
  using FnNvmlDeviceGetEnforcedPowerLimit = nvmlReturn_t (*)(nvmlDevice_t, unsigned int*);
  using FnNvmlDeviceGetCurrentClocksThrottleReasons = nvmlReturn_t (*)(nvmlDevice_t, unsigned long long*);

  template <typename FnType>
  bool resolve(FnType& fn, const char* symbol) noexcept {
    fn = reinterpret_cast<FnType>(dlsym(library_, symbol));
    return fn != nullptr;
  }

  void init(const std::vector<DeviceId>& devices) noexcept {
    library_ = dlopen("libnvidia-ml.so.1", RTLD_NOW);
    if (library_ == nullptr) {
      return;
    }

    if (!resolve(fn_init_, "nvmlInit_v2") && !resolve(fn_init_, "nvmlInit")) {
      return;
    }

    if (!resolve(fn_shutdown_, "nvmlShutdown")) {
      return;
    }

    if (!resolve(fn_device_get_handle_by_index_, "nvmlDeviceGetHandleByIndex_v2") &&
        !resolve(fn_device_get_handle_by_index_, "nvmlDeviceGetHandleByIndex")) {
      return;
    }

    if (!resolve(fn_device_get_utilization_rates_, "nvmlDeviceGetUtilizationRates") ||
        !resolve(fn_device_get_memory_info_, "nvmlDeviceGetMemoryInfo") ||
        !resolve(fn_device_get_temperature_, "nvmlDeviceGetTemperature") ||
        !resolve(fn_device_get_clock_info_, "nvmlDeviceGetClockInfo") ||
        !resolve(fn_device_get_power_usage_, "nvmlDeviceGetPowerUsage") ||
        !resolve(fn_device_get_enforced_power_limit_, "nvmlDeviceGetEnforcedPowerLimit") ||
        !resolve(fn_device_get_current_clocks_throttle_reasons_, "nvmlDeviceGetCurrentClocksThrottleReasons")) {
      return;
    }
    (void)resolve(fn_device_get_fan_speed_, "nvmlDeviceGetFanSpeed");

    if (fn_init_() != NVML_SUCCESS) {
      return;
    }
    initialized_ = true;

    for (const DeviceId index : devices) {
      nvmlDevice_t handle{nullptr};
      if (fn_device_get_handle_by_index_(index, &handle) != NVML_SUCCESS) {
        std::cerr << "[nvml] device " << index << " not found\n";
        continue;
      }
      handles_.emplace(index, handle);
    }
  }

  void* library_{nullptr};
  bool initialized_{false};
  std::map<DeviceId, nvmlDevice_t> handles_{};

  FnNvmlInit fn_init_{nullptr};
  FnNvmlShutdown fn_shutdown_{nullptr};
  FnNvmlDeviceGetHandleByIndex fn_device_get_handle_by_index_{nullptr};
  FnNvmlDeviceGetUtilizationRates fn_device_get_utilization_rates_{nullptr};
  FnNvmlDeviceGetMemoryInfo fn_device_get_memory_info_{nullptr};
  FnNvmlDeviceGetTemperature fn_device_get_temperature_{nullptr};
  FnNvmlDeviceGetClockInfo fn_device_get_clock_info_{nullptr};
  FnNvmlDeviceGetFanSpeed fn_device_get_fan_speed_{nullptr};
  FnNvmlDeviceGetPowerUsage fn_device_get_power_usage_{nullptr};
  FnNvmlDeviceGetEnforcedPowerLimit fn_device_get_enforced_power_limit_{nullptr};
  FnNvmlDeviceGetCurrentClocksThrottleReasons fn_device_get_current_clocks_throttle_reasons_{nullptr};
};

}  // namespace

std::unique_ptr<SampleSource> make_nvml_source(const std::vector<DeviceId>& devices) {
  return std::make_unique<NvmlSampleSource>(devices);
}

}  // namespace gpu_health::sensors::gpu
