#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "model/metric_sample.hpp"

namespace gpu_health::sensors::gpu {

using model::DeviceId;
using model::MetricSample;

// Produces one raw sample per device per call. Values are passed through as
// read; range checks happen at ingestion.
class SampleSource {
 public:
  virtual const char* name() const = 0;
  virtual bool available() const = 0;
  virtual bool collect(DeviceId device, MetricSample& sample) = 0;
  virtual ~SampleSource() = default;
};

std::unique_ptr<SampleSource> make_nvml_source(const std::vector<DeviceId>& devices);
std::unique_ptr<SampleSource> make_simulated_source();

}  // namespace gpu_health::sensors::gpu
