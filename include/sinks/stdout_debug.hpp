#pragma once

#include <cstdio>

#include "core/config.hpp"
#include "session/health_snapshot.hpp"

namespace gpu_health::sinks {

class StdoutDebugSink {
 public:
  explicit StdoutDebugSink(core::StdoutFormat format = core::StdoutFormat::TEXT, std::FILE* out = stdout) noexcept
      : format_(format), out_(out) {}

  void publish(const session::HealthSnapshot& snapshot) const;

 private:
  core::StdoutFormat format_;
  std::FILE* out_;
};

}  // namespace gpu_health::sinks
