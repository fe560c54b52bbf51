#pragma once

#include <nlohmann/json.hpp>

#include "session/health_snapshot.hpp"

namespace gpu_health::sinks {

// Wire shape of a snapshot for display and export consumers.
nlohmann::json snapshot_to_json(const session::HealthSnapshot& snapshot);

nlohmann::json alert_to_json(const alerts::Alert& alert);

}  // namespace gpu_health::sinks
