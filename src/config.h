// config.h
#pragma once
#include <nlohmann/json.hpp>
#include "types.h"

namespace vp {

struct PlannerConfig {
  PlanSettings settings;                 // `today` is filled in by the caller
  TravelModel travel;
  int default_max_daily_minutes = 240;   // for provider records without a budget
};

// Reads upper-case keys (HOME_LAT, RADIUS_WALK_KM, SPEED_KMH, ...); missing
// keys keep their defaults. Throws std::runtime_error on invalid values.
PlannerConfig parse_config(const nlohmann::json& j);

} // namespace vp
