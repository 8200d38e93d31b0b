// radius_filter.h
#pragma once
#include <optional>
#include <vector>
#include "types.h"

namespace vp {

struct RadiusSettings {
  double radius_walk_km = 1.5;
  double radius_bike_km = 5.0;
};

struct RadiusSplit {
  std::vector<PlanEntry> kept;        // route order preserved, re-indexed
  std::vector<PlanEntry> relocated;   // relocated=true
};

// nullopt = unlimited (car).
std::optional<double> radius_limit_km(TransportMode mode, const RadiusSettings& r);

// Moves patients farther than the mode's radius from home out of the route.
// Patients without coordinates are always kept.
RadiusSplit filter_by_radius(const std::vector<PlanEntry>& route,
                             const GeoPoint& home,
                             TransportMode mode,
                             const RadiusSettings& r);

} // namespace vp
