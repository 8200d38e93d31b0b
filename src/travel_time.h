// travel_time.h
#pragma once
#include <vector>
#include "types.h"

namespace vp {

// Minutes for one straight-line hop:
//   round(km * detour_factor / speed_kmh * 60) + hop_buffer_minutes
int hop_minutes(double km, const TravelModel& model);

// Sum of hop_minutes over consecutive pairs. The caller passes the full
// loop, start and return included. Fewer than two points -> 0.
int estimate_minutes(const std::vector<GeoPoint>& loop, const TravelModel& model);

// home -> routed patients (those with coordinates) -> home. Empty when no
// patient on the route has coordinates.
std::vector<GeoPoint> route_loop(const GeoPoint& home, const std::vector<PlanEntry>& route);

inline int route_travel_minutes(const GeoPoint& home, const std::vector<PlanEntry>& route,
                                const TravelModel& model) {
  return estimate_minutes(route_loop(home, route), model);
}

} // namespace vp
