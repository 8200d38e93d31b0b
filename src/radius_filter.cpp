// radius_filter.cpp
#include "radius_filter.h"
#include "geo.h"

namespace vp {

std::optional<double> radius_limit_km(TransportMode mode, const RadiusSettings& r) {
  switch (mode) {
    case TransportMode::Walk: return r.radius_walk_km;
    case TransportMode::Bike: return r.radius_bike_km;
    case TransportMode::Car:  break;
  }
  return std::nullopt;
}

RadiusSplit filter_by_radius(const std::vector<PlanEntry>& route,
                             const GeoPoint& home,
                             TransportMode mode,
                             const RadiusSettings& r) {
  RadiusSplit out;
  const auto limit = radius_limit_km(mode, r);

  for (const auto& e : route) {
    auto km = e.distance_from_home_km;
    if (!km) km = distance_from_home_km(e.patient, home);
    if (limit && km && *km > *limit) {
      PlanEntry moved = e;
      moved.distance_from_home_km = km;
      moved.relocated = true;
      out.relocated.push_back(std::move(moved));
      continue;
    }
    out.kept.push_back(e);
    out.kept.back().sequence_index = (int)out.kept.size() - 1;
  }
  return out;
}

} // namespace vp
