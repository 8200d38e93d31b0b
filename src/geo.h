// geo.h
#pragma once
#include <algorithm>
#include <cmath>
#include <optional>
#include "types.h"

namespace vp {

constexpr double kEarthRadiusKm = 6371.0;

// Great-circle distance in kilometers (haversine).
double haversine_km(const GeoPoint& a, const GeoPoint& b);

inline bool valid_coordinates(const GeoPoint& p) {
  return std::isfinite(p.lat) && std::isfinite(p.lon) &&
         p.lat >= -90.0 && p.lat <= 90.0 &&
         p.lon >= -180.0 && p.lon <= 180.0;
}

// Distance from home, or nullopt when the patient has no usable coordinates.
std::optional<double> distance_from_home_km(const Patient& p, const GeoPoint& home);

} // namespace vp
