// geo.cpp
#include "geo.h"

namespace vp {

namespace {
constexpr double kPi = 3.14159265358979323846;
inline double to_radians(double deg) { return deg * kPi / 180.0; }
}

double haversine_km(const GeoPoint& a, const GeoPoint& b) {
  const double lat1 = to_radians(a.lat), lat2 = to_radians(b.lat);
  const double dlat = lat2 - lat1;
  const double dlon = to_radians(b.lon - a.lon);
  const double s = std::sin(dlat / 2) * std::sin(dlat / 2) +
                   std::cos(lat1) * std::cos(lat2) * std::sin(dlon / 2) * std::sin(dlon / 2);
  // clamp: rounding can push s marginally above 1 for antipodal points
  const double c = 2.0 * std::asin(std::sqrt(std::min(1.0, s)));
  return kEarthRadiusKm * c;
}

std::optional<double> distance_from_home_km(const Patient& p, const GeoPoint& home) {
  if (!p.coordinates || !valid_coordinates(*p.coordinates)) return std::nullopt;
  return haversine_km(home, *p.coordinates);
}

} // namespace vp
