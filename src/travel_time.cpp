// travel_time.cpp
#include "travel_time.h"
#include "geo.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace vp {

int hop_minutes(double km, const TravelModel& model) {
  if (!(model.speed_kmh > 0.0))
    throw std::runtime_error("Travel speed must be positive, got " + std::to_string(model.speed_kmh));
  const double road_km = km * model.detour_factor;
  const double minutes = road_km / model.speed_kmh * 60.0;
  return static_cast<int>(std::llround(minutes)) + model.hop_buffer_minutes;
}

int estimate_minutes(const std::vector<GeoPoint>& loop, const TravelModel& model) {
  int total = 0;
  for (size_t i = 1; i < loop.size(); ++i)
    total += hop_minutes(haversine_km(loop[i - 1], loop[i]), model);
  return total;
}

std::vector<GeoPoint> route_loop(const GeoPoint& home, const std::vector<PlanEntry>& route) {
  std::vector<GeoPoint> pts;
  pts.reserve(route.size() + 2);
  pts.push_back(home);
  for (const auto& e : route) {
    if (e.no_coordinates || !e.patient.coordinates) continue;
    pts.push_back(*e.patient.coordinates);
  }
  if (pts.size() == 1) return {};
  pts.push_back(home);
  return pts;
}

} // namespace vp
