// route_sequencer.cpp
#include "route_sequencer.h"
#include "geo.h"

#include <limits>

namespace vp {

std::vector<PlanEntry> sequence_route(const GeoPoint& start,
                                      const std::vector<Patient>& patients) {
  std::vector<int> unvisited;        // indices into `patients`, input order
  std::vector<int> no_coords;
  unvisited.reserve(patients.size());
  for (int i = 0; i < (int)patients.size(); ++i) {
    const auto& c = patients[i].coordinates;
    if (c && valid_coordinates(*c)) unvisited.push_back(i);
    else no_coords.push_back(i);
  }

  std::vector<PlanEntry> route;
  route.reserve(patients.size());

  GeoPoint current = start;
  while (!unvisited.empty()) {
    size_t best = 0;
    double best_km = std::numeric_limits<double>::infinity();
    for (size_t k = 0; k < unvisited.size(); ++k) {
      const double km = haversine_km(current, *patients[unvisited[k]].coordinates);
      if (km < best_km) { best_km = km; best = k; }   // strict: earliest wins ties
    }
    const Patient& p = patients[unvisited[best]];

    PlanEntry e;
    e.sequence_index = (int)route.size();
    e.patient = p;
    e.distance_from_home_km = haversine_km(start, *p.coordinates);
    route.push_back(std::move(e));

    current = *p.coordinates;
    unvisited.erase(unvisited.begin() + best);
  }

  for (int i : no_coords) {
    PlanEntry e;
    e.sequence_index = (int)route.size();
    e.patient = patients[i];
    e.no_coordinates = true;
    route.push_back(std::move(e));
  }
  return route;
}

} // namespace vp
