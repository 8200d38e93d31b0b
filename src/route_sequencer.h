// route_sequencer.h
#pragma once
#include <vector>
#include "types.h"

namespace vp {

// Nearest-neighbour ordering from `start`. Patients without usable
// coordinates follow the routed ones in their input order, flagged
// no_coordinates. Ties go to the earlier input position, so identical
// input always yields identical output.
std::vector<PlanEntry> sequence_route(const GeoPoint& start,
                                      const std::vector<Patient>& patients);

} // namespace vp
