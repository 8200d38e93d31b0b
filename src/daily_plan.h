// daily_plan.h
#pragma once
#include <vector>
#include "types.h"

namespace vp {

// One synchronous pass over caller-supplied snapshots:
//   due -> group by effective provider -> sequence -> estimate travel
//   -> radius filter -> final stats -> aggregate.
// Bad records degrade into data_issues / the unassigned pool. Throws
// std::runtime_error only for unusable run settings (bad `today`, bad home
// coordinates, non-positive speed).
DailyPlan build_daily_plan(const std::vector<Patient>& patients,
                           const std::vector<Provider>& providers,
                           const PlanSettings& settings,
                           const TravelModel& travel);

TransportMode mode_for(const Provider& b, const PlanSettings& s);
int budget_for(const Provider& b, const PlanSettings& s);

} // namespace vp
