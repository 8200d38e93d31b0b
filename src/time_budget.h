// time_budget.h
#pragma once
#include <vector>
#include "types.h"

namespace vp {

struct BudgetResult {
  int total = 0;
  bool over_budget = false;
  int overage = 0;
};

// total = sum(visit minutes) + travel; over_budget when total > budget.
// Non-positive visit minutes count as zero.
BudgetResult evaluate_budget(const std::vector<int>& visit_minutes,
                             int travel_minutes,
                             int max_daily_minutes);

// Full per-route statistics over a finalised route.
RouteStats route_stats(const std::vector<PlanEntry>& route,
                       int travel_minutes,
                       int max_daily_minutes);

} // namespace vp
