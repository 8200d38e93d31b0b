// time_budget.cpp
#include "time_budget.h"

#include <algorithm>
#include <numeric>

namespace vp {

BudgetResult evaluate_budget(const std::vector<int>& visit_minutes,
                             int travel_minutes,
                             int max_daily_minutes) {
  BudgetResult r;
  // a non-positive duration is a data issue, not time credit for the route
  r.total = std::accumulate(visit_minutes.begin(), visit_minutes.end(), 0,
                            [](int acc, int m) { return acc + std::max(0, m); }) +
            travel_minutes;
  r.over_budget = r.total > max_daily_minutes;
  r.overage = std::max(0, r.total - max_daily_minutes);
  return r;
}

RouteStats route_stats(const std::vector<PlanEntry>& route,
                       int travel_minutes,
                       int max_daily_minutes) {
  std::vector<int> visits;
  visits.reserve(route.size());
  for (const auto& e : route) visits.push_back(e.patient.visit_duration_minutes);

  const BudgetResult b = evaluate_budget(visits, travel_minutes, max_daily_minutes);

  RouteStats s;
  s.total_travel_minutes = travel_minutes;
  s.total_visit_minutes = b.total - travel_minutes;
  s.total_minutes = b.total;
  s.max_daily_minutes = max_daily_minutes;
  s.over_budget = b.over_budget;
  s.overage = b.overage;
  return s;
}

} // namespace vp
