// daily_plan.cpp
#include "daily_plan.h"

#include <iostream>
#include <stdexcept>
#include <unordered_map>

#include "assignment.h"
#include "due_date.h"
#include "geo.h"
#include "radius_filter.h"
#include "route_sequencer.h"
#include "time_budget.h"
#include "travel_time.h"
#include "utils.h"
#include "validation.h"

namespace vp {

namespace {

PlanEntry unrouted_entry(const Patient& p, const GeoPoint& home) {
  PlanEntry e;
  e.patient = p;
  e.distance_from_home_km = distance_from_home_km(p, home);
  e.no_coordinates = !e.distance_from_home_km.has_value();
  return e;
}

void add_to_aggregate(AggregateStats& agg, const ProviderRoute& r) {
  agg.total_travel_minutes += r.stats.total_travel_minutes;
  agg.total_visit_minutes += r.stats.total_visit_minutes;
  agg.total_minutes += r.stats.total_minutes;
  agg.total_overage += r.stats.overage;
  if (r.stats.over_budget) agg.providers_over_budget++;
  agg.planned_patients += (int)r.ordered_patients.size();
  for (const auto& e : r.ordered_patients)
    if (e.no_coordinates) agg.missing_coordinates++;
}

} // namespace

TransportMode mode_for(const Provider& b, const PlanSettings& s) {
  auto it = s.transport_modes.find(b.id);
  return it == s.transport_modes.end() ? TransportMode::Car : it->second;
}

int budget_for(const Provider& b, const PlanSettings& s) {
  auto it = s.max_daily_minutes.find(b.id);
  return it == s.max_daily_minutes.end() ? b.max_daily_minutes : it->second;
}

DailyPlan build_daily_plan(const std::vector<Patient>& patients,
                           const std::vector<Provider>& providers,
                           const PlanSettings& settings,
                           const TravelModel& travel) {
  const auto today = try_parse_day(settings.today);
  if (!today) throw std::runtime_error("Bad planning date: '" + settings.today + "'");
  if (!valid_coordinates(settings.home))
    throw std::runtime_error("Home coordinates out of range.");
  if (!(travel.speed_kmh > 0.0))
    throw std::runtime_error("Travel speed must be positive.");

  const bool log = settings.log_progress;
  const long long t0 = NowMillis();

  DailyPlan plan;
  plan.date = ymd_from_day(*today);
  plan.data_issues = validate_records(patients, providers);

  // ---- 1) due today, grouped by effective provider ----
  const ProviderIndex pidx = index_providers(providers);
  std::unordered_map<int, std::vector<Patient>> groups;
  int due_count = 0;

  for (const auto& p : patients) {
    const DueCheck dc = check_due(p, *today);
    if (dc.issue) plan.data_issues.push_back(*dc.issue);
    if (!dc.due) continue;
    ++due_count;

    const Provider* b = effective_provider(p, pidx);
    if (!b) {
      UnassignedEntry u;
      u.entry = unrouted_entry(p, settings.home);
      u.reason = UnassignedReason::NoProvider;
      plan.unassigned_or_relocated.push_back(std::move(u));
      continue;
    }
    groups[b->id].push_back(p);
  }

  if (log) {
    std::cout << "[daily_plan] " << plan.date << ": " << due_count << " of " << patients.size()
              << " patients due, " << plan.unassigned_or_relocated.size() << " without provider\n";
  }

  // ---- 2) per provider route, in provider input order ----
  const RadiusSettings radius{settings.radius_walk_km, settings.radius_bike_km};

  for (const auto& b : providers) {
    if (pidx.at(b.id) != &b) continue;   // duplicate id: first record owns the route

    ProviderRoute r;
    r.provider = b;
    r.mode = mode_for(b, settings);

    int first_travel = 0;
    size_t relocated = 0;
    auto git = groups.find(b.id);
    if (git != groups.end()) {
      std::vector<PlanEntry> route = sequence_route(settings.home, git->second);
      first_travel = route_travel_minutes(settings.home, route, travel);

      RadiusSplit split = filter_by_radius(route, settings.home, r.mode, radius);
      relocated = split.relocated.size();
      for (auto& e : split.relocated) {
        UnassignedEntry u;
        u.entry = std::move(e);
        u.reason = UnassignedReason::OutOfRadius;
        u.from_provider_id = b.id;
        plan.unassigned_or_relocated.push_back(std::move(u));
      }
      r.ordered_patients = std::move(split.kept);
    }

    // kept patients keep their order; travel is recomputed without the removed stops
    const int travel_min = route_travel_minutes(settings.home, r.ordered_patients, travel);
    if (log && relocated > 0) {
      std::cout << "[daily_plan] " << b.name << " (" << to_string(r.mode) << "): "
                << relocated << " outside radius, travel " << first_travel
                << " -> " << travel_min << " min\n";
    }

    r.stats = route_stats(r.ordered_patients, travel_min, budget_for(b, settings));

    if (log && r.stats.over_budget) {
      std::cerr << "[daily_plan] " << b.name << " over budget by " << r.stats.overage
                << " min (" << r.stats.total_minutes << "/" << r.stats.max_daily_minutes << ")\n";
    }

    add_to_aggregate(plan.aggregate_stats, r);
    plan.routes_by_provider.push_back(std::move(r));
  }

  // ---- 3) pool bookkeeping ----
  for (size_t i = 0; i < plan.unassigned_or_relocated.size(); ++i) {
    auto& u = plan.unassigned_or_relocated[i];
    u.entry.sequence_index = (int)i;
    if (u.entry.no_coordinates) plan.aggregate_stats.missing_coordinates++;
  }
  plan.aggregate_stats.unassigned_patients = (int)plan.unassigned_or_relocated.size();

  if (log) {
    std::cout << "[daily_plan] done in " << (NowMillis() - t0) << " ms: "
              << plan.aggregate_stats.planned_patients << " planned, "
              << plan.aggregate_stats.unassigned_patients << " unassigned, "
              << plan.aggregate_stats.total_minutes << " min total\n";
  }
  return plan;
}

} // namespace vp
