// types.h
#pragma once
#include <vector>
#include <string>
#include <map>
#include <optional>

namespace vp {

struct GeoPoint {
  double lat = 0.0;
  double lon = 0.0;
};

enum class TransportMode { Car, Bike, Walk };

struct Patient {
  int id = 0;
  std::string name;                          // already decrypted, display only
  std::string address;                       // opaque to the engine
  std::optional<GeoPoint> coordinates;       // absent until geocoding succeeded
  int visit_duration_minutes = 30;
  int interval_days = 0;                     // 0 = one-time patient
  std::string last_visit;                    // "YYYY-MM-DD[THH:MM:SS]"
  std::optional<std::string> planned_visit_date;
  std::optional<std::string> snooze_until;
  std::optional<int> primary_provider_id;
  std::optional<int> override_provider_id;
  bool override_permanent = false;

  bool is_one_time() const { return interval_days == 0; }
};

struct Provider {
  int id = 0;
  std::string name;
  std::string role;                          // "Arzt", "VERAH", ...
  std::string color = "#33656E";             // passed through untouched
  int max_daily_minutes = 240;
};

// Per-run settings. Session-local choices (transport mode, budget override)
// are passed in here and never kept between runs.
struct PlanSettings {
  std::string today;                         // "YYYY-MM-DD"
  GeoPoint home;
  std::string home_address;
  double radius_walk_km = 1.5;
  double radius_bike_km = 5.0;
  std::map<int, TransportMode> transport_modes;    // provider id -> mode (default car)
  std::map<int, int> max_daily_minutes;            // provider id -> budget override
  bool log_progress = false;
};

struct TravelModel {
  double speed_kmh = 30.0;
  double detour_factor = 1.3;                // straight line -> road
  int hop_buffer_minutes = 5;                // parking/entry per hop
};

struct DataIssue {
  int record_id = 0;
  std::string field;
  std::string message;
  std::string record = "patient";            // "patient" | "provider" | "settings"
};

struct PlanEntry {
  int sequence_index = 0;                    // 0-based position in the route
  Patient patient;
  std::optional<double> distance_from_home_km;
  bool no_coordinates = false;
  bool relocated = false;
};

struct RouteStats {
  int total_travel_minutes = 0;
  int total_visit_minutes = 0;
  int total_minutes = 0;
  int max_daily_minutes = 0;
  bool over_budget = false;
  int overage = 0;
};

struct ProviderRoute {
  Provider provider;
  TransportMode mode = TransportMode::Car;
  std::vector<PlanEntry> ordered_patients;
  RouteStats stats;
};

enum class UnassignedReason { NoProvider, OutOfRadius };

struct UnassignedEntry {
  PlanEntry entry;
  UnassignedReason reason = UnassignedReason::NoProvider;
  std::optional<int> from_provider_id;       // set when relocated by the radius filter
};

struct AggregateStats {
  int total_travel_minutes = 0;
  int total_visit_minutes = 0;
  int total_minutes = 0;
  int total_overage = 0;
  int providers_over_budget = 0;
  int planned_patients = 0;
  int unassigned_patients = 0;
  int missing_coordinates = 0;
};

struct DailyPlan {
  std::string date;
  std::vector<ProviderRoute> routes_by_provider;
  std::vector<UnassignedEntry> unassigned_or_relocated;
  AggregateStats aggregate_stats;
  std::vector<DataIssue> data_issues;
};

const char* to_string(TransportMode m);
std::optional<TransportMode> transport_mode_from_string(const std::string& s);
const char* to_string(UnassignedReason r);

} // namespace vp
