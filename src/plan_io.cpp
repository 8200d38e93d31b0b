// plan_io.cpp
#include "plan_io.h"

#include <climits>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace vp {

json load_json(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Cannot open file: " + path);
  try {
    json j; in >> j; return j;
  } catch (const json::parse_error& e) {
    throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
  }
}

void save_json(const std::string& path, const json& j) {
  save_text(path, j.dump(2) + "\n");
}

void save_text(const std::string& path, const std::string& text) {
  const fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Cannot write file: " + path);
  out << text;
}

// ---------------- records ----------------

// Integer field that must fit in int; wider values are rejected, not truncated.
static int checked_int(const json& v, const char* key) {
  bool fits = true;
  if (v.is_number_unsigned())
    fits = v.get<std::uint64_t>() <= (std::uint64_t)INT_MAX;
  else if (v.is_number_integer())
    fits = v.get<std::int64_t>() >= INT_MIN && v.get<std::int64_t>() <= INT_MAX;
  else if (v.is_number_float())
    fits = v.get<double>() >= INT_MIN && v.get<double>() <= INT_MAX;
  if (!fits) throw std::runtime_error(std::string(key) + " out of range: " + v.dump());
  return v.get<int>();
}

static int int_value(const json& j, const char* key, int fallback) {
  if (!j.contains(key) || j[key].is_null()) return fallback;
  return checked_int(j[key], key);
}

static std::optional<int> opt_int(const json& j, const char* key) {
  if (!j.contains(key) || j[key].is_null()) return std::nullopt;
  return checked_int(j[key], key);
}

// Date fields are read leniently: a non-string value keeps its JSON text so
// due-date resolution reports it as malformed instead of failing the load.
static std::optional<std::string> opt_date(const json& j, const char* key) {
  if (!j.contains(key) || j[key].is_null()) return std::nullopt;
  return j[key].is_string() ? j[key].get<std::string>() : j[key].dump();
}

static std::optional<GeoPoint> parse_coordinates(const json& t) {
  // Accept {"coordinates": {"lat","lon"}} or flat latitude/longitude
  if (t.contains("coordinates") && t["coordinates"].is_object()) {
    const auto& c = t["coordinates"];
    if (!c.contains("lat") || !c.contains("lon") || c["lat"].is_null() || c["lon"].is_null())
      return std::nullopt;
    return GeoPoint{c["lat"].get<double>(), c["lon"].get<double>()};
  }
  if (t.contains("latitude") && t.contains("longitude") &&
      !t["latitude"].is_null() && !t["longitude"].is_null()) {
    return GeoPoint{t["latitude"].get<double>(), t["longitude"].get<double>()};
  }
  return std::nullopt;
}

std::vector<Patient> parse_patients(const json& arr) {
  if (!arr.is_array()) throw std::runtime_error("patients must be a JSON array.");
  std::vector<Patient> out;
  out.reserve(arr.size());

  for (size_t i = 0; i < arr.size(); ++i) {
    const json& t = arr[i];
    if (!t.is_object() || !t.contains("id"))
      throw std::runtime_error("Patient " + std::to_string(i) + " missing required field: id");
    try {
      Patient p;
      p.id = checked_int(t.at("id"), "id");
      if (t.contains("name")) {
        p.name = t["name"].get<std::string>();
      } else {
        p.name = t.value("vorname", std::string()) + " " + t.value("nachname", std::string());
        if (p.name == " ") p.name.clear();
      }
      p.address                = t.value("address", std::string());
      p.coordinates            = parse_coordinates(t);
      p.visit_duration_minutes = int_value(t, "visit_duration_minutes", 30);
      p.interval_days          = int_value(t, "interval_days", 0);
      p.last_visit             = opt_date(t, "last_visit").value_or(std::string());
      p.planned_visit_date     = opt_date(t, "planned_visit_date");
      p.snooze_until           = opt_date(t, "snooze_until");
      p.primary_provider_id    = opt_int(t, "primary_provider_id");
      p.override_provider_id   = opt_int(t, "override_provider_id");
      p.override_permanent     = t.value("override_permanent", false);
      out.push_back(std::move(p));
    } catch (const json::exception& e) {
      throw std::runtime_error("Patient " + std::to_string(i) + ": " + e.what());
    } catch (const std::runtime_error& e) {
      throw std::runtime_error("Patient " + std::to_string(i) + ": " + e.what());
    }
  }
  return out;
}

std::vector<Provider> parse_providers(const json& arr, int default_max_daily_minutes) {
  if (!arr.is_array()) throw std::runtime_error("providers must be a JSON array.");
  std::vector<Provider> out;
  out.reserve(arr.size());

  for (size_t i = 0; i < arr.size(); ++i) {
    const json& t = arr[i];
    if (!t.is_object() || !t.contains("id"))
      throw std::runtime_error("Provider " + std::to_string(i) + " missing required field: id");
    try {
      Provider b;
      b.id                = checked_int(t.at("id"), "id");
      b.name              = t.value("name", std::string());
      b.role              = t.value("role", std::string());
      b.color             = t.value("color", std::string("#33656E"));
      b.max_daily_minutes = int_value(t, "max_daily_minutes", default_max_daily_minutes);
      out.push_back(std::move(b));
    } catch (const json::exception& e) {
      throw std::runtime_error("Provider " + std::to_string(i) + ": " + e.what());
    } catch (const std::runtime_error& e) {
      throw std::runtime_error("Provider " + std::to_string(i) + ": " + e.what());
    }
  }
  return out;
}

template <typename T>
static json opt_json(const std::optional<T>& v) {
  return v ? json(*v) : json(nullptr);
}

json patient_to_json(const Patient& p) {
  json j;
  j["id"] = p.id;
  j["name"] = p.name;
  j["address"] = p.address;
  if (p.coordinates)
    j["coordinates"] = {{"lat", p.coordinates->lat}, {"lon", p.coordinates->lon}};
  else
    j["coordinates"] = nullptr;
  j["visit_duration_minutes"] = p.visit_duration_minutes;
  j["interval_days"] = p.interval_days;
  j["last_visit"] = p.last_visit;
  j["planned_visit_date"] = opt_json(p.planned_visit_date);
  j["snooze_until"] = opt_json(p.snooze_until);
  j["primary_provider_id"] = opt_json(p.primary_provider_id);
  j["override_provider_id"] = opt_json(p.override_provider_id);
  j["override_permanent"] = p.override_permanent;
  return j;
}

json patients_to_json(const std::vector<Patient>& patients) {
  json out = json::array();
  for (const auto& p : patients) out.push_back(patient_to_json(p));
  return out;
}

json provider_to_json(const Provider& b) {
  return {{"id", b.id},
          {"name", b.name},
          {"role", b.role},
          {"color", b.color},
          {"max_daily_minutes", b.max_daily_minutes}};
}

// ---------------- plan ----------------

static json entry_to_json(const PlanEntry& e) {
  json j = patient_to_json(e.patient);
  j["sequence_index"] = e.sequence_index;
  j["distance_from_home_km"] = opt_json(e.distance_from_home_km);
  j["no_coordinates"] = e.no_coordinates;
  j["relocated"] = e.relocated;
  return j;
}

static json stats_to_json(const RouteStats& s) {
  return {{"total_travel_minutes", s.total_travel_minutes},
          {"total_visit_minutes", s.total_visit_minutes},
          {"total_minutes", s.total_minutes},
          {"max_daily_minutes", s.max_daily_minutes},
          {"over_budget", s.over_budget},
          {"overage", s.overage}};
}

json plan_to_json(const DailyPlan& plan) {
  json routes = json::array();
  for (const auto& r : plan.routes_by_provider) {
    json stops = json::array();
    for (const auto& e : r.ordered_patients) stops.push_back(entry_to_json(e));
    routes.push_back({{"provider", provider_to_json(r.provider)},
                      {"transport_mode", to_string(r.mode)},
                      {"ordered_patients", stops},
                      {"stats", stats_to_json(r.stats)}});
  }

  json pool = json::array();
  for (const auto& u : plan.unassigned_or_relocated) {
    json j = entry_to_json(u.entry);
    j["reason"] = to_string(u.reason);
    j["from_provider_id"] = opt_json(u.from_provider_id);
    pool.push_back(std::move(j));
  }

  const AggregateStats& a = plan.aggregate_stats;
  json agg = {{"total_travel_minutes", a.total_travel_minutes},
              {"total_visit_minutes", a.total_visit_minutes},
              {"total_minutes", a.total_minutes},
              {"total_overage", a.total_overage},
              {"providers_over_budget", a.providers_over_budget},
              {"planned_patients", a.planned_patients},
              {"unassigned_patients", a.unassigned_patients},
              {"missing_coordinates", a.missing_coordinates}};

  json issues = json::array();
  for (const auto& d : plan.data_issues)
    issues.push_back({{"record", d.record}, {"id", d.record_id},
                      {"field", d.field}, {"message", d.message}});

  return {{"date", plan.date},
          {"routes_by_provider", routes},
          {"unassigned_or_relocated", pool},
          {"aggregate_stats", agg},
          {"data_issues", issues}};
}

static std::string hm(int minutes) {
  std::ostringstream oss;
  oss << minutes / 60 << "h " << std::setw(2) << std::setfill('0') << minutes % 60 << "m";
  return oss.str();
}

std::string plan_to_text(const DailyPlan& plan, const std::string& home_address) {
  std::ostringstream out;
  out << "Day plan " << plan.date << "  (start/end: " << home_address << ")\n";
  out << std::string(60, '=') << "\n";

  for (const auto& r : plan.routes_by_provider) {
    const RouteStats& s = r.stats;
    out << "\n" << r.provider.name;
    if (!r.provider.role.empty()) out << " (" << r.provider.role << ")";
    out << " - " << to_string(r.mode) << "\n";
    out << "  " << hm(s.total_minutes) << " of " << hm(s.max_daily_minutes) << ": "
        << s.total_visit_minutes << "m visits + " << s.total_travel_minutes << "m travel\n";
    if (s.over_budget)
      out << "  WARNING: over budget by " << s.overage << " minutes\n";
    if (r.ordered_patients.empty()) out << "  (no visits)\n";

    for (const auto& e : r.ordered_patients) {
      out << "  " << std::setw(2) << std::setfill(' ') << (e.sequence_index + 1) << ". "
          << e.patient.name << ", " << e.patient.address << "  ["
          << e.patient.visit_duration_minutes << " min";
      if (e.distance_from_home_km)
        out << ", " << std::fixed << std::setprecision(1) << *e.distance_from_home_km << " km";
      else
        out << ", no coordinates";
      out << "]\n";
    }
  }

  if (!plan.unassigned_or_relocated.empty()) {
    out << "\nNeeds reassignment\n" << std::string(60, '-') << "\n";
    for (const auto& u : plan.unassigned_or_relocated) {
      out << "  - " << u.entry.patient.name << ", " << u.entry.patient.address << "  ("
          << to_string(u.reason);
      if (u.from_provider_id) out << ", from provider " << *u.from_provider_id;
      if (u.entry.distance_from_home_km)
        out << ", " << std::fixed << std::setprecision(1) << *u.entry.distance_from_home_km << " km";
      out << ")\n";
    }
  }

  const AggregateStats& a = plan.aggregate_stats;
  out << "\nTotal: " << a.planned_patients << " visits, " << hm(a.total_minutes)
      << " (" << a.total_visit_minutes << "m visits + " << a.total_travel_minutes << "m travel)";
  if (a.providers_over_budget > 0) out << ", " << a.providers_over_budget << " over budget";
  out << "\n";
  return out.str();
}

} // namespace vp
