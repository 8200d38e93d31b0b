// config.cpp
#include "config.h"

#include <climits>
#include <cmath>
#include <stdexcept>
#include <string>

#include "geo.h"

using json = nlohmann::json;

namespace vp {

namespace {

int provider_key(const std::string& key, const char* section) {
  try {
    size_t used = 0;
    const int id = std::stoi(key, &used);
    if (used == key.size()) return id;
  } catch (const std::exception&) {
  }
  throw std::runtime_error(std::string(section) + ": provider id '" + key + "' is not an integer.");
}

void require_non_negative(double v, const char* name) {
  if (!std::isfinite(v) || v < 0.0)
    throw std::runtime_error(std::string(name) + " must be >= 0, got " + std::to_string(v));
}

} // namespace

PlannerConfig parse_config(const json& j) {
  if (!j.is_object()) throw std::runtime_error("Config must be a JSON object.");

  PlannerConfig c;
  PlanSettings& s = c.settings;
  try {
    s.home.lat        = j.value("HOME_LAT", 49.79245);
    s.home.lon        = j.value("HOME_LON", 9.93296);
    s.home_address    = j.value("HOME_ADDRESS", std::string("Praxis"));
    s.radius_walk_km  = j.value("RADIUS_WALK_KM", 1.5);
    s.radius_bike_km  = j.value("RADIUS_BIKE_KM", 5.0);
    s.log_progress    = j.value("LOG_PROGRESS", true);

    c.travel.speed_kmh          = j.value("SPEED_KMH", 30.0);
    c.travel.detour_factor      = j.value("DETOUR_FACTOR", 1.3);
    c.travel.hop_buffer_minutes = j.value("HOP_BUFFER_MINUTES", 5);
    c.default_max_daily_minutes = j.value("DEFAULT_MAX_DAILY_MINUTES", 240);

    if (j.contains("TRANSPORT_MODES")) {
      for (const auto& [key, v] : j.at("TRANSPORT_MODES").items()) {
        const std::string name = v.get<std::string>();
        auto mode = transport_mode_from_string(name);
        if (!mode) throw std::runtime_error("TRANSPORT_MODES: unknown mode '" + name + "'.");
        s.transport_modes[provider_key(key, "TRANSPORT_MODES")] = *mode;
      }
    }
    if (j.contains("MAX_DAILY_MINUTES")) {
      for (const auto& [key, v] : j.at("MAX_DAILY_MINUTES").items()) {
        const int id = provider_key(key, "MAX_DAILY_MINUTES");
        if (!v.is_number_integer() || v.get<long long>() <= 0 || v.get<long long>() > INT_MAX)
          throw std::runtime_error("MAX_DAILY_MINUTES: budget for provider " + key +
                                   " must be a positive integer, got " + v.dump());
        s.max_daily_minutes[id] = v.get<int>();
      }
    }
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("Config has a value of the wrong type: ") + e.what());
  }

  if (!valid_coordinates(s.home)) throw std::runtime_error("HOME_LAT/HOME_LON out of range.");
  require_non_negative(s.radius_walk_km, "RADIUS_WALK_KM");
  require_non_negative(s.radius_bike_km, "RADIUS_BIKE_KM");
  if (!(c.travel.speed_kmh > 0.0) || !std::isfinite(c.travel.speed_kmh))
    throw std::runtime_error("SPEED_KMH must be > 0.");
  if (!(c.travel.detour_factor >= 1.0))
    throw std::runtime_error("DETOUR_FACTOR must be >= 1.");
  if (c.travel.hop_buffer_minutes < 0)
    throw std::runtime_error("HOP_BUFFER_MINUTES must be >= 0.");
  if (c.default_max_daily_minutes <= 0)
    throw std::runtime_error("DEFAULT_MAX_DAILY_MINUTES must be > 0.");
  return c;
}

} // namespace vp
