// plan_io.h
#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "types.h"

namespace vp {

using json = nlohmann::json;

// ---- file helpers ----
json load_json(const std::string& path);
void save_json(const std::string& path, const json& j);
void save_text(const std::string& path, const std::string& text);

// ---- records ----
// Throw std::runtime_error naming the record on structural problems
// (not an array, missing id, wrong value type). Date strings are taken as
// given; malformed ones are flagged while planning.
std::vector<Patient> parse_patients(const json& arr);
std::vector<Provider> parse_providers(const json& arr, int default_max_daily_minutes = 240);

json patient_to_json(const Patient& p);
json patients_to_json(const std::vector<Patient>& patients);
json provider_to_json(const Provider& b);

// ---- plan output ----
json plan_to_json(const DailyPlan& plan);

// Plain-text day sheet: one block per provider, then the unassigned pool.
std::string plan_to_text(const DailyPlan& plan, const std::string& home_address);

} // namespace vp
