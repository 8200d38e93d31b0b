// main.cpp
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>
#include "config.h"
#include "daily_plan.h"
#include "plan_io.h"
#include "utils.h"
#include "visit_actions.h"

using namespace vp;

// ---------------- Minimal CLI ----------------
struct Flags {
  std::string mode = "plan";      // {plan|complete}
  std::string patients_path;      // required
  std::string providers_path;     // required
  std::string config_path;        // required
  std::string today;              // default: local date
  std::string out_path;           // plan JSON; stdout when empty
  std::string export_path;        // optional text sheet
  std::string complete_ids;       // "3,7,12"
  std::string patients_out;       // complete mode output
  bool verbose = true;            // flipped by --quiet
};

static void print_usage() {
  std::cout <<
R"(Usage:
  visit_planner --patients patients.json --providers providers.json --config config.json
                [--mode {plan|complete}] [--today YYYY-MM-DD] [--out plan.json]
                [--export plan.txt] [--complete ID,ID,...] [--patients_out PATH] [--quiet]

Required:
  --patients PATH
  --providers PATH
  --config PATH

Optional:
  --mode {plan|complete}  plan (default) builds today's routes;
                          complete records finished visits
  --today YYYY-MM-DD      Planning/completion date (default: today)
  --out PATH              Write plan JSON here instead of stdout
  --export PATH           Also write a plain-text day sheet
  --complete IDS          Patient ids whose visit was completed (complete mode)
  --patients_out PATH     Updated patient list (complete mode)
  --quiet                 Less logging
  --help
)";
}

static Flags parse_flags(int argc, char** argv) {
  Flags f;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&](const char* name) {
      if (i + 1 >= argc) { std::cerr << "Missing value for " << name << "\n"; std::exit(2); }
      return std::string(argv[++i]);
    };
    if (a == "--help" || a == "-h") { print_usage(); std::exit(0); }
    else if (a == "--mode")         f.mode = need("--mode");
    else if (a == "--patients")     f.patients_path = need("--patients");
    else if (a == "--providers")    f.providers_path = need("--providers");
    else if (a == "--config")       f.config_path = need("--config");
    else if (a == "--today")        f.today = need("--today");
    else if (a == "--out")          f.out_path = need("--out");
    else if (a == "--export")       f.export_path = need("--export");
    else if (a == "--complete")     f.complete_ids = need("--complete");
    else if (a == "--patients_out") f.patients_out = need("--patients_out");
    else if (a == "--quiet")        f.verbose = false;
    else { std::cerr << "Unknown flag: " << a << "\n"; print_usage(); std::exit(2); }
  }
  if (f.patients_path.empty() || f.providers_path.empty() || f.config_path.empty()) {
    std::cerr << "Missing required --patients/--providers/--config.\n"; print_usage(); std::exit(2);
  }
  if (f.mode != "plan" && f.mode != "complete") {
    std::cerr << "Unknown mode: " << f.mode << "\n"; print_usage(); std::exit(2);
  }
  if (f.mode == "complete" && (f.complete_ids.empty() || f.patients_out.empty())) {
    std::cerr << "complete mode needs --complete and --patients_out.\n"; std::exit(2);
  }
  if (f.today.empty()) f.today = today_local_ymd();
  if (!try_parse_day(f.today)) { std::cerr << "Bad --today: " << f.today << "\n"; std::exit(2); }
  return f;
}

static std::unordered_set<int> parse_id_list(const std::string& s) {
  std::unordered_set<int> ids;
  std::istringstream ss(s);
  std::string tok;
  while (std::getline(ss, tok, ',')) {
    if (tok.empty()) continue;
    try {
      ids.insert(std::stoi(tok));
    } catch (const std::exception&) {
      std::cerr << "Bad patient id in --complete: " << tok << "\n"; std::exit(2);
    }
  }
  return ids;
}

// ---------------- Modes ----------------
static int run_plan(const Flags& flags, const std::vector<Patient>& patients,
                    const std::vector<Provider>& providers, PlannerConfig cfg) {
  cfg.settings.today = flags.today;
  // engine progress goes to stdout, which carries the JSON when --out is absent
  cfg.settings.log_progress = cfg.settings.log_progress && flags.verbose && !flags.out_path.empty();

  DailyPlan plan;
  try {
    plan = build_daily_plan(patients, providers, cfg.settings, cfg.travel);
  } catch (const std::exception& e) {
    std::cerr << "Planning failed: " << e.what() << "\n"; return 3;
  }

  if (flags.verbose && !plan.data_issues.empty()) {
    std::cerr << "⚠️  " << plan.data_issues.size() << " data-quality issue(s):\n";
    for (const auto& d : plan.data_issues)
      std::cerr << "   • " << d.record << " " << d.record_id << " " << d.field << ": " << d.message << "\n";
  }

  const json out = plan_to_json(plan);
  try {
    if (flags.out_path.empty()) std::cout << out.dump(2) << "\n";
    else save_json(flags.out_path, out);
    if (!flags.export_path.empty())
      save_text(flags.export_path, plan_to_text(plan, cfg.settings.home_address));
  } catch (const std::exception& e) {
    std::cerr << "Failed to write result: " << e.what() << "\n"; return 4;
  }

  if (flags.verbose) {
    const AggregateStats& a = plan.aggregate_stats;
    // keep stdout clean for the JSON when no --out was given
    std::ostream& log = flags.out_path.empty() ? std::cerr : std::cout;
    log << "✅ " << plan.date << ": " << a.planned_patients << " planned, "
        << a.unassigned_patients << " need reassignment, " << a.total_minutes << " min total";
    if (a.providers_over_budget > 0) log << ", " << a.providers_over_budget << " over budget";
    log << "\n";
  }
  return 0;
}

static int run_complete(const Flags& flags, const std::vector<Patient>& patients) {
  const auto ids = parse_id_list(flags.complete_ids);

  std::vector<Patient> updated;
  updated.reserve(patients.size());
  int completed = 0, deleted = 0;
  for (const auto& p : patients) {
    if (!ids.count(p.id)) { updated.push_back(p); continue; }
    VisitCompletion vc;
    try {
      vc = complete_visit(p, flags.today);
    } catch (const std::exception& e) {
      std::cerr << "Cannot complete visit: " << e.what() << "\n"; return 3;
    }
    ++completed;
    if (vc.delete_patient) {
      ++deleted;
      if (flags.verbose) std::cout << "   • one-time patient " << p.id << " removed\n";
      continue;
    }
    updated.push_back(std::move(vc.patient));
  }
  if (completed < (int)ids.size())
    std::cerr << "⚠️  " << (ids.size() - completed) << " id(s) in --complete not found.\n";

  try { save_json(flags.patients_out, patients_to_json(updated)); }
  catch (const std::exception& e) { std::cerr << "Failed to write result: " << e.what() << "\n"; return 4; }

  if (flags.verbose)
    std::cout << "✅ " << completed << " visit(s) recorded, " << deleted
              << " one-time patient(s) removed -> " << flags.patients_out << "\n";
  return 0;
}

// ---------------- Main ----------------
int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);
  const Flags flags = parse_flags(argc, argv);

  PlannerConfig cfg;
  std::vector<Patient> patients;
  std::vector<Provider> providers;
  try {
    cfg = parse_config(load_json(flags.config_path));
    patients = parse_patients(load_json(flags.patients_path));
    providers = parse_providers(load_json(flags.providers_path), cfg.default_max_daily_minutes);
  } catch (const std::exception& e) {
    std::cerr << "Failed to load inputs: " << e.what() << "\n"; return 1;
  }

  if (flags.verbose) {
    std::ostream& log = (flags.mode == "plan" && flags.out_path.empty()) ? std::cerr : std::cout;
    log << "🗓  Visit planner — " << flags.mode << " " << flags.today << "\n"
        << "Inputs: patients=" << patients.size() << " providers=" << providers.size()
        << " speed=" << cfg.travel.speed_kmh << "km/h\n";
  }

  if (flags.mode == "complete") return run_complete(flags, patients);
  return run_plan(flags, patients, providers, cfg);
}
