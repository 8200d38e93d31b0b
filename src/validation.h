// validation.h
#pragma once
#include <string>
#include <vector>

#include "types.h"

namespace vp {

// Record-level data-quality checks. Nothing here throws: every problem is
// reported as a DataIssue and the run carries on with what is usable.
std::vector<DataIssue> validate_records(const std::vector<Patient>& patients,
                                        const std::vector<Provider>& providers);

// ---- Patient field checks ----
void validate_patient_ids(const std::vector<Patient>& patients, std::vector<DataIssue>& out);
void validate_visit_durations(const std::vector<Patient>& patients, std::vector<DataIssue>& out);
void validate_intervals(const std::vector<Patient>& patients, std::vector<DataIssue>& out);
void validate_coordinates(const std::vector<Patient>& patients, std::vector<DataIssue>& out);

// ---- Provider checks ----
void validate_provider_ids(const std::vector<Provider>& providers, std::vector<DataIssue>& out);
void validate_provider_budgets(const std::vector<Provider>& providers, std::vector<DataIssue>& out);

// ---- Cross references ----
void validate_provider_references(const std::vector<Patient>& patients,
                                  const std::vector<Provider>& providers,
                                  std::vector<DataIssue>& out);

} // namespace vp
