// visit_actions.h
#pragma once
#include <optional>
#include <string>
#include "types.h"

namespace vp {

// State transitions on a patient record. The engine only computes the new
// record; storing it (atomically, per patient) is the caller's job.

struct VisitCompletion {
  Patient patient;              // updated record
  bool delete_patient = false;  // one-time patient: remove after confirmation
};

// last_visit := completed_at, planned date and snooze cleared. A temporary
// override is dropped, a permanent one becomes the primary provider.
VisitCompletion complete_visit(const Patient& p, const std::string& completed_at);

// Plan the patient for `date` regardless of interval; clears any snooze.
Patient schedule_visit(const Patient& p, const std::string& date);

// Take the patient off today's plan: planned date cleared, snoozed until tomorrow.
Patient unschedule_visit(const Patient& p, const std::string& today);

// provider_id == nullopt clears the override. A permanent override is
// promoted to primary by complete_visit, a temporary one is dropped there.
Patient set_override(const Patient& p, std::optional<int> provider_id, bool permanent);

} // namespace vp
