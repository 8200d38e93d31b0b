// due_date.h
#pragma once
#include <optional>
#include <string>
#include "types.h"

namespace vp {

struct DueCheck {
  bool due = false;
  std::optional<DataIssue> issue;   // set when a date field could not be read
};

// Core rule, on day numbers. Never throws: a malformed date yields
// due=false plus an issue the caller can surface.
DueCheck check_due(const Patient& p, int today_day);

// Convenience form on an ISO date string; a malformed `today` is never due.
bool is_due(const Patient& p, const std::string& today);

// Date the next visit falls due: planned date for one-time patients,
// last_visit + interval for recurring ones. nullopt if unknown/malformed
// or later than 9999-12-31.
std::optional<std::string> next_due_date(const Patient& p);

} // namespace vp
