// visit_actions.cpp
#include "visit_actions.h"
#include "utils.h"

namespace vp {

VisitCompletion complete_visit(const Patient& p, const std::string& completed_at) {
  if (!try_parse_day(completed_at))
    throw std::runtime_error("Bad completion date for patient " + std::to_string(p.id) +
                             ": " + completed_at);

  VisitCompletion out{p, p.is_one_time()};
  Patient& q = out.patient;
  q.last_visit = completed_at;
  q.planned_visit_date.reset();
  q.snooze_until.reset();

  if (q.override_provider_id) {
    if (q.override_permanent) q.primary_provider_id = q.override_provider_id;
    q.override_provider_id.reset();
    q.override_permanent = false;
  }
  return out;
}

Patient schedule_visit(const Patient& p, const std::string& date) {
  if (!try_parse_day(date))
    throw std::runtime_error("Bad schedule date for patient " + std::to_string(p.id) + ": " + date);
  Patient q = p;
  q.planned_visit_date = date;
  q.snooze_until.reset();
  return q;
}

Patient unschedule_visit(const Patient& p, const std::string& today) {
  Patient q = p;
  q.planned_visit_date.reset();
  q.snooze_until = ymd_add_days(today, 1);
  return q;
}

Patient set_override(const Patient& p, std::optional<int> provider_id, bool permanent) {
  Patient q = p;
  q.override_provider_id = provider_id;
  q.override_permanent = provider_id.has_value() && permanent;
  return q;
}

} // namespace vp
