// due_date.cpp
#include "due_date.h"
#include "utils.h"

namespace vp {

namespace {

// 9999-12-31, the last day a "YYYY-MM-DD" string can name
constexpr int kLastDay = 2932896;

DueCheck not_due(const Patient& p, const char* field, const std::string& value) {
  DueCheck r;
  r.issue = DataIssue{p.id, field, "malformed date '" + value + "'"};
  return r;
}

} // namespace

DueCheck check_due(const Patient& p, int today) {
  std::optional<int> planned;
  if (p.planned_visit_date) {
    planned = try_parse_day(*p.planned_visit_date);
    if (!planned) return not_due(p, "planned_visit_date", *p.planned_visit_date);
    // explicit date for today beats interval and snooze
    if (*planned == today) return DueCheck{true, std::nullopt};
  }

  if (p.snooze_until) {
    auto snooze = try_parse_day(*p.snooze_until);
    if (!snooze) return not_due(p, "snooze_until", *p.snooze_until);
    if (*snooze > today) return DueCheck{};
  }

  // reported by validate_intervals, not here
  if (p.interval_days < 0) return DueCheck{};

  if (p.is_one_time()) {
    // without a planned date a one-time patient is never surfaced
    return DueCheck{planned.has_value() && *planned <= today, std::nullopt};
  }

  auto last = try_parse_day(p.last_visit);
  if (!last) return not_due(p, "last_visit", p.last_visit);
  return DueCheck{p.interval_days <= today - *last, std::nullopt};
}

bool is_due(const Patient& p, const std::string& today) {
  auto t = try_parse_day(today);
  if (!t) return false;
  return check_due(p, *t).due;
}

std::optional<std::string> next_due_date(const Patient& p) {
  if (p.is_one_time() || p.interval_days < 0) {
    if (!p.planned_visit_date) return std::nullopt;
    auto d = try_parse_day(*p.planned_visit_date);
    if (!d) return std::nullopt;
    return ymd_from_day(*d);
  }
  auto last = try_parse_day(p.last_visit);
  if (!last) return std::nullopt;
  const long long next = (long long)*last + p.interval_days;
  if (next > kLastDay) return std::nullopt;
  return ymd_from_day((int)next);
}

} // namespace vp
