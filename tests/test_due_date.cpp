#include <gtest/gtest.h>

#include <climits>

#include "due_date.h"
#include "test_helpers.h"
#include "utils.h"

using namespace vp;
using vp::test::one_time;
using vp::test::recurring;

TEST(DueDate, WeeklyPatientExample) {
  const Patient p = recurring(1, "2024-01-01", 7);
  EXPECT_FALSE(is_due(p, "2024-01-07"));
  EXPECT_TRUE(is_due(p, "2024-01-08"));
  EXPECT_TRUE(is_due(p, "2024-01-09"));   // overdue stays due
}

TEST(DueDate, DueExactlyOnIntervalBoundary) {
  for (int interval : {1, 3, 14, 28, 90}) {
    for (const char* last : {"2023-12-20", "2024-02-27", "2024-12-31T16:45:00"}) {
      const Patient p = recurring(1, last, interval);
      const std::string due_day = ymd_add_days(std::string(last).substr(0, 10), interval);
      EXPECT_TRUE(is_due(p, due_day)) << last << " + " << interval;
      EXPECT_FALSE(is_due(p, ymd_add_days(due_day, -1))) << last << " + " << interval;
    }
  }
}

TEST(DueDate, TimeOfDayIsIgnored) {
  const Patient p = recurring(1, "2024-01-01T23:59:59", 1);
  EXPECT_TRUE(is_due(p, "2024-01-02"));
  EXPECT_TRUE(is_due(p, "2024-01-02 00:00:01"));
}

TEST(DueDate, PlannedTodayOverridesInterval) {
  Patient p = recurring(1, "2024-01-05", 30);
  p.planned_visit_date = "2024-01-06T08:00:00";
  EXPECT_TRUE(is_due(p, "2024-01-06"));
  // a planned date in the past does not make a recurring patient due
  EXPECT_FALSE(is_due(p, "2024-01-07"));
}

TEST(DueDate, OneTimePatient) {
  const Patient p = one_time(2, "2024-03-10");
  EXPECT_FALSE(is_due(p, "2024-03-09"));
  EXPECT_TRUE(is_due(p, "2024-03-10"));
  EXPECT_TRUE(is_due(p, "2024-03-15"));   // overdue one-time visit
}

TEST(DueDate, OneTimeWithoutPlannedDateIsNeverDue) {
  Patient p = recurring(3, "2020-01-01", 0);
  EXPECT_FALSE(is_due(p, "2020-01-01"));
  EXPECT_FALSE(is_due(p, "2030-01-01"));
}

TEST(DueDate, SnoozeHidesUntilDate) {
  Patient p = recurring(4, "2024-01-01", 7);
  p.snooze_until = "2024-01-10";
  EXPECT_FALSE(is_due(p, "2024-01-09"));
  EXPECT_TRUE(is_due(p, "2024-01-10"));

  p.planned_visit_date = "2024-01-09";
  EXPECT_TRUE(is_due(p, "2024-01-09"));
}

TEST(DueDate, MalformedDatesAreNotDueAndFlagged) {
  Patient p = recurring(5, "yesterday", 7);
  DueCheck dc = check_due(p, parse_day("2024-05-01"));
  EXPECT_FALSE(dc.due);
  ASSERT_TRUE(dc.issue.has_value());
  EXPECT_EQ(dc.issue->record_id, 5);
  EXPECT_EQ(dc.issue->field, "last_visit");

  Patient q = one_time(6, "2024-02-30");
  dc = check_due(q, parse_day("2024-05-01"));
  EXPECT_FALSE(dc.due);
  ASSERT_TRUE(dc.issue.has_value());
  EXPECT_EQ(dc.issue->field, "planned_visit_date");

  EXPECT_FALSE(is_due(recurring(7, "2024-01-01", 1), "not-a-date"));
}

TEST(DueDate, NegativeIntervalIsNotDue) {
  const Patient p = recurring(8, "2024-01-01", -3);
  DueCheck dc = check_due(p, parse_day("2025-01-01"));
  EXPECT_FALSE(dc.due);
  // validation owns this record-level issue
  EXPECT_FALSE(dc.issue.has_value());
}

TEST(DueDate, HugeIntervalIsNeverDue) {
  const Patient p = recurring(10, "2024-01-01", INT_MAX);
  EXPECT_FALSE(is_due(p, "2024-01-02"));
  EXPECT_FALSE(is_due(p, "9999-12-31"));
  EXPECT_FALSE(next_due_date(p).has_value());

  const Patient q = recurring(11, "2024-01-01", 1000000);
  EXPECT_FALSE(is_due(q, "4000-01-01"));
  EXPECT_TRUE(next_due_date(q).has_value());
}

TEST(DueDate, LeapYearArithmetic) {
  const Patient p = recurring(9, "2024-02-28", 1);
  EXPECT_TRUE(is_due(p, "2024-02-29"));
  EXPECT_EQ(*next_due_date(p), "2024-02-29");
  EXPECT_FALSE(try_parse_day("2023-02-29").has_value());
}

TEST(DueDate, NextDueDate) {
  EXPECT_EQ(*next_due_date(recurring(1, "2024-12-28", 7)), "2025-01-04");
  EXPECT_EQ(*next_due_date(one_time(2, "2024-06-01T09:00:00")), "2024-06-01");
  EXPECT_FALSE(next_due_date(recurring(3, "2024-01-01", 0)).has_value());
}
