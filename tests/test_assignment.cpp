#include <gtest/gtest.h>

#include "assignment.h"
#include "test_helpers.h"
#include "visit_actions.h"

using namespace vp;
using vp::test::provider;
using vp::test::recurring;

namespace {

std::vector<Provider> team() {
  return {provider(1, "A"), provider(2, "B"), provider(3, "C")};
}

}

TEST(Assignment, PrimaryProvider) {
  auto providers = team();
  Patient p = recurring(1, "2024-01-01", 7);
  p.primary_provider_id = 2;
  const Provider* b = effective_provider(p, providers);
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(b->name, "B");
}

TEST(Assignment, OverrideWinsRegardlessOfPermanence) {
  auto providers = team();
  Patient p = recurring(1, "2024-01-01", 7);
  p.primary_provider_id = 1;
  p.override_provider_id = 3;
  EXPECT_EQ(effective_provider(p, providers)->id, 3);
  p.override_permanent = true;
  EXPECT_EQ(effective_provider(p, providers)->id, 3);
}

TEST(Assignment, DanglingOverrideFallsBackToPrimary) {
  auto providers = team();
  Patient p = recurring(1, "2024-01-01", 7);
  p.primary_provider_id = 1;
  p.override_provider_id = 99;
  EXPECT_EQ(effective_provider(p, providers)->id, 1);
}

TEST(Assignment, UnassignedWhenNothingResolves) {
  auto providers = team();
  Patient p = recurring(1, "2024-01-01", 7);
  EXPECT_EQ(effective_provider(p, providers), nullptr);
  p.primary_provider_id = 42;      // provider deleted
  EXPECT_EQ(effective_provider(p, providers), nullptr);
  EXPECT_EQ(effective_provider(p, std::vector<Provider>{}), nullptr);
}

TEST(Assignment, TemporaryOverrideRevertsAfterCompletedVisit) {
  auto providers = team();
  const ProviderIndex idx = index_providers(providers);

  Patient p = recurring(1, "2024-01-01", 7);
  p.primary_provider_id = 1;
  p = set_override(p, 2, /*permanent=*/false);
  EXPECT_EQ(effective_provider(p, idx)->id, 2);

  const VisitCompletion vc = complete_visit(p, "2024-01-08");
  EXPECT_FALSE(vc.delete_patient);
  EXPECT_EQ(effective_provider(vc.patient, idx)->id, 1);
  EXPECT_FALSE(vc.patient.override_provider_id.has_value());
}

TEST(Assignment, PermanentOverrideBecomesPrimary) {
  auto providers = team();
  Patient p = recurring(1, "2024-01-01", 7);
  p.primary_provider_id = 1;
  p = set_override(p, 3, /*permanent=*/true);

  const VisitCompletion vc = complete_visit(p, "2024-01-08");
  EXPECT_EQ(vc.patient.primary_provider_id, 3);
  EXPECT_FALSE(vc.patient.override_provider_id.has_value());
  EXPECT_FALSE(vc.patient.override_permanent);
  EXPECT_EQ(effective_provider(vc.patient, providers)->id, 3);
}

TEST(Assignment, DuplicateProviderIdFirstRecordWins) {
  std::vector<Provider> providers = {provider(1, "first"), provider(1, "second")};
  Patient p = recurring(1, "2024-01-01", 7);
  p.primary_provider_id = 1;
  EXPECT_EQ(effective_provider(p, providers)->name, "first");
}
