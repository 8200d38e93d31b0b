#include <gtest/gtest.h>

#include "radius_filter.h"
#include "route_sequencer.h"
#include "test_helpers.h"

using namespace vp;
using vp::test::north_of;
using vp::test::recurring;

namespace {

const GeoPoint kHome{49.79245, 9.93296};

Patient at_km(int id, double km) {
  Patient p = recurring(id, "2024-01-01", 7);
  p.coordinates = north_of(kHome, km);
  return p;
}

}

TEST(RadiusFilter, WalkExcludesFourKilometresButCarKeeps) {
  const auto route = sequence_route(kHome, {at_km(1, 4.0)});
  RadiusSettings r;
  r.radius_walk_km = 1.0;

  RadiusSplit walk = filter_by_radius(route, kHome, TransportMode::Walk, r);
  EXPECT_TRUE(walk.kept.empty());
  ASSERT_EQ(walk.relocated.size(), 1u);
  EXPECT_TRUE(walk.relocated[0].relocated);
  EXPECT_EQ(walk.relocated[0].patient.id, 1);

  RadiusSplit car = filter_by_radius(route, kHome, TransportMode::Car, r);
  ASSERT_EQ(car.kept.size(), 1u);
  EXPECT_TRUE(car.relocated.empty());
  EXPECT_FALSE(car.kept[0].relocated);
}

TEST(RadiusFilter, BikeUsesBikeRadius) {
  const auto route = sequence_route(kHome, {at_km(1, 0.5), at_km(2, 3.0), at_km(3, 6.0)});
  RadiusSettings r;
  r.radius_walk_km = 1.0;
  r.radius_bike_km = 5.0;

  RadiusSplit bike = filter_by_radius(route, kHome, TransportMode::Bike, r);
  ASSERT_EQ(bike.kept.size(), 2u);
  EXPECT_EQ(bike.kept[0].patient.id, 1);
  EXPECT_EQ(bike.kept[1].patient.id, 2);
  ASSERT_EQ(bike.relocated.size(), 1u);
  EXPECT_EQ(bike.relocated[0].patient.id, 3);

  RadiusSplit walk = filter_by_radius(route, kHome, TransportMode::Walk, r);
  ASSERT_EQ(walk.kept.size(), 1u);
  EXPECT_EQ(walk.relocated.size(), 2u);
}

TEST(RadiusFilter, KeptEntriesAreReindexed) {
  const auto route = sequence_route(kHome, {at_km(1, 0.2), at_km(2, 2.0), at_km(3, 0.4)});
  RadiusSettings r;
  r.radius_walk_km = 1.0;
  // route order: 1 (0.2), 3 (0.4), 2 (2.0)
  RadiusSplit walk = filter_by_radius(route, kHome, TransportMode::Walk, r);
  ASSERT_EQ(walk.kept.size(), 2u);
  EXPECT_EQ(walk.kept[0].sequence_index, 0);
  EXPECT_EQ(walk.kept[1].sequence_index, 1);
  EXPECT_EQ(walk.kept[1].patient.id, 3);
}

TEST(RadiusFilter, MissingCoordinatesAlwaysKept) {
  Patient lost = recurring(9, "2024-01-01", 7);
  const auto route = sequence_route(kHome, {lost});
  RadiusSettings r;
  r.radius_walk_km = 0.0;

  RadiusSplit walk = filter_by_radius(route, kHome, TransportMode::Walk, r);
  ASSERT_EQ(walk.kept.size(), 1u);
  EXPECT_TRUE(walk.kept[0].no_coordinates);
  EXPECT_TRUE(walk.relocated.empty());
}

TEST(RadiusFilter, LimitIsInclusive) {
  RadiusSettings r;
  r.radius_walk_km = 2.0;
  // slightly inside to stay clear of floating-point noise at the boundary
  const auto route = sequence_route(kHome, {at_km(1, 1.999999)});
  EXPECT_EQ(filter_by_radius(route, kHome, TransportMode::Walk, r).kept.size(), 1u);
  EXPECT_EQ(radius_limit_km(TransportMode::Walk, r), 2.0);
  EXPECT_FALSE(radius_limit_km(TransportMode::Car, r).has_value());
}
