#include <gtest/gtest.h>

#include "route_sequencer.h"
#include "test_helpers.h"
#include "travel_time.h"

using namespace vp;
using vp::test::north_of;
using vp::test::recurring;

namespace {

const GeoPoint kHome{49.79245, 9.93296};

// one minute per straight-line kilometre, no buffer
TravelModel minute_per_km() {
  TravelModel m;
  m.speed_kmh = 60.0;
  m.detour_factor = 1.0;
  m.hop_buffer_minutes = 0;
  return m;
}

}

TEST(TravelTime, DefaultHopFormula) {
  const TravelModel m;   // 30 km/h, detour 1.3, +5
  EXPECT_EQ(hop_minutes(0.0, m), 5);
  EXPECT_EQ(hop_minutes(10.0, m), 26 + 5);   // 13 km road at 30 km/h
  EXPECT_EQ(hop_minutes(1.0, m), 3 + 5);     // 2.6 min rounds to 3
}

TEST(TravelTime, FullLoopIncludesReturnHome) {
  const std::vector<GeoPoint> loop = {kHome, north_of(kHome, 2.0), north_of(kHome, 5.0), kHome};
  EXPECT_EQ(estimate_minutes(loop, minute_per_km()), 2 + 3 + 5);
}

TEST(TravelTime, SpeedAppliedUniformly) {
  TravelModel slow = minute_per_km();
  slow.speed_kmh = 15.0;   // 4 min per km
  const std::vector<GeoPoint> loop = {kHome, north_of(kHome, 3.0), kHome};
  EXPECT_EQ(estimate_minutes(loop, slow), 12 + 12);
}

TEST(TravelTime, BufferChargedPerHop) {
  TravelModel m = minute_per_km();
  m.hop_buffer_minutes = 5;
  const std::vector<GeoPoint> loop = {kHome, north_of(kHome, 1.0), north_of(kHome, 2.0), kHome};
  EXPECT_EQ(estimate_minutes(loop, m), (1 + 1 + 2) + 3 * 5);
}

TEST(TravelTime, DegenerateLoops) {
  EXPECT_EQ(estimate_minutes({}, TravelModel{}), 0);
  EXPECT_EQ(estimate_minutes({kHome}, TravelModel{}), 0);
}

TEST(TravelTime, NonPositiveSpeedThrows) {
  TravelModel m;
  m.speed_kmh = 0.0;
  EXPECT_THROW(hop_minutes(1.0, m), std::runtime_error);
}

TEST(TravelTime, RouteLoopSkipsPatientsWithoutCoordinates) {
  Patient a = recurring(1, "2024-01-01", 7);
  a.coordinates = north_of(kHome, 4.0);
  Patient lost = recurring(2, "2024-01-01", 7);

  const auto route = sequence_route(kHome, {lost, a});
  const auto loop = route_loop(kHome, route);
  ASSERT_EQ(loop.size(), 3u);
  EXPECT_EQ(route_travel_minutes(kHome, route, minute_per_km()), 8);

  // nobody locatable -> no travel at all
  EXPECT_TRUE(route_loop(kHome, sequence_route(kHome, {lost})).empty());
  EXPECT_EQ(route_travel_minutes(kHome, {}, TravelModel{}), 0);
}
