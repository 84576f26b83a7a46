#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>

#include <f1ta/aggregate.hpp>
#include "fake_session.hpp"

using Catch::Approx;
using namespace f1ta;
using namespace f1ta::testing;

static int fastest_count(const LapTimeEvolution& ev) {
  return static_cast<int>(std::count_if(ev.points.begin(), ev.points.end(),
                                        [](const LapTimePoint& p){ return p.fastest; }));
}

TEST_CASE("lap_time_evolution flags the fastest lap and reports the mean") {
  auto ds = dataset_of({
    timed_lap("1", 1, 90.100),
    timed_lap("1", 2, 88.523),
    timed_lap("1", 3, 91.000),
  });
  auto ev = lap_time_evolution(ds);
  REQUIRE(ev.ok());
  REQUIRE(ev->points.size() == 3);
  REQUIRE(ev->points[1].lap == 2);
  REQUIRE(ev->points[1].fastest);
  REQUIRE(fastest_count(*ev) == 1);
  REQUIRE(ev->mean == Approx((90.100 + 88.523 + 91.000) / 3.0));
  REQUIRE(ev->mean == Approx(89.874).epsilon(1e-4));
}

TEST_CASE("lap_time_evolution orders by lap number and skips untimed laps") {
  auto ds = dataset_of({
    timed_lap("1", 3, 91.0),
    timed_lap("1", 1, 92.0),
    timed_lap("1", 2, std::nullopt),
    timed_lap("1", 4, 90.0, Compound::Soft, /*quick*/ false),
  });
  auto ev = lap_time_evolution(ds);
  REQUIRE(ev.ok());
  REQUIRE(ev->points.size() == 3);
  REQUIRE(ev->points[0].lap == 1);
  REQUIRE(ev->points[1].lap == 3);
  REQUIRE(ev->points[2].lap == 4);
  REQUIRE(ev->points[2].fastest);
  REQUIRE(ev->mean == Approx(91.0));
}

TEST_CASE("lap_time_evolution tie-break: first occurrence wins") {
  auto ds = dataset_of({
    timed_lap("1", 1, 89.0),
    timed_lap("1", 2, 88.5),
    timed_lap("1", 3, 88.5),
  });
  auto ev = lap_time_evolution(ds);
  REQUIRE(ev.ok());
  REQUIRE(fastest_count(*ev) == 1);
  REQUIRE(ev->points[1].fastest);
  REQUIRE_FALSE(ev->points[2].fastest);
}

TEST_CASE("lap_time_evolution is unavailable without timed laps") {
  auto ev = lap_time_evolution(dataset_of({timed_lap("1", 1, std::nullopt)}));
  REQUIRE_FALSE(ev.ok());
  REQUIRE(ev.reason() == Unavailable::MissingData);
}

TEST_CASE("lap_time_evolution is pure") {
  auto ds = dataset_of({timed_lap("1", 1, 90.0), timed_lap("1", 2, 89.0)});
  auto a = lap_time_evolution(ds);
  auto b = lap_time_evolution(ds);
  REQUIRE(a->points.size() == b->points.size());
  for (std::size_t i = 0; i < a->points.size(); ++i) {
    REQUIRE(a->points[i].lap == b->points[i].lap);
    REQUIRE(a->points[i].time == b->points[i].time);
    REQUIRE(a->points[i].fastest == b->points[i].fastest);
  }
  REQUIRE(a->mean == b->mean);
}
