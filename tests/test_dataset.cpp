#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <f1ta/dataset.hpp>
#include <f1ta/session_context.hpp>
#include "fake_session.hpp"

using Catch::Approx;
using namespace f1ta;
using namespace f1ta::testing;

static FakeSession session_with_laps() {
  FakeSession s;
  auto out_lap = timed_lap("16", 1, 101.2, Compound::Soft, false);
  s.laps_ = std::vector<LapRecord>{
    out_lap,
    timed_lap("16", 2, 88.9, Compound::Soft),
    timed_lap("55", 1, 88.1, Compound::Medium),
    timed_lap("16", 3, 88.4, Compound::Soft),
    timed_lap("16", 4, std::nullopt, Compound::Soft, false),
  };
  s.telemetry_[{"16", 3}] = throttle_trace({100, 100, 80});
  return s;
}

TEST_CASE("fastest_lap_index picks the minimum present lap time") {
  std::vector<LapRecord> laps{
    timed_lap("1", 1, 90.0),
    timed_lap("1", 2, std::nullopt),
    timed_lap("1", 3, 89.0),
  };
  auto idx = fastest_lap_index(laps);
  REQUIRE(idx.has_value());
  REQUIRE(*idx == 2);

  SECTION("ties keep the first occurrence in table order") {
    laps.push_back(timed_lap("1", 4, 89.0));
    REQUIRE(*fastest_lap_index(laps) == 2);

    std::vector<LapRecord> reordered{laps[3], laps[2]};
    REQUIRE(*fastest_lap_index(reordered) == 0);
    REQUIRE(reordered[*fastest_lap_index(reordered)].lap_number == 4);
  }

  SECTION("no timed lap") {
    std::vector<LapRecord> untimed{timed_lap("1", 1, std::nullopt)};
    REQUIRE_FALSE(fastest_lap_index(untimed).has_value());
    REQUIRE_FALSE(fastest_lap_index({}).has_value());
  }
}

TEST_CASE("assemble_driver_dataset consolidates one driver") {
  auto s = session_with_laps();
  auto ctx = build_session_context(s);
  REQUIRE(ctx.ok());

  auto ds = assemble_driver_dataset(s, "16", *ctx, 0, AnalyticsConfig{});
  REQUIRE(ds.has_value());

  REQUIRE(ds->driver.id == "16");
  REQUIRE(ds->laps.size() == 4);
  REQUIRE(ds->context == *ctx);

  SECTION("fastest lap and its telemetry") {
    REQUIRE(ds->fastest.has_value());
    REQUIRE(ds->fastest->lap_number == 3);
    REQUIRE(ds->fastest->lap_time.value() == Approx(88.4));
    REQUIRE(ds->fastest_telemetry.has_value());
    REQUIRE(ds->fastest_telemetry->size() == 3);
  }

  SECTION("quick laps are the provider's flag, untouched") {
    REQUIRE(ds->quick_laps.size() == 2);
    REQUIRE(ds->quick_laps[0].lap_number == 2);
    REQUIRE(ds->quick_laps[1].lap_number == 3);
  }

  SECTION("telemetry is fetched for the fastest lap only") {
    REQUIRE(s.telemetry_fetches == 1);
  }

  SECTION("fallback colour uses the selection index") {
    auto other = assemble_driver_dataset(s, "16", *ctx, 3, AnalyticsConfig{});
    REQUIRE(other->color == default_fallback_palette()[3]);
  }
}

TEST_CASE("assemble_driver_dataset edge cases") {
  auto s = session_with_laps();
  auto ctx = build_session_context(s);
  REQUIRE(ctx.ok());

  SECTION("driver without laps yields nullopt") {
    REQUIRE_FALSE(assemble_driver_dataset(s, "99", *ctx, 0, AnalyticsConfig{}).has_value());
  }

  SECTION("missing telemetry is an absent field, not an error") {
    auto ds = assemble_driver_dataset(s, "55", *ctx, 0, AnalyticsConfig{});
    REQUIRE(ds.has_value());
    REQUIRE(ds->fastest.has_value());
    REQUIRE_FALSE(ds->fastest_telemetry.has_value());
  }

  SECTION("no timed lap: no fastest lap and no fetch") {
    s.laps_ = std::vector<LapRecord>{timed_lap("7", 1, std::nullopt)};
    auto ds = assemble_driver_dataset(s, "7", *ctx, 0, AnalyticsConfig{});
    REQUIRE(ds.has_value());
    REQUIRE_FALSE(ds->fastest.has_value());
    REQUIRE_FALSE(ds->fastest_telemetry.has_value());
    REQUIRE(s.telemetry_fetches == 0);
  }

  SECTION("lap table failure yields nullopt") {
    s.laps_.reset();
    REQUIRE_FALSE(assemble_driver_dataset(s, "16", *ctx, 0, AnalyticsConfig{}).has_value());
  }

  SECTION("null context yields nullopt") {
    REQUIRE_FALSE(assemble_driver_dataset(s, "16", nullptr, 0, AnalyticsConfig{}).has_value());
  }
}
