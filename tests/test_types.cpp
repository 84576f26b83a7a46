#include <catch2/catch_test_macros.hpp>
#include <f1ta/types.hpp>

using namespace f1ta;

TEST_CASE("compound_from_string is case-insensitive") {
  REQUIRE(compound_from_string("SOFT") == Compound::Soft);
  REQUIRE(compound_from_string("medium") == Compound::Medium);
  REQUIRE(compound_from_string("Hard") == Compound::Hard);
  REQUIRE(compound_from_string("intermediate") == Compound::Intermediate);
  REQUIRE(compound_from_string("WET") == Compound::Wet);

  SECTION("unrecognised names map to Unknown") {
    REQUIRE(compound_from_string("") == Compound::Unknown);
    REQUIRE(compound_from_string("HYPERSOFT") == Compound::Unknown);
    REQUIRE_FALSE(compound_known(compound_from_string("TEST_UNKNOWN")));
  }
}

TEST_CASE("compound_name round-trips every known compound") {
  for (int k = 0; k < kCompoundCount; ++k) {
    const auto c = static_cast<Compound>(k);
    REQUIRE(compound_from_string(compound_name(c)) == c);
  }
}

TEST_CASE("rgb_from_hex") {
  SECTION("accepts with and without '#'") {
    auto a = rgb_from_hex("#FF8700");
    auto b = rgb_from_hex("ff8700");
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(*a == *b);
    REQUIRE(a->r == 0xFF);
    REQUIRE(a->g == 0x87);
    REQUIRE(a->b == 0x00);
    REQUIRE(rgb_to_hex(*a) == "#ff8700");
  }

  SECTION("rejects malformed input") {
    REQUIRE_FALSE(rgb_from_hex("#FF87").has_value());
    REQUIRE_FALSE(rgb_from_hex("#GG8700").has_value());
    REQUIRE_FALSE(rgb_from_hex("").has_value());
  }
}

TEST_CASE("telemetry_sorted accepts equal distances and rejects drops") {
  Telemetry t(3);
  t[0].distance = 0.0;
  t[1].distance = 5.0;
  t[2].distance = 5.0;
  REQUIRE(telemetry_sorted(t));
  t[2].distance = 4.9;
  REQUIRE_FALSE(telemetry_sorted(t));
  REQUIRE(telemetry_sorted(Telemetry{}));
}

TEST_CASE("labels") {
  REQUIRE(session_label(SessionKey{2024, "Monaco", "Race"}) == "2024 Monaco Race");
  REQUIRE(driver_label(DriverInfo{"1", "VER", "Max Verstappen"}) == "VER - Max Verstappen");
}

TEST_CASE("has_channel requires the channel on every sample") {
  Telemetry t(2);
  t[0].throttle = 100.0;
  t[1].throttle = 98.0;
  t[0].rpm = 11000u;
  REQUIRE(has_channel(t, Channel::Throttle));
  REQUIRE_FALSE(has_channel(t, Channel::Rpm));
  REQUIRE_FALSE(has_channel(t, Channel::Speed));
  REQUIRE(has_channel(Telemetry{}, Channel::Brake));
}
