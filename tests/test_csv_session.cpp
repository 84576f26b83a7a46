#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <memory>
#include <sstream>

#include <f1ta/controller.hpp>
#include <f1ta/errors.hpp>
#include <f1ta/io/csv_session.hpp>

using Catch::Approx;
using namespace f1ta;
using namespace f1ta::io;

TEST_CASE("session key parses with or without header") {
  std::istringstream with_header("year,circuit,session_type\n2024, Monaco ,Race\n");
  auto k = session_key_from_csv_stream(with_header);
  REQUIRE(k.has_value());
  REQUIRE(k->year == 2024);
  REQUIRE(k->circuit == "Monaco");
  REQUIRE(k->session_type == "Race");

  std::istringstream bare("# exported\n\n2023,Silverstone,Qualifying\n2022,Monza,Race\n");
  auto first = session_key_from_csv_stream(bare);
  REQUIRE(first.has_value());
  REQUIRE(first->circuit == "Silverstone");

  std::istringstream garbage("year,circuit,session_type\nlast,Monaco,Race\n");
  REQUIRE_FALSE(session_key_from_csv_stream(garbage).has_value());
}

TEST_CASE("lap rows keep absent cells absent") {
  std::istringstream in(
    "driver,lap,lap_time,sector1,sector2,sector3,compound,tyre_life,quick,stint,position\n"
    "1,1,90.100,30.1,31.2,28.8,MEDIUM,3,1,1,2\n"
    "1,2,,30.0,,28.5,soft,,0,,\n"
    "# pit stop next\n"
    "16,1,89.9,29.9,31.1,28.9,HARD,1,true,2,1\n");
  auto laps = laps_from_csv_stream(in);
  REQUIRE(laps.size() == 3);

  REQUIRE(laps[0].driver == "1");
  REQUIRE(*laps[0].lap_time == Approx(90.1));
  REQUIRE(laps[0].compound == Compound::Medium);
  REQUIRE(laps[0].tyre_life == 3);
  REQUIRE(laps[0].quick);
  REQUIRE(laps[0].stint == 1);
  REQUIRE(laps[0].position == 2);

  REQUIRE_FALSE(laps[1].lap_time.has_value());
  REQUIRE_FALSE(laps[1].sector2.has_value());
  REQUIRE(laps[1].compound == Compound::Soft);
  REQUIRE_FALSE(laps[1].tyre_life.has_value());
  REQUIRE_FALSE(laps[1].quick);
  REQUIRE_FALSE(laps[1].position.has_value());

  REQUIRE(laps[2].driver == "16");
  REQUIRE(laps[2].compound == Compound::Hard);
}

TEST_CASE("malformed lap rows are dropped") {
  std::istringstream in(
    "1,1,90.1,,,,SOFT,,1\n"
    "1,two,90.1,,,,SOFT,,1\n"      // lap number
    "1,3,fast,,,,SOFT,,1\n"        // lap time
    "1,4,90.1,,,,SOFT,,maybe\n"    // quick flag
    ",5,90.1,,,,SOFT,,1\n"         // driver
    "1,0,90.1,,,,SOFT,,1\n"        // lap numbers start at 1
    "1,7,91.0,,,,WHATEVER,,1\n");  // unknown compound is still a lap
  auto laps = laps_from_csv_stream(in);
  REQUIRE(laps.size() == 2);
  REQUIRE(laps[0].lap_number == 1);
  REQUIRE(laps[1].lap_number == 7);
  REQUIRE(laps[1].compound == Compound::Unknown);
}

TEST_CASE("telemetry rows carry channels and optional position") {
  std::istringstream in(
    "driver,lap,distance,speed,throttle,brake,rpm,gear,x,y\n"
    "1,2,0.0,280.5,100,0,11800,7,10.5,-3.0\n"
    "1,2,5.0,281.0,99.5,false,11850,7,,\n"
    "1,2,10.0,250.0,0,1,-5,6,,\n"    // negative rpm
    "1,2,15.0,240.0,0,1,9000,6,4.0\n");  // x without y
  auto rows = telemetry_from_csv_stream(in);
  REQUIRE(rows.size() == 2);
  REQUIRE(rows[0].driver == "1");
  REQUIRE(rows[0].lap == 2);
  REQUIRE(*rows[0].sample.speed == Approx(280.5));
  REQUIRE(*rows[0].sample.rpm == 11800u);
  REQUIRE(*rows[0].sample.gear == 7);
  REQUIRE(rows[0].sample.pos.has_value());
  REQUIRE(rows[0].sample.pos->y == Approx(-3.0));
  REQUIRE(rows[1].sample.brake == false);
  REQUIRE_FALSE(rows[1].sample.pos.has_value());
}

TEST_CASE("blank telemetry cells are missing channels, not bad rows") {
  std::istringstream in(
    "driver,lap,distance,speed,throttle,brake,rpm,gear,x,y\n"
    "1,1,0,100,100,0,,7\n"
    "1,1,5,101,100,0,,7\n"
    "1,1,10,102,80,0,,7\n"
    "1,1,15\n"               // distance only
    "1,1,,100,100,0,9000,7\n");  // distance is required
  auto rows = telemetry_from_csv_stream(in);
  REQUIRE(rows.size() == 4);
  REQUIRE_FALSE(rows[0].sample.rpm.has_value());
  REQUIRE(*rows[0].sample.throttle == Approx(100.0));
  REQUIRE(rows[3].sample.distance == Approx(15.0));
  REQUIRE_FALSE(rows[3].sample.speed.has_value());
  REQUIRE_FALSE(rows[3].sample.brake.has_value());
  REQUIRE_FALSE(rows[3].sample.gear.has_value());
}

TEST_CASE("a session without rpm still scores throttle and coast") {
  std::istringstream laps("driver,lap,lap_time\n1,1,80.0\n");
  std::istringstream telemetry(
    "driver,lap,distance,speed,throttle,brake,rpm,gear\n"
    "1,1,0,100,100,0,,7\n"
    "1,1,5,101,100,0,,7\n"
    "1,1,10,102,100,0,,7\n"
    "1,1,15,99,60,0,,6\n");
  CsvSession::Tables t;
  t.key = SessionKey{2024, "Monaco", "Race"};
  t.laps = laps_from_csv_stream(laps);
  t.telemetry = telemetry_from_csv_stream(telemetry);
  REQUIRE(t.telemetry.size() == 4);

  AnalysisController c;
  REQUIRE(c.load_session(std::make_shared<CsvSession>(std::move(t))));
  REQUIRE(c.select_driver("1").ok());
  auto a = c.analyze();

  REQUIRE(a.efficiency.ok());
  REQUIRE(*a.efficiency == Approx(75.0));
  REQUIRE(a.coast_pct.ok());
  REQUIRE(*a.coast_pct == Approx(25.0));
  REQUIRE_FALSE(a.traction_pct.ok());
  REQUIRE(a.traction_pct.reason() == Unavailable::MissingData);
  REQUIRE(a.traction_segments.reason() == Unavailable::MissingData);
}

TEST_CASE("corner and driver tables") {
  std::istringstream corners("number,distance\n2,450.0\n1,120.5\nx,10\n3,-1\n");
  auto c = corners_from_csv_stream(corners);
  REQUIRE(c.size() == 2);
  REQUIRE(c[0].number == 2);
  REQUIRE(c[1].distance == Approx(120.5));

  std::istringstream drivers(
    "id,abbreviation,full_name,color\n"
    "1,VER,Max Verstappen,#0600EF\n"
    "44,HAM,Lewis Hamilton,\n"
    "16,LEC,Charles Leclerc,red\n");
  auto d = drivers_from_csv_stream(drivers);
  REQUIRE(d.size() == 2);
  REQUIRE(d[0].color == Rgb{0x06, 0x00, 0xef});
  REQUIRE(d[1].info.full_name == "Lewis Hamilton");
  REQUIRE_FALSE(d[1].color.has_value());
}

static CsvSession::Tables two_lap_tables() {
  CsvSession::Tables t;
  t.key = SessionKey{2024, "Monaco", "Race"};
  t.laps = std::vector<LapRecord>{};
  TelemetryRow a;
  a.driver = "1";
  a.lap = 1;
  a.sample.distance = 0.0;
  TelemetryRow b = a;
  b.sample.distance = 5.0;
  TelemetryRow c = a;
  c.lap = 2;
  c.sample.distance = 5.0;
  TelemetryRow d = c;
  d.sample.distance = 0.0;
  t.telemetry = {a, b, c, d};
  t.drivers = std::vector<DriverRow>{
    DriverRow{DriverInfo{"1", "VER", "Max Verstappen"}, Rgb{0x06, 0x00, 0xef}},
    DriverRow{DriverInfo{"44", "HAM", "Lewis Hamilton"}, std::nullopt},
  };
  return t;
}

TEST_CASE("CsvSession serves per-lap telemetry sorted by distance") {
  auto log = std::make_shared<logging::MemoryLogSink>();
  CsvSession s(two_lap_tables(), log);

  auto lap1 = s.telemetry("1", 1);
  REQUIRE(lap1.has_value());
  REQUIRE(lap1->size() == 2);

  SECTION("an unsorted sequence is rejected") {
    REQUIRE_FALSE(s.telemetry("1", 2).has_value());
    REQUIRE(log->contains("not sorted"));
  }

  SECTION("unknown laps have no telemetry") {
    REQUIRE_FALSE(s.telemetry("1", 9).has_value());
    REQUIRE_FALSE(s.telemetry("44", 1).has_value());
  }

  SECTION("colours and driver details come from the driver table") {
    auto colors = s.driver_colors();
    REQUIRE(colors.has_value());
    REQUIRE(colors->size() == 1);
    REQUIRE(colors->at("1") == Rgb{0x06, 0x00, 0xef});
    REQUIRE(s.drivers()->size() == 2);
  }
}

TEST_CASE("CsvSession without optional tables") {
  CsvSession::Tables t;
  t.key = SessionKey{2024, "Monaco", "Race"};
  t.laps = std::vector<LapRecord>{};
  CsvSession s(std::move(t));
  REQUIRE_FALSE(s.corners().has_value());
  REQUIRE_FALSE(s.driver_colors().has_value());
  REQUIRE_FALSE(s.drivers().has_value());
}

TEST_CASE("load_directory rejects a missing directory") {
  REQUIRE_THROWS_AS(CsvSession::load_directory("/nonexistent/f1ta/session"), errors::InputError);
}
