#include "simetry/core/basic_telemetry.hpp"
#include "simetry/core/racing_flags.hpp"
#include "simetry/serde/telemetry_json.hpp"
#include <catch2/catch.hpp>
#include <numbers>

using namespace simetry;

TEST_CASE("BasicTelemetry defaults to zero and false") {
  BasicTelemetry t;
  REQUIRE(t.gear == 0);
  REQUIRE(t.speed.value() == 0.0);
  REQUIRE(t.engine_rotation_speed.value() == 0.0);
  REQUIRE(t.max_engine_rotation_speed.value() == 0.0);
  REQUIRE_FALSE(t.pit_limiter_engaged);
  REQUIRE_FALSE(t.in_pit_lane);
}

TEST_CASE("BasicTelemetry survives a JSON round trip") {
  BasicTelemetry t;
  t.gear = 3;
  t.speed = units::MetersPerSecond(45.0);
  t.engine_rotation_speed = units::RadiansPerSecond(6000.0);
  t.max_engine_rotation_speed = units::RadiansPerSecond(8000.0);

  auto back = serde::BasicTelemetryFromJson(serde::ToJson(t));
  REQUIRE(back.has_value());
  REQUIRE(back->gear == 3);
  REQUIRE(back->speed == t.speed);
  REQUIRE(back->engine_rotation_speed == t.engine_rotation_speed);
  REQUIRE(back->max_engine_rotation_speed == t.max_engine_rotation_speed);
  REQUIRE_FALSE(back->pit_limiter_engaged);
  REQUIRE_FALSE(back->in_pit_lane);
  REQUIRE(*back == t);
}

TEST_CASE("BasicTelemetry JSON keeps reverse gear and flags") {
  BasicTelemetry t;
  t.gear = -1;
  t.speed = units::KilometersPerHour(7.2);
  t.pit_limiter_engaged = true;
  t.in_pit_lane = true;

  auto back = serde::BasicTelemetryFromJson(serde::ToJson(t));
  REQUIRE(back.has_value());
  REQUIRE(*back == t);
}

TEST_CASE("BasicTelemetry JSON rejects incomplete documents") {
  REQUIRE_FALSE(serde::BasicTelemetryFromJson("{\"gear\": 2}").has_value());
  REQUIRE_FALSE(serde::BasicTelemetryFromJson("not json").has_value());
  REQUIRE_FALSE(serde::BasicTelemetryFromJson(
                    "{\"gear\": 300, \"speed\": 1, \"engine_rotation_speed\": 1,"
                    " \"max_engine_rotation_speed\": 1}")
                    .has_value());
}

TEST_CASE("BasicTelemetry equality compares every field") {
  BasicTelemetry a;
  BasicTelemetry b;
  REQUIRE(a == b);
  b.in_pit_lane = true;
  REQUIRE_FALSE(a == b);
}

TEST_CASE("Unit helpers convert common sim units") {
  REQUIRE(units::Rpm(60.0).value() == Approx(2.0 * std::numbers::pi));
  REQUIRE(units::ToRpm(units::Rpm(6500.0)) == Approx(6500.0));
  REQUIRE(units::KilometersPerHour(36.0).value() == Approx(10.0));
  REQUIRE(units::ToKilometersPerHour(units::MetersPerSecond(10.0)) ==
          Approx(36.0));
}

TEST_CASE("RacingFlags JSON reads missing flags as cleared") {
  auto tree = serde::ParseJson("{\"yellow\": true, \"checkered\": true}");
  REQUIRE(tree.has_value());
  auto flags = serde::RacingFlagsFromPtree(*tree);
  REQUIRE(flags.yellow);
  REQUIRE(flags.checkered);
  REQUIRE_FALSE(flags.green);
  REQUIRE(flags.Any());
  REQUIRE(serde::RacingFlagsFromPtree(serde::ToPtree(flags)) == flags);
}

TEST_CASE("JSON null reads as a missing field") {
  auto tree = serde::ParseJson(R"({"a": null, "b": {"c": null}, "d": "x"})");
  REQUIRE(tree.has_value());
  REQUIRE(serde::Child(*tree, "a") == nullptr);
  REQUIRE(serde::Child(*tree, "missing") == nullptr);
  REQUIRE(serde::Child(*tree, "b") != nullptr);
  REQUIRE_FALSE(serde::Get<std::string>(*tree, "a").has_value());
  REQUIRE_FALSE(serde::Get<std::string>(*tree, "b.c").has_value());
  REQUIRE(serde::Get<std::string>(*tree, "d") == std::optional<std::string>("x"));
  REQUIRE(serde::GetOr(*tree, "a", true));
}

TEST_CASE("WriteJson quotes numbers and readers accept both forms") {
  BasicTelemetry t;
  t.gear = 3;
  REQUIRE(serde::ToJson(t).find("\"gear\":\"3\"") != std::string::npos);
  auto bare = serde::BasicTelemetryFromJson(
      R"({"gear": 3, "speed": 0, "engine_rotation_speed": 0,
          "max_engine_rotation_speed": 0, "in_pit_lane": true})");
  REQUIRE(bare.has_value());
  REQUIRE(bare->gear == 3);
  REQUIRE(bare->in_pit_lane);
}
