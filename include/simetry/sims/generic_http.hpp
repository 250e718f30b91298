#pragma once

#include "simetry/serde/telemetry_json.hpp"
#include "simetry/sims/http_poller.hpp"
#include <memory>
#include <optional>
#include <string>

// Generic HTTP backend: any program can feed telemetry by serving a JSON
// document describing the current moment, e.g.
//
//   {"name": "My Sim", "vehicle_left": false, "vehicle_right": true,
//    "basic_telemetry": {"gear": 3, "speed": 12.5,
//                        "engine_rotation_speed": 628.3,
//                        "max_engine_rotation_speed": 837.7,
//                        "pit_limiter_engaged": false, "in_pit_lane": false},
//    "shift_point": 800.0, "flags": {"yellow": true},
//    "vehicle_unique_id": "my-car", "ignition_on": true, "starter_on": false}
//
// Units are SI (m/s, rad/s). Numbers and booleans may also be sent quoted.
// Every field is optional; a missing or null field falls back to the Moment
// defaults.
namespace simetry::sims::generic_http {

inline constexpr const char *kDefaultUri = "http://localhost:25055/";
inline constexpr const char *kDefaultName = "Generic HTTP";

class GenericHttpMoment : public Moment {
public:
  bool VehicleLeft() const override { return vehicle_left; }
  bool VehicleRight() const override { return vehicle_right; }
  std::optional<BasicTelemetry> GetBasicTelemetry() const override {
    return basic_telemetry;
  }
  std::optional<AngularVelocity> ShiftPoint() const override {
    return shift_point;
  }
  RacingFlags Flags() const override { return flags; }
  std::optional<std::string> VehicleUniqueId() const override {
    return vehicle_unique_id;
  }
  bool IgnitionOn() const override { return ignition_on; }
  bool StarterOn() const override { return starter_on; }

  std::string name = kDefaultName;
  bool vehicle_left = false;
  bool vehicle_right = false;
  std::optional<BasicTelemetry> basic_telemetry;
  std::optional<AngularVelocity> shift_point;
  RacingFlags flags;
  std::optional<std::string> vehicle_unique_id;
  bool ignition_on = true;
  bool starter_on = false;
};

inline std::expected<std::unique_ptr<GenericHttpMoment>, std::string>
ParseMoment(const std::string &body) {
  auto tree = serde::ParseJson(body);
  if (!tree) {
    return std::unexpected(tree.error());
  }
  auto m = std::make_unique<GenericHttpMoment>();
  m->name = serde::GetOr(*tree, "name", std::string(kDefaultName));
  m->vehicle_left = serde::GetOr(*tree, "vehicle_left", false);
  m->vehicle_right = serde::GetOr(*tree, "vehicle_right", false);
  if (const auto *bt = serde::Child(*tree, "basic_telemetry")) {
    auto t = serde::BasicTelemetryFromPtree(*bt);
    if (!t) {
      return std::unexpected("basic_telemetry: " + t.error());
    }
    m->basic_telemetry = *t;
  }
  if (auto sp = serde::Get<double>(*tree, "shift_point")) {
    m->shift_point = units::RadiansPerSecond(*sp);
  }
  if (const auto *flags = serde::Child(*tree, "flags")) {
    m->flags = serde::RacingFlagsFromPtree(*flags);
  }
  m->vehicle_unique_id = serde::Get<std::string>(*tree, "vehicle_unique_id");
  m->ignition_on = serde::GetOr(*tree, "ignition_on", true);
  m->starter_on = serde::GetOr(*tree, "starter_on", false);
  return m;
}

class GenericHttpClient : public HttpPollingClient {
public:
  GenericHttpClient(net::io_context &ioc, std::unique_ptr<HttpPoller> poller,
                    std::string name)
      : HttpPollingClient(ioc, std::move(poller), std::move(name),
                          "generic_http") {}

protected:
  DecodeResult Decode(const std::string &body) const override {
    auto m = ParseMoment(body);
    if (!m) {
      return std::unexpected(m.error());
    }
    return std::unique_ptr<Moment>(std::move(*m));
  }
};

class GenericHttpConnector : public HttpConnector {
public:
  GenericHttpConnector(net::io_context &ioc, const std::string &uri,
                       retry::Delay retry_delay)
      : HttpConnector(ioc, "generic_http", uri, retry_delay) {}

protected:
  ConnectResult MakeClient(std::unique_ptr<HttpPoller> poller,
                           const std::string &body) override {
    auto first = ParseMoment(body);
    if (!first) {
      logging::Warn(Name(), "bad document: ", first.error());
      return std::unexpected(
          boost::system::errc::make_error_code(boost::system::errc::bad_message));
    }
    return std::make_unique<GenericHttpClient>(ioc_, std::move(poller),
                                               (*first)->name);
  }
};

} // namespace simetry::sims::generic_http
