#pragma once

#include "simetry/serde/telemetry_json.hpp"
#include "simetry/sims/http_poller.hpp"
#include <algorithm>
#include <cmath>
#include <memory>
#include <optional>
#include <string>

// Euro Truck Simulator 2 / American Truck Simulator, read through the
// ets2-telemetry-server JSON API. The server keeps answering while the game
// is closed; "game.connected" tells whether the game is running.
namespace simetry::sims::truck_simulator {

inline constexpr const char *kDefaultUri =
    "http://localhost:25555/api/ets2/telemetry";

class TruckSimulatorMoment : public Moment {
public:
  std::optional<BasicTelemetry> GetBasicTelemetry() const override {
    return telemetry;
  }
  std::optional<std::string> VehicleUniqueId() const override {
    return vehicle_id;
  }
  bool IgnitionOn() const override { return electric_on; }

  BasicTelemetry telemetry;
  std::optional<std::string> vehicle_id;
  bool electric_on = true;
};

struct Document {
  bool connected = false;
  std::string game_name;
  std::unique_ptr<TruckSimulatorMoment> moment;
};

inline std::string DisplayName(const std::string &game_name) {
  if (game_name == "ETS2") {
    return "Euro Truck Simulator 2";
  }
  if (game_name == "ATS") {
    return "American Truck Simulator";
  }
  return game_name.empty() ? "Truck Simulator" : game_name;
}

inline std::expected<Document, std::string> ParseDocument(const std::string &body) {
  auto tree = serde::ParseJson(body);
  if (!tree) {
    return std::unexpected(tree.error());
  }
  const auto *game = serde::Child(*tree, "game");
  const auto *truck = serde::Child(*tree, "truck");
  if (game == nullptr || truck == nullptr) {
    return std::unexpected(std::string("missing game or truck section"));
  }
  Document doc;
  doc.connected = serde::GetOr(*game, "connected", false);
  doc.game_name = serde::GetOr(*game, "gameName", std::string());

  auto m = std::make_unique<TruckSimulatorMoment>();
  // speed is negative while reversing; gear carries the direction
  m->telemetry.speed =
      units::KilometersPerHour(std::abs(serde::GetOr(*truck, "speed", 0.0)));
  const int gear = serde::Get<int>(*truck, "displayedGear")
                       .value_or(serde::GetOr(*truck, "gear", 0));
  m->telemetry.gear = static_cast<std::int8_t>(std::clamp(gear, -127, 127));
  m->telemetry.engine_rotation_speed =
      units::Rpm(serde::GetOr(*truck, "engineRpm", 0.0));
  m->telemetry.max_engine_rotation_speed =
      units::Rpm(serde::GetOr(*truck, "engineRpmMax", 0.0));
  m->electric_on = serde::GetOr(*truck, "electricOn", true);

  auto id = serde::GetOr(*truck, "id", std::string());
  if (id.empty()) {
    auto make = serde::GetOr(*truck, "make", std::string());
    auto model = serde::GetOr(*truck, "model", std::string());
    if (!make.empty() || !model.empty()) {
      id = make + "/" + model;
    }
  }
  if (!id.empty()) {
    m->vehicle_id = id;
  }
  doc.moment = std::move(m);
  return doc;
}

class TruckSimulatorClient : public HttpPollingClient {
public:
  TruckSimulatorClient(net::io_context &ioc, std::unique_ptr<HttpPoller> poller,
                       std::string name)
      : HttpPollingClient(ioc, std::move(poller), std::move(name),
                          "truck_simulator") {}

protected:
  DecodeResult Decode(const std::string &body) const override {
    auto doc = ParseDocument(body);
    if (!doc) {
      return std::unexpected(doc.error());
    }
    if (!doc->connected) {
      return std::unique_ptr<Moment>();
    }
    return std::unique_ptr<Moment>(std::move(doc->moment));
  }
};

class TruckSimulatorConnector : public HttpConnector {
public:
  TruckSimulatorConnector(net::io_context &ioc, const std::string &uri,
                          retry::Delay retry_delay)
      : HttpConnector(ioc, "truck_simulator", uri, retry_delay) {}

protected:
  ConnectResult MakeClient(std::unique_ptr<HttpPoller> poller,
                           const std::string &body) override {
    auto doc = ParseDocument(body);
    if (!doc) {
      logging::Warn(Name(), "bad document: ", doc.error());
      return std::unexpected(
          boost::system::errc::make_error_code(boost::system::errc::bad_message));
    }
    if (!doc->connected) {
      // server is up, game is not
      return std::unexpected(net::error::make_error_code(net::error::not_connected));
    }
    return std::make_unique<TruckSimulatorClient>(ioc_, std::move(poller),
                                                  DisplayName(doc->game_name));
  }
};

} // namespace simetry::sims::truck_simulator
